#pragma once

#include <strongbox/schema/encoding/scale/encoder.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

namespace strongbox::ledger {

using storage_t =
    strongbox::storage::storage<strongbox::storage::rocksdb_storage_tag>;
using encoder_t = strongbox::schema::encoding::encoder<
    strongbox::schema::encoding::scale_encoder_tag>;

}  // namespace strongbox::ledger
