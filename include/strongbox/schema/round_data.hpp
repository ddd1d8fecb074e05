#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: price feed round.
// Oracle boundary: the tuple returned by an aggregator's latest round query.
// Only `answer` and `updated_at` are consumed by the ledger.
namespace strongbox::schema {

struct round_data_t final {
  uint64_t round_id{};
  price_t answer{};
  timestamp_seconds_t started_at{};
  timestamp_seconds_t updated_at{};
  uint64_t answered_in_round{};
};

}  // namespace strongbox::schema
