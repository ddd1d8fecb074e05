#pragma once
#include <strongbox/schema/primitives.hpp>
#include <optional>

namespace strongbox::schema::encoding {

// Codec for persisted ledger rows, selected through the tag type. The ledger,
// event log and administrator only ever talk to `encoder<Library>`.
template <typename Library>
struct encoder {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& row);

  /// Decoding a row the ledger wrote itself; failure is corruption.
  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

}  // namespace strongbox::schema::encoding
