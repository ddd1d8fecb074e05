#pragma once
#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace strongbox::schema::key {

struct builder final {
  strongbox::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const address_t& address);
  builder& write(const asset_id_t& asset);

  /// Big-endian so that numeric keys iterate in order.
  builder& write_ordered(uint64_t value);
};

}  // namespace strongbox::schema::key
