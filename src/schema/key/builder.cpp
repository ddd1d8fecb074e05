#include <boost/endian/conversion.hpp>
#include <algorithm>
#include <iterator>
#include <ranges>
#include <strongbox/schema/key/builder.hpp>

using namespace strongbox::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const strongbox::schema::address_t& address) {
  return write(std::span(address.data(), address.size()));
}

builder& builder::write(const strongbox::schema::asset_id_t& asset) {
  data.push_back(static_cast<uint8_t>(asset));
  return *this;
}

builder& builder::write_ordered(const uint64_t value) {
  const auto big = boost::endian::native_to_big(value);
  const auto* raw = reinterpret_cast<const uint8_t*>(&big);
  std::ranges::copy_n(raw, sizeof(big), std::back_inserter(data));
  return *this;
}
