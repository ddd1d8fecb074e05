#include <strongbox/common/critical.hpp>
#include <strongbox/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <limits>
#include <string_view>

namespace strongbox::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string_view make_string_view(const bytes_t& bytes) {
  return std::string_view{reinterpret_cast<const char*>(bytes.data()),
                          bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  for (const auto byte : bytes) {
    out.push_back(kHex[(byte >> 4u) & 0x0Fu]);
    out.push_back(kHex[byte & 0x0Fu]);
  }
  return out;
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

std::optional<address_t> try_make_address(std::string_view hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded || decoded->size() != address_t{}.size()) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::copy(std::begin(*decoded), std::end(*decoded), std::begin(address));
  return address;
}

address_t make_address(std::string_view hex) {
  auto address = try_make_address(hex);
  if (!address) {
    strongbox::common::critical("make_address expected 20 hex-encoded bytes");
  }
  return *address;
}

address_t make_zero_address() {
  return address_t{};
}

bool is_zero(const address_t& address) {
  return std::all_of(std::begin(address), std::end(address),
                     [](const uint8_t byte) { return byte == 0; });
}

std::string to_string(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

hash32_t make_zero_hash() {
  return hash32_t{};
}

amount_bytes_t to_amount_bytes(const amount_t& amount) {
  auto packed = bytes_t{};
  boost::multiprecision::export_bits(amount, std::back_inserter(packed), 8,
                                     false);
  auto out = amount_bytes_t{};
  std::copy_n(std::begin(packed), std::min(packed.size(), out.size()),
              std::begin(out));
  return out;
}

amount_t from_amount_bytes(const amount_bytes_t& bytes) {
  auto amount = amount_t{};
  boost::multiprecision::import_bits(amount, std::begin(bytes),
                                     std::end(bytes), 8, false);
  return amount;
}

std::optional<amount_t> try_parse_amount(std::string_view text) {
  if (text.empty() || text.size() > 78) {
    return std::nullopt;
  }
  auto value = wide_amount_t{};
  for (const auto c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<unsigned>(c - '0');
  }
  if (value > wide_amount_t{std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

std::string to_string(const amount_t& amount) {
  return amount.str();
}

amount_t pow10(const uint32_t exponent) {
  auto value = amount_t{1};
  for (uint32_t i = 0; i < exponent; ++i) {
    value *= 10;
  }
  return value;
}

}  // namespace strongbox::schema
