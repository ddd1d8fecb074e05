#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strongbox::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using amount_t = boost::multiprecision::uint256_t;
using wide_amount_t = boost::multiprecision::uint512_t;
using price_t = boost::multiprecision::int256_t;
using amount_bytes_t = std::array<uint8_t, 32>;
using timestamp_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);

/// Parse a 20-byte address written as 40 hex digits, `0x` prefix optional.
std::optional<address_t> try_make_address(std::string_view hex);
address_t make_address(std::string_view hex);
address_t make_zero_address();
bool is_zero(const address_t& address);
std::string to_string(const address_t& address);

hash32_t make_zero_hash();

/// Fixed-width little-endian image of a 256-bit amount, used as the storage
/// representation of every amount column.
amount_bytes_t to_amount_bytes(const amount_t& amount);
amount_t from_amount_bytes(const amount_bytes_t& bytes);

/// Parse an unsigned base-10 amount. Rejects signs, blanks, and values that
/// do not fit 256 bits.
std::optional<amount_t> try_parse_amount(std::string_view text);
std::string to_string(const amount_t& amount);

/// `10^exponent` as a 256-bit amount.
amount_t pow10(uint32_t exponent);

}  // namespace strongbox::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
