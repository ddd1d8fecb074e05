#pragma once
#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/schema/encoding/encoder.hpp>
#include <scale/scale.hpp>
#include <string>
#include <utility>

namespace strongbox::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  strongbox::schema::bytes_t encode(const T& row);

  template <typename T>
  T decode(const strongbox::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const strongbox::schema::bytes_view_t& bytes);
};

template <typename T>
strongbox::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& row) {
  auto encoded = ::scale::impl::memory::encode(row);
  if (!encoded) {
    strongbox::common::critical("failed to SCALE-encode a ledger row");
  }
  return encoded.value();
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const strongbox::schema::bytes_view_t& bytes) {
  auto decoded = try_decode<T>(bytes);
  if (!decoded) {
    strongbox::common::critical("persisted ledger row of " +
                                std::to_string(bytes.size()) +
                                " byte(s) is not valid SCALE");
  }
  return *decoded;
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const strongbox::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    spdlog::debug("SCALE decode rejected {} byte(s)", bytes.size());
    return std::nullopt;
  }
  return std::move(decoded.value());
}

}  // namespace strongbox::schema::encoding
