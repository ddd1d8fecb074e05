#pragma once

#include <strongbox/schema/enum_string.hpp>

#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset identifier.
// Ledger key discriminator: exactly two assets are ever accepted, the
// chain-native volatile asset (zero-address sentinel) and the stable token.
namespace strongbox::schema {

enum class asset_id_t : uint8_t {
  native = 0,
  stable = 1,
};

inline constexpr auto kAssetIdNames = enum_names_t<asset_id_t, 2>{
    std::pair<std::string_view, asset_id_t>{"native", asset_id_t::native},
    std::pair<std::string_view, asset_id_t>{"stable", asset_id_t::stable},
};

inline constexpr auto kAssetIds =
    std::array{asset_id_t::native, asset_id_t::stable};

inline std::optional<asset_id_t> try_parse_asset_id(
    const std::string_view value) {
  return enum_from_name(value, kAssetIdNames);
}

inline std::optional<asset_id_t> try_make_asset_id(const uint8_t tag) {
  switch (tag) {
    case static_cast<uint8_t>(asset_id_t::native):
      return asset_id_t::native;
    case static_cast<uint8_t>(asset_id_t::stable):
      return asset_id_t::stable;
    default:
      return std::nullopt;
  }
}

inline constexpr std::string_view to_string(const asset_id_t value) {
  return enum_name(value, kAssetIdNames).value_or("unknown");
}

}  // namespace strongbox::schema
