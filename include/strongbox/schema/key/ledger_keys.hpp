#pragma once

#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema key type: ledger keys.
// Canonical key prefixes and key codecs for balances, aggregates, policy,
// administrative state and the audit log.
namespace strongbox::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kTotalsKey{"SYS|STATE|TOTALS"};
inline constexpr std::string_view kPolicyKey{"SYS|STATE|POLICY"};
inline constexpr std::string_view kAdminKey{"SYS|STATE|ADMIN"};
inline constexpr std::string_view kEventHeadKey{"SYS|STATE|EVENT_HEAD"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline const std::array<std::string_view, 7> kLedgerKeyspaces{
    kStatePrefix, kBalanceKeyPrefix, kTotalsKey,   kPolicyKey,
    kAdminKey,    kEventHeadKey,     kEventPrefix};

/// `SYS|STATE|BALANCE|` + address + asset tag.
strongbox::schema::bytes_t make_balance_key(
    const strongbox::schema::address_t& user,
    strongbox::schema::asset_id_t asset);

/// Inverse of `make_balance_key`; std::nullopt for foreign or malformed keys.
std::optional<std::pair<strongbox::schema::address_t,
                        strongbox::schema::asset_id_t>>
parse_balance_key(const strongbox::schema::bytes_view_t& key);

/// `SYS|EVENT|` + big-endian event id.
strongbox::schema::bytes_t make_event_key(uint64_t event_id);

strongbox::schema::bytes_t make_key(std::string_view fixed_key);

}  // namespace strongbox::schema::key
