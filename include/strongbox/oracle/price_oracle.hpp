#pragma once

#include <strongbox/oracle/price_feed.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/primitives.hpp>

#include <cstdint>
#include <functional>
#include <optional>

namespace strongbox::oracle {

inline constexpr uint64_t kDefaultHeartbeatSeconds = 3600;

/// Wall clock used for staleness checks, in seconds.
using time_source_t = std::function<strongbox::schema::timestamp_seconds_t()>;

/// Decimal precision of the three units involved in a conversion.
struct oracle_settings_t final {
  uint32_t native_decimals{18};
  uint32_t feed_decimals{8};
  uint32_t stable_decimals{6};
  uint64_t heartbeat_seconds{kDefaultHeartbeatSeconds};
};

/// Adapter over the price feed deployed at the current oracle reference.
///
/// Every call re-reads the feed; nothing is cached between calls. Failures
/// are reported through `failure` with `oracle_compromised`, `oracle_stale`
/// or `arithmetic_overflow`.
class price_oracle final {
 public:
  price_oracle(const feed_registry& feeds,
               oracle_settings_t settings,
               time_source_t now);

  /// Latest validated answer of the feed at `reference`.
  std::optional<strongbox::schema::price_t> current_price(
      const strongbox::schema::address_t& reference,
      strongbox::schema::failure_t& failure) const;

  /// `amount * price / scaling_factor`, rounded toward zero.
  std::optional<strongbox::schema::amount_t> convert_native_to_stable(
      const strongbox::schema::address_t& reference,
      const strongbox::schema::amount_t& amount,
      strongbox::schema::failure_t& failure) const;

  /// `amount * scaling_factor / price`, rounded toward zero.
  std::optional<strongbox::schema::amount_t> convert_stable_to_native(
      const strongbox::schema::address_t& reference,
      const strongbox::schema::amount_t& amount,
      strongbox::schema::failure_t& failure) const;

  /// `10^(native_decimals + feed_decimals - stable_decimals)`.
  const strongbox::schema::amount_t& scaling_factor() const;

  const oracle_settings_t& settings() const;

 private:
  const feed_registry& feeds_;
  oracle_settings_t settings_;
  time_source_t now_;
  strongbox::schema::amount_t scaling_factor_;
};

}  // namespace strongbox::oracle
