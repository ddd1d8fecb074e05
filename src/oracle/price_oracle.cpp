#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/oracle/price_oracle.hpp>

#include <limits>
#include <string>
#include <utility>

using namespace strongbox::schema;

namespace strongbox::oracle {

namespace {

std::optional<amount_t> narrow(const wide_amount_t& value) {
  if (value > wide_amount_t{std::numeric_limits<amount_t>::max()}) {
    return std::nullopt;
  }
  return static_cast<amount_t>(value);
}

failure_t overflow_failure(const amount_t& amount) {
  return failure_t{.code = error_code::arithmetic_overflow,
                   .message = "price conversion does not fit 256 bits",
                   .amount = amount};
}

}  // namespace

price_oracle::price_oracle(const feed_registry& feeds,
                           oracle_settings_t settings,
                           time_source_t now)
    : feeds_{feeds}, settings_{settings}, now_{std::move(now)} {
  if (settings_.stable_decimals >
      settings_.native_decimals + settings_.feed_decimals) {
    strongbox::common::critical(
        "stable decimals exceed native plus feed decimals");
  }
  if (!now_) {
    strongbox::common::critical("price oracle requires a time source");
  }
  scaling_factor_ =
      strongbox::schema::pow10(settings_.native_decimals +
                               settings_.feed_decimals -
                               settings_.stable_decimals);
}

std::optional<price_t> price_oracle::current_price(const address_t& reference,
                                                   failure_t& failure) const {
  auto feed = feeds_.find(reference);
  if (!feed) {
    failure = failure_t{
        .code = error_code::oracle_compromised,
        .message = "no price feed deployed at oracle reference",
        .account = reference};
    return std::nullopt;
  }

  const auto round = feed->latest_round_data();
  if (round.answer <= 0) {
    failure = failure_t{.code = error_code::oracle_compromised,
                        .message = "oracle reported a non-positive price",
                        .account = reference};
    return std::nullopt;
  }
  if (round.updated_at == 0) {
    failure = failure_t{.code = error_code::oracle_compromised,
                        .message = "oracle round was never completed",
                        .account = reference};
    return std::nullopt;
  }

  const auto now = now_();
  if (round.updated_at > now) {
    failure = failure_t{.code = error_code::oracle_compromised,
                        .message = "oracle update time lies in the future",
                        .account = reference};
    return std::nullopt;
  }
  const auto age = now - round.updated_at;
  if (age > settings_.heartbeat_seconds) {
    failure = failure_t{
        .code = error_code::oracle_stale,
        .message = "oracle price is " + std::to_string(age) +
                   "s old, heartbeat is " +
                   std::to_string(settings_.heartbeat_seconds) + "s",
        .amount = amount_t{age},
        .limit = amount_t{settings_.heartbeat_seconds},
        .account = reference};
    return std::nullopt;
  }
  return round.answer;
}

std::optional<amount_t> price_oracle::convert_native_to_stable(
    const address_t& reference,
    const amount_t& amount,
    failure_t& failure) const {
  auto price = current_price(reference, failure);
  if (!price) {
    return std::nullopt;
  }
  const auto product =
      wide_amount_t{amount} * wide_amount_t{static_cast<amount_t>(*price)};
  auto converted = narrow(product / wide_amount_t{scaling_factor_});
  if (!converted) {
    failure = overflow_failure(amount);
    return std::nullopt;
  }
  spdlog::debug("Converted {} native to {} stable at price {}",
                amount.str(), converted->str(), price->str());
  return converted;
}

std::optional<amount_t> price_oracle::convert_stable_to_native(
    const address_t& reference,
    const amount_t& amount,
    failure_t& failure) const {
  auto price = current_price(reference, failure);
  if (!price) {
    return std::nullopt;
  }
  const auto product = wide_amount_t{amount} * wide_amount_t{scaling_factor_};
  auto converted =
      narrow(product / wide_amount_t{static_cast<amount_t>(*price)});
  if (!converted) {
    failure = overflow_failure(amount);
    return std::nullopt;
  }
  return converted;
}

const amount_t& price_oracle::scaling_factor() const {
  return scaling_factor_;
}

const oracle_settings_t& price_oracle::settings() const {
  return settings_;
}

}  // namespace strongbox::oracle
