#include <strongbox/oracle/price_feed.hpp>
#include <strongbox/oracle/price_oracle.hpp>
#include <strongbox/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <memory>

using namespace strongbox::schema;
using strongbox::testing::kNativeUnit;
using strongbox::testing::kStableUnit;

namespace {

constexpr timestamp_seconds_t kNow = 1'700'000'000;

class oracle_harness final {
 public:
  oracle_harness()
      : reference_{strongbox::testing::make_address(0xD0)},
        feed_{std::make_shared<strongbox::oracle::fixed_price_feed>(
            price_t{2000} * 100'000'000, kNow)},
        oracle_{feeds_, strongbox::oracle::oracle_settings_t{},
                [this] { return now_; }} {
    feeds_.register_feed(reference_, feed_);
  }

  const address_t& reference() const { return reference_; }
  strongbox::oracle::fixed_price_feed& feed() { return *feed_; }
  strongbox::oracle::price_oracle& oracle() { return oracle_; }
  void set_now(const timestamp_seconds_t now) { now_ = now; }

 private:
  address_t reference_;
  timestamp_seconds_t now_{kNow};
  strongbox::oracle::feed_registry feeds_;
  std::shared_ptr<strongbox::oracle::fixed_price_feed> feed_;
  strongbox::oracle::price_oracle oracle_;
};

}  // namespace

TEST(price_oracle, scaling_factor_follows_decimals) {
  auto harness = oracle_harness{};
  EXPECT_EQ(harness.oracle().scaling_factor(), strongbox::schema::pow10(20));
}

TEST(price_oracle, converts_one_native_unit_at_2000) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};
  auto converted = harness.oracle().convert_native_to_stable(
      harness.reference(), kNativeUnit, failure);
  ASSERT_TRUE(converted.has_value());
  EXPECT_EQ(*converted, 2000 * kStableUnit);
}

TEST(price_oracle, conversion_rounds_toward_zero) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};
  // 1 wei at 2000 is 2e-15 stable units.
  auto dust = harness.oracle().convert_native_to_stable(harness.reference(),
                                                        amount_t{1}, failure);
  ASSERT_TRUE(dust.has_value());
  EXPECT_EQ(*dust, amount_t{0});

  // 1.5e-9 native at 2000 is 3 stable smallest units exactly; one wei less
  // truncates to 2.
  auto below = harness.oracle().convert_native_to_stable(
      harness.reference(), amount_t{1'500'000'000} - 1, failure);
  ASSERT_TRUE(below.has_value());
  EXPECT_EQ(*below, amount_t{2});
}

TEST(price_oracle, stable_to_native_inverts_with_floor) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};
  auto native = harness.oracle().convert_stable_to_native(
      harness.reference(), 2000 * kStableUnit, failure);
  ASSERT_TRUE(native.has_value());
  EXPECT_EQ(*native, kNativeUnit);

  harness.feed().publish(price_t{3} * 100'000'000, kNow);
  auto third = harness.oracle().convert_stable_to_native(
      harness.reference(), amount_t{1}, failure);
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(*third, amount_t{333'333'333'333});
}

TEST(price_oracle, non_positive_prices_are_compromised) {
  auto harness = oracle_harness{};
  for (const auto answer : {price_t{0}, price_t{-1}}) {
    harness.feed().publish(answer, kNow);
    auto failure = failure_t{};
    EXPECT_FALSE(
        harness.oracle().current_price(harness.reference(), failure)
            .has_value());
    EXPECT_EQ(failure.code, error_code::oracle_compromised);
  }
}

TEST(price_oracle, incomplete_and_future_rounds_are_compromised) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};

  harness.feed().publish(price_t{2000}, 0);
  EXPECT_FALSE(
      harness.oracle().current_price(harness.reference(), failure).has_value());
  EXPECT_EQ(failure.code, error_code::oracle_compromised);

  failure = failure_t{};
  harness.feed().publish(price_t{2000}, kNow + 1);
  EXPECT_FALSE(
      harness.oracle().current_price(harness.reference(), failure).has_value());
  EXPECT_EQ(failure.code, error_code::oracle_compromised);
}

TEST(price_oracle, missing_feed_is_compromised) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};
  const auto elsewhere = strongbox::testing::make_address(0x11);
  EXPECT_FALSE(harness.oracle().current_price(elsewhere, failure).has_value());
  EXPECT_EQ(failure.code, error_code::oracle_compromised);
  ASSERT_TRUE(failure.account.has_value());
  EXPECT_EQ(*failure.account, elsewhere);
}

TEST(price_oracle, heartbeat_boundary_is_inclusive) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};

  harness.set_now(kNow + strongbox::oracle::kDefaultHeartbeatSeconds);
  EXPECT_TRUE(
      harness.oracle().current_price(harness.reference(), failure).has_value());

  harness.set_now(kNow + strongbox::oracle::kDefaultHeartbeatSeconds + 1);
  EXPECT_FALSE(
      harness.oracle().current_price(harness.reference(), failure).has_value());
  EXPECT_EQ(failure.code, error_code::oracle_stale);
  ASSERT_TRUE(failure.limit.has_value());
  EXPECT_EQ(*failure.limit,
            amount_t{strongbox::oracle::kDefaultHeartbeatSeconds});
}

TEST(price_oracle, every_read_sees_the_latest_round) {
  auto harness = oracle_harness{};
  auto failure = failure_t{};
  auto first = harness.oracle().convert_native_to_stable(harness.reference(),
                                                         kNativeUnit, failure);
  harness.feed().publish(price_t{1000} * 100'000'000, kNow);
  auto second = harness.oracle().convert_native_to_stable(harness.reference(),
                                                          kNativeUnit, failure);
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(*first, 2000 * kStableUnit);
  EXPECT_EQ(*second, 1000 * kStableUnit);
}

TEST(price_oracle, oversized_results_overflow) {
  auto harness = oracle_harness{};
  harness.feed().publish(std::numeric_limits<price_t>::max(), kNow);
  auto failure = failure_t{};
  auto converted = harness.oracle().convert_native_to_stable(
      harness.reference(), std::numeric_limits<amount_t>::max(), failure);
  EXPECT_FALSE(converted.has_value());
  EXPECT_EQ(failure.code, error_code::arithmetic_overflow);
}
