#include <strongbox/settlement/memory.hpp>
#include <strongbox/settlement/settlement.hpp>
#include <strongbox/testing/common.hpp>
#include <gtest/gtest.h>

using namespace strongbox::schema;
using strongbox::settlement::memory_native_channel;
using strongbox::settlement::memory_stable_token;

namespace {

const auto kVault = strongbox::testing::make_address(0xB0);
const auto kAlice = strongbox::testing::make_address(0x01);
const auto kBob = strongbox::testing::make_address(0x02);

}  // namespace

TEST(memory_native_channel, moves_value_through_the_vault) {
  auto channel = memory_native_channel{kVault};
  channel.mint(kAlice, amount_t{100});

  EXPECT_TRUE(channel.receive(kAlice, amount_t{60}));
  EXPECT_EQ(channel.balance_of(kAlice), amount_t{40});
  EXPECT_EQ(channel.vault_balance(), amount_t{60});

  EXPECT_FALSE(channel.receive(kAlice, amount_t{41}));
  EXPECT_EQ(channel.balance_of(kAlice), amount_t{40});

  EXPECT_TRUE(channel.send(kBob, amount_t{10}));
  EXPECT_EQ(channel.balance_of(kBob), amount_t{10});
  EXPECT_EQ(channel.vault_balance(), amount_t{50});

  EXPECT_FALSE(channel.send(kBob, amount_t{51}));
  EXPECT_EQ(channel.vault_balance(), amount_t{50});
}

TEST(memory_native_channel, rejecting_recipient_reverts_the_payment) {
  auto channel = memory_native_channel{kVault};
  channel.mint(kVault, amount_t{100});

  auto calls = 0;
  channel.set_recipient_hook(kBob, [&](const address_t& recipient,
                                       const amount_t& amount) {
    ++calls;
    EXPECT_EQ(recipient, kBob);
    EXPECT_EQ(amount, amount_t{30});
    return false;
  });
  EXPECT_FALSE(channel.send(kBob, amount_t{30}));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(channel.balance_of(kBob), amount_t{0});
  EXPECT_EQ(channel.vault_balance(), amount_t{100});

  channel.clear_recipient_hook(kBob);
  EXPECT_TRUE(channel.send(kBob, amount_t{30}));
  EXPECT_EQ(calls, 1);
  EXPECT_EQ(channel.balance_of(kBob), amount_t{30});
}

TEST(memory_native_channel, recipient_sees_the_payment_before_it_lands) {
  auto channel = memory_native_channel{kVault};
  channel.mint(kVault, amount_t{100});
  channel.mint(kBob, amount_t{20});

  channel.set_recipient_hook(kBob, [&](const address_t&, const amount_t&) {
    EXPECT_EQ(channel.balance_of(kBob), amount_t{20});
    EXPECT_EQ(channel.vault_balance(), amount_t{100});
    EXPECT_TRUE(channel.receive(kBob, amount_t{15}));
    return false;
  });
  EXPECT_FALSE(channel.send(kBob, amount_t{30}));
  EXPECT_EQ(channel.balance_of(kBob), amount_t{5});
  EXPECT_EQ(channel.vault_balance(), amount_t{115});
}

TEST(memory_native_channel, payment_fails_whole_when_the_vault_is_drained) {
  auto channel = memory_native_channel{kVault};
  channel.mint(kVault, amount_t{100});

  channel.set_recipient_hook(kBob, [&](const address_t&, const amount_t&) {
    EXPECT_TRUE(channel.send(kAlice, amount_t{80}));
    return true;
  });
  EXPECT_FALSE(channel.send(kBob, amount_t{30}));
  EXPECT_EQ(channel.balance_of(kBob), amount_t{0});
  EXPECT_EQ(channel.balance_of(kAlice), amount_t{80});
  EXPECT_EQ(channel.vault_balance(), amount_t{20});
}

TEST(memory_native_channel, accepting_recipient_keeps_the_payment) {
  auto channel = memory_native_channel{kVault};
  channel.mint(kVault, amount_t{100});
  channel.set_recipient_hook(
      kBob, [](const address_t&, const amount_t&) { return true; });
  EXPECT_TRUE(channel.send(kBob, amount_t{30}));
  EXPECT_EQ(channel.balance_of(kBob), amount_t{30});
  EXPECT_EQ(channel.vault_balance(), amount_t{70});
}

TEST(memory_stable_token, transfer_from_needs_an_allowance) {
  auto token = memory_stable_token{kVault};
  token.mint(kAlice, amount_t{500});

  EXPECT_FALSE(token.transfer_from(kAlice, kVault, amount_t{100}));
  token.approve(kAlice, amount_t{150});
  EXPECT_TRUE(token.transfer_from(kAlice, kVault, amount_t{100}));
  EXPECT_EQ(token.allowance(kAlice), amount_t{50});
  EXPECT_EQ(token.balance_of(kAlice), amount_t{400});
  EXPECT_EQ(token.balance_of(kVault), amount_t{100});

  EXPECT_FALSE(token.transfer_from(kAlice, kVault, amount_t{51}));
  EXPECT_EQ(token.allowance(kAlice), amount_t{50});
}

TEST(memory_stable_token, transfer_spends_the_holder_balance) {
  auto token = memory_stable_token{kVault};
  token.mint(kVault, amount_t{20});
  EXPECT_TRUE(token.transfer(kBob, amount_t{15}));
  EXPECT_FALSE(token.transfer(kBob, amount_t{6}));
  EXPECT_EQ(token.balance_of(kBob), amount_t{15});
  EXPECT_EQ(token.balance_of(kVault), amount_t{5});
}

TEST(memory_stable_token, frozen_accounts_cannot_move_tokens) {
  auto token = memory_stable_token{kVault};
  token.mint(kVault, amount_t{20});
  token.freeze(kBob, true);
  EXPECT_FALSE(token.transfer(kBob, amount_t{1}));
  token.freeze(kBob, false);
  EXPECT_TRUE(token.transfer(kBob, amount_t{1}));
}

TEST(settlement, routes_assets_to_their_channel) {
  auto native = memory_native_channel{kVault};
  auto stable = memory_stable_token{kVault};
  auto shim = strongbox::settlement::settlement{native, stable, kVault};
  native.mint(kAlice, amount_t{10});
  stable.mint(kAlice, amount_t{20});
  stable.approve(kAlice, amount_t{20});

  EXPECT_FALSE(shim.pull(asset_id_t::native, kAlice, amount_t{10}).has_value());
  EXPECT_FALSE(shim.pull(asset_id_t::stable, kAlice, amount_t{20}).has_value());
  EXPECT_EQ(shim.on_hand(asset_id_t::native), amount_t{10});
  EXPECT_EQ(shim.on_hand(asset_id_t::stable), amount_t{20});

  EXPECT_FALSE(shim.push(asset_id_t::native, kBob, amount_t{4}).has_value());
  EXPECT_FALSE(shim.push(asset_id_t::stable, kBob, amount_t{5}).has_value());
  EXPECT_EQ(native.balance_of(kBob), amount_t{4});
  EXPECT_EQ(stable.balance_of(kBob), amount_t{5});
  EXPECT_EQ(shim.vault(), kVault);
}

TEST(settlement, refused_transfers_are_settlement_failures) {
  auto native = memory_native_channel{kVault};
  auto stable = memory_stable_token{kVault};
  auto shim = strongbox::settlement::settlement{native, stable, kVault};

  auto failure = shim.pull(asset_id_t::native, kAlice, amount_t{1});
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->code, error_code::settlement_failed);
  EXPECT_EQ(failure->account, kAlice);
  EXPECT_EQ(failure->amount, amount_t{1});

  failure = shim.push(asset_id_t::stable, kBob, amount_t{1});
  ASSERT_TRUE(failure.has_value());
  EXPECT_EQ(failure->code, error_code::settlement_failed);
  EXPECT_EQ(failure->account, kBob);
}
