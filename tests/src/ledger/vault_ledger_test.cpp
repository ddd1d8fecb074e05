#include <strongbox/ledger/vault_ledger.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>
#include <strongbox/testing/common.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <string>

using namespace strongbox::schema;
using strongbox::ledger::vault_ledger;

namespace {

class ledger_harness final {
 public:
  explicit ledger_harness(const std::string& prefix)
      : db_path_{strongbox::testing::make_db_path(prefix)},
        storage_{strongbox::storage::make_storage<
            strongbox::storage::rocksdb_storage_tag>(db_path_)} {}

  ledger_harness(const ledger_harness&) = delete;
  ledger_harness& operator=(const ledger_harness&) = delete;

  ~ledger_harness() {
    storage_.database.reset();
    strongbox::testing::remove_path(db_path_);
  }

  strongbox::ledger::storage_t& storage() { return storage_; }

 private:
  std::string db_path_;
  strongbox::ledger::storage_t storage_;
};

}  // namespace

TEST(vault_ledger, unknown_entries_read_as_zero) {
  auto harness = ledger_harness{"strongbox_ledger_empty"};
  auto ledger = vault_ledger{harness.storage()};
  const auto user = strongbox::testing::make_address(1);
  EXPECT_EQ(ledger.balance_of(user, asset_id_t::native), amount_t{0});
  EXPECT_EQ(ledger.totals().total_deposits, amount_t{0});
  EXPECT_EQ(ledger.totals().deposit_count, 0u);
  EXPECT_EQ(ledger.open_positions(), 0u);
}

TEST(vault_ledger, committed_checkpoint_updates_balances_and_totals) {
  auto harness = ledger_harness{"strongbox_ledger_commit"};
  auto ledger = vault_ledger{harness.storage()};
  const auto alice = strongbox::testing::make_address(1);
  const auto bob = strongbox::testing::make_address(2);
  {
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ledger.record_deposit(alice, asset_id_t::native, amount_t{100},
                          amount_t{200});
    ledger.record_deposit(alice, asset_id_t::stable, amount_t{50},
                          amount_t{50});
    ledger.record_deposit(bob, asset_id_t::native, amount_t{7}, amount_t{14});
    checkpoint.commit();
  }
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::native), amount_t{100});
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::stable), amount_t{50});
  EXPECT_EQ(ledger.holdings(asset_id_t::native), amount_t{107});
  EXPECT_EQ(ledger.holdings(asset_id_t::stable), amount_t{50});
  EXPECT_EQ(ledger.totals().total_deposits, amount_t{264});
  EXPECT_EQ(ledger.totals().deposit_count, 3u);
  EXPECT_EQ(ledger.open_positions(), 3u);
}

TEST(vault_ledger, uncommitted_checkpoint_restores_everything) {
  auto harness = ledger_harness{"strongbox_ledger_rollback"};
  auto ledger = vault_ledger{harness.storage()};
  const auto alice = strongbox::testing::make_address(1);
  {
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ledger.record_deposit(alice, asset_id_t::native, amount_t{100},
                          amount_t{200});
    checkpoint.commit();
  }
  {
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ASSERT_TRUE(
        ledger.record_withdrawal(alice, asset_id_t::native, amount_t{40}));
    ledger.record_deposit(alice, asset_id_t::stable, amount_t{9},
                          amount_t{9});
    EXPECT_EQ(ledger.balance_of(alice, asset_id_t::native), amount_t{60});
  }
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::native), amount_t{100});
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::stable), amount_t{0});
  EXPECT_EQ(ledger.totals().total_deposits, amount_t{200});
  EXPECT_EQ(ledger.totals().deposit_count, 1u);
  EXPECT_EQ(ledger.totals().withdrawal_count, 0u);
  EXPECT_EQ(ledger.open_positions(), 1u);
}

TEST(vault_ledger, withdrawal_beyond_balance_is_refused) {
  auto harness = ledger_harness{"strongbox_ledger_refuse"};
  auto ledger = vault_ledger{harness.storage()};
  const auto alice = strongbox::testing::make_address(1);
  auto checkpoint = vault_ledger::checkpoint{ledger};
  ledger.record_deposit(alice, asset_id_t::stable, amount_t{500},
                        amount_t{500});
  EXPECT_FALSE(
      ledger.record_withdrawal(alice, asset_id_t::stable, amount_t{600}));
  EXPECT_FALSE(
      ledger.record_withdrawal(alice, asset_id_t::native, amount_t{1}));
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::stable), amount_t{500});
  EXPECT_EQ(ledger.totals().withdrawal_count, 0u);

  EXPECT_TRUE(
      ledger.record_withdrawal(alice, asset_id_t::stable, amount_t{500}));
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::stable), amount_t{0});
  EXPECT_EQ(ledger.totals().withdrawal_count, 1u);
  checkpoint.commit();
}

TEST(vault_ledger, deposit_overflowing_256_bits_is_refused) {
  auto harness = ledger_harness{"strongbox_ledger_overflow"};
  auto ledger = vault_ledger{harness.storage()};
  const auto alice = strongbox::testing::make_address(1);
  const auto max = std::numeric_limits<amount_t>::max();
  auto checkpoint = vault_ledger::checkpoint{ledger};
  ASSERT_TRUE(
      ledger.record_deposit(alice, asset_id_t::native, max - 1, amount_t{3}));

  EXPECT_FALSE(
      ledger.record_deposit(alice, asset_id_t::native, amount_t{2},
                            amount_t{0}));
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::native), max - 1);
  EXPECT_EQ(ledger.totals().deposit_count, 1u);

  EXPECT_FALSE(
      ledger.record_deposit(alice, asset_id_t::stable, amount_t{1}, max));
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::stable), amount_t{0});
  EXPECT_EQ(ledger.totals().total_deposits, amount_t{3});

  EXPECT_TRUE(
      ledger.record_deposit(alice, asset_id_t::native, amount_t{1},
                            amount_t{0}));
  EXPECT_EQ(ledger.balance_of(alice, asset_id_t::native), max);
  checkpoint.commit();
}

TEST(vault_ledger, state_survives_reload) {
  auto harness = ledger_harness{"strongbox_ledger_reload"};
  const auto alice = strongbox::testing::make_address(1);
  const auto bob = strongbox::testing::make_address(2);
  {
    auto ledger = vault_ledger{harness.storage()};
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ledger.record_deposit(alice, asset_id_t::native, amount_t{100},
                          amount_t{200});
    ledger.record_deposit(bob, asset_id_t::stable, amount_t{30},
                          amount_t{30});
    ASSERT_TRUE(
        ledger.record_withdrawal(alice, asset_id_t::native, amount_t{25}));
    checkpoint.commit();
  }
  {
    // Rolled back work never reaches storage.
    auto ledger = vault_ledger{harness.storage()};
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ledger.record_deposit(bob, asset_id_t::stable, amount_t{1'000},
                          amount_t{1'000});
  }

  auto reloaded = vault_ledger{harness.storage()};
  EXPECT_EQ(reloaded.balance_of(alice, asset_id_t::native), amount_t{75});
  EXPECT_EQ(reloaded.balance_of(bob, asset_id_t::stable), amount_t{30});
  EXPECT_EQ(reloaded.totals().total_deposits, amount_t{230});
  EXPECT_EQ(reloaded.totals().deposit_count, 2u);
  EXPECT_EQ(reloaded.totals().withdrawal_count, 1u);
}

TEST(vault_ledger, commit_carries_extra_rows) {
  auto harness = ledger_harness{"strongbox_ledger_extra"};
  auto ledger = vault_ledger{harness.storage()};
  auto encoder = strongbox::ledger::encoder_t{};
  const auto extra_key = key::make_event_key(1);
  {
    auto checkpoint = vault_ledger::checkpoint{ledger};
    ledger.record_deposit(strongbox::testing::make_address(1),
                          asset_id_t::native, amount_t{1}, amount_t{1});
    checkpoint.commit({{extra_key, encoder.encode(uint64_t{42})}});
  }
  auto stored = harness.storage().get<uint64_t>(
      encoder, bytes_view_t{extra_key.data(), extra_key.size()});
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(*stored, 42u);
}
