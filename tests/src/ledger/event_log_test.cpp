#include <strongbox/blake3/hash.hpp>
#include <strongbox/ledger/event_log.hpp>
#include <strongbox/schema/encoding/scale/rows.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>
#include <strongbox/testing/common.hpp>
#include <gtest/gtest.h>

#include <string>
#include <variant>

using namespace strongbox::schema;
using strongbox::ledger::event_log;

namespace {

class log_harness final {
 public:
  explicit log_harness(const std::string& prefix)
      : db_path_{strongbox::testing::make_db_path(prefix)},
        storage_{strongbox::storage::make_storage<
            strongbox::storage::rocksdb_storage_tag>(db_path_)} {}

  log_harness(const log_harness&) = delete;
  log_harness& operator=(const log_harness&) = delete;

  ~log_harness() {
    storage_.database.reset();
    strongbox::testing::remove_path(db_path_);
  }

  strongbox::ledger::storage_t& storage() { return storage_; }

  // Stage, persist and accept in one step, the way a committed operation
  // does.
  event_record_t append(event_log& log,
                        const ledger_event_t& event,
                        const timestamp_seconds_t now) {
    auto staged = log.stage(event, now);
    storage_.write_batch(staged.rows);
    log.accept(staged.record);
    return staged.record;
  }

 private:
  std::string db_path_;
  strongbox::ledger::storage_t storage_;
};

deposit_recorded_t make_deposit(const uint8_t seed, const amount_t& amount) {
  return deposit_recorded_t{.user = strongbox::testing::make_address(seed),
                            .asset = asset_id_t::native,
                            .amount = amount};
}

}  // namespace

TEST(event_log, starts_empty) {
  auto harness = log_harness{"strongbox_events_empty"};
  auto log = event_log{harness.storage()};
  EXPECT_EQ(log.last_id(), 0u);
  EXPECT_EQ(log.head(), make_zero_hash());
  EXPECT_TRUE(log.range(1, 100).empty());
  EXPECT_TRUE(log.verify());
}

TEST(event_log, staging_does_not_advance_the_head) {
  auto harness = log_harness{"strongbox_events_staged"};
  auto log = event_log{harness.storage()};
  auto staged = log.stage(make_deposit(1, amount_t{5}), 10);
  EXPECT_EQ(staged.record.event_id, 1u);
  EXPECT_EQ(staged.rows.size(), 2u);
  EXPECT_EQ(log.last_id(), 0u);

  // A staged record that is never persisted is simply dropped.
  auto again = log.stage(make_deposit(2, amount_t{6}), 11);
  EXPECT_EQ(again.record.event_id, 1u);
}

TEST(event_log, records_chain_over_previous_hash) {
  auto harness = log_harness{"strongbox_events_chain"};
  auto log = event_log{harness.storage()};
  auto first = harness.append(log, make_deposit(1, amount_t{5}), 10);
  auto second = harness.append(
      log, bank_capital_ceiling_changed_t{.value = amount_t{99}}, 11);

  auto encoder = strongbox::ledger::encoder_t{};
  const auto first_payload =
      encoder.encode(encoding::scale::to_payload_row(first));
  EXPECT_EQ(first.chain_hash,
            strongbox::blake3::chain(
                make_zero_hash(),
                bytes_view_t{first_payload.data(), first_payload.size()}));
  const auto second_payload =
      encoder.encode(encoding::scale::to_payload_row(second));
  EXPECT_EQ(second.chain_hash,
            strongbox::blake3::chain(
                first.chain_hash,
                bytes_view_t{second_payload.data(), second_payload.size()}));
  EXPECT_EQ(log.head(), second.chain_hash);
  EXPECT_EQ(log.last_id(), 2u);
}

TEST(event_log, range_reads_back_every_event_kind) {
  auto harness = log_harness{"strongbox_events_range"};
  auto log = event_log{harness.storage()};
  const auto reference = strongbox::testing::make_address(0x44);
  harness.append(log, make_deposit(1, amount_t{5}), 10);
  harness.append(log,
                 withdrawal_recorded_t{.user = strongbox::testing::make_address(1),
                                       .asset = asset_id_t::stable,
                                       .amount = amount_t{3}},
                 11);
  harness.append(log, oracle_reference_changed_t{.reference = reference}, 12);
  harness.append(log, global_deposit_ceiling_changed_t{.value = amount_t{8}},
                 13);

  auto all = log.range(1, 10);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].event_id, 1u);
  EXPECT_EQ(all[0].recorded_at, 10u);
  ASSERT_TRUE(std::holds_alternative<deposit_recorded_t>(all[0].event));
  EXPECT_EQ(std::get<deposit_recorded_t>(all[0].event).amount, amount_t{5});

  ASSERT_TRUE(std::holds_alternative<withdrawal_recorded_t>(all[1].event));
  EXPECT_EQ(std::get<withdrawal_recorded_t>(all[1].event).asset,
            asset_id_t::stable);

  ASSERT_TRUE(
      std::holds_alternative<oracle_reference_changed_t>(all[2].event));
  EXPECT_EQ(std::get<oracle_reference_changed_t>(all[2].event).reference,
            reference);

  ASSERT_TRUE(
      std::holds_alternative<global_deposit_ceiling_changed_t>(all[3].event));
  EXPECT_EQ(std::get<global_deposit_ceiling_changed_t>(all[3].event).value,
            amount_t{8});

  auto middle = log.range(2, 3);
  ASSERT_EQ(middle.size(), 2u);
  EXPECT_EQ(middle[0].event_id, 2u);
  EXPECT_EQ(middle[1].event_id, 3u);
  EXPECT_TRUE(log.range(5, 9).empty());
}

TEST(event_log, head_survives_reload) {
  auto harness = log_harness{"strongbox_events_reload"};
  auto head = hash32_t{};
  {
    auto log = event_log{harness.storage()};
    harness.append(log, make_deposit(1, amount_t{5}), 10);
    head = harness.append(log, make_deposit(2, amount_t{6}), 11).chain_hash;
  }
  auto log = event_log{harness.storage()};
  EXPECT_EQ(log.last_id(), 2u);
  EXPECT_EQ(log.head(), head);
  EXPECT_TRUE(log.verify());

  auto third = harness.append(log, make_deposit(3, amount_t{7}), 12);
  EXPECT_EQ(third.event_id, 3u);
}

TEST(event_log, tampering_breaks_verification) {
  auto harness = log_harness{"strongbox_events_tamper"};
  auto log = event_log{harness.storage()};
  auto first = harness.append(log, make_deposit(1, amount_t{5}), 10);
  harness.append(log, make_deposit(2, amount_t{6}), 11);
  ASSERT_TRUE(log.verify());

  auto forged = first;
  forged.event = make_deposit(1, amount_t{5'000});
  auto encoder = strongbox::ledger::encoder_t{};
  const auto event_key = key::make_event_key(1);
  harness.storage().put(encoder,
                        bytes_view_t{event_key.data(), event_key.size()},
                        encoding::scale::to_row(forged));
  EXPECT_FALSE(log.verify());
}
