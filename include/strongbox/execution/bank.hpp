#pragma once

#include <strongbox/admin/administrator.hpp>
#include <strongbox/common/reentrancy_guard.hpp>
#include <strongbox/config/bank_config.hpp>
#include <strongbox/ledger/backend.hpp>
#include <strongbox/ledger/event_log.hpp>
#include <strongbox/ledger/vault_ledger.hpp>
#include <strongbox/oracle/price_feed.hpp>
#include <strongbox/oracle/price_oracle.hpp>
#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/event_record.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/operation_result.hpp>
#include <strongbox/schema/policy_parameters.hpp>
#include <strongbox/schema/primitives.hpp>
#include <strongbox/settlement/asset_channel.hpp>
#include <strongbox/settlement/settlement.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace strongbox::execution {

inline constexpr std::string_view kDepositCodespace{"strongbox.deposit"};
inline constexpr std::string_view kWithdrawCodespace{"strongbox.withdraw"};
inline constexpr std::string_view kAdminCodespace{"strongbox.admin"};

/// Custodial two-asset bank.
///
/// Every mutating call runs the same pipeline under the instance mutex and
/// the re-entrancy guard: admission checks (consulting the oracle for native
/// amounts), ledger mutation inside a checkpoint, settlement, then one atomic
/// storage batch holding the touched rows and the audit event. A failure at
/// any step leaves balances, counters and the audit log as they were.
///
/// The mutex is recursive so a settlement callback on the same thread reaches
/// the re-entrancy guard and is refused instead of deadlocking. Once a nested
/// call has been refused the outer call fails with `reentrant_call` as well,
/// and a transfer that already went through is reversed.
class bank final {
 public:
  /// Persisted administrative state takes precedence over `config` when the
  /// storage already holds one.
  bank(strongbox::ledger::storage_t& storage,
       const strongbox::config::bank_config_t& config,
       const strongbox::oracle::feed_registry& feeds,
       strongbox::settlement::native_channel& native,
       strongbox::settlement::stable_token& stable,
       strongbox::oracle::time_source_t now);

  bank(const bank&) = delete;
  bank& operator=(const bank&) = delete;

  strongbox::schema::operation_result_t deposit(
      const strongbox::schema::address_t& caller,
      strongbox::schema::asset_id_t asset,
      const strongbox::schema::amount_t& amount);
  strongbox::schema::operation_result_t deposit_native(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);
  strongbox::schema::operation_result_t deposit_stable(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::operation_result_t withdraw(
      const strongbox::schema::address_t& caller,
      strongbox::schema::asset_id_t asset,
      const strongbox::schema::amount_t& amount);
  strongbox::schema::operation_result_t withdraw_native(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);
  strongbox::schema::operation_result_t withdraw_stable(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& amount);

  strongbox::schema::operation_result_t set_oracle_reference(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& reference);
  strongbox::schema::operation_result_t set_bank_capital_ceiling(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& value);
  strongbox::schema::operation_result_t set_global_deposit_ceiling(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& value);

  strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& user,
      strongbox::schema::asset_id_t asset) const;
  strongbox::schema::ledger_totals_t totals() const;
  /// Sum of all ledger balances of `asset`.
  strongbox::schema::amount_t holdings(
      strongbox::schema::asset_id_t asset) const;
  strongbox::schema::policy_parameters_t parameters() const;
  strongbox::schema::address_t oracle_reference() const;
  strongbox::schema::address_t administrator() const;
  const strongbox::schema::address_t& vault() const;

  /// Live native holdings at the live price plus live stable holdings, in
  /// stable units. Unlike `totals().total_deposits` this moves with the price.
  std::optional<strongbox::schema::amount_t> total_held_value(
      strongbox::schema::failure_t& failure) const;

  std::vector<strongbox::schema::event_record_t> events(uint64_t from,
                                                        uint64_t to) const;
  strongbox::schema::hash32_t event_head() const;
  uint64_t last_event_id() const;
  bool verify_events() const;

 private:
  strongbox::schema::operation_result_t finish(
      std::string_view codespace,
      strongbox::ledger::vault_ledger::checkpoint& checkpoint,
      const strongbox::schema::ledger_event_t& event,
      const strongbox::schema::address_t& account,
      const strongbox::schema::amount_t& amount);
  strongbox::schema::operation_result_t finish_admin(
      const strongbox::schema::ledger_event_t& event,
      const strongbox::schema::address_t& caller);

  strongbox::ledger::storage_t& storage_;
  strongbox::schema::address_t stable_token_;
  strongbox::oracle::price_oracle oracle_;
  strongbox::ledger::vault_ledger ledger_;
  strongbox::ledger::event_log events_;
  strongbox::admin::administrator admin_;
  strongbox::settlement::settlement settlement_;
  strongbox::oracle::time_source_t now_;
  mutable std::recursive_mutex mutex_;
  strongbox::common::reentrancy_lock reentrancy_;
};

}  // namespace strongbox::execution
