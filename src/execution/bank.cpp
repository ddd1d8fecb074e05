#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/execution/bank.hpp>
#include <strongbox/policy/limit_policy.hpp>

#include <iterator>
#include <limits>
#include <string>
#include <utility>

using namespace strongbox::schema;

namespace strongbox::execution {

namespace {

operation_result_t reject(const std::string_view codespace,
                          const failure_t& failure) {
  spdlog::warn("{} rejected with {}: {}", codespace,
               strongbox::schema::to_string(failure.code), failure.message);
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(failure.code);
  result.log = failure.message;
  result.codespace = std::string{codespace};
  result.amount = failure.amount;
  result.limit = failure.limit;
  result.account = failure.account;
  return result;
}

failure_t make_reentrant_failure(const address_t& caller,
                                 const std::optional<amount_t>& amount) {
  return failure_t{
      .code = error_code::reentrant_call,
      .message = "call re-entered while another operation was in progress",
      .amount = amount,
      .limit = std::nullopt,
      .account = caller};
}

admin::administrator load_administrator(ledger::storage_t& storage,
                                        const config::bank_config_t& config) {
  if (auto persisted = admin::administrator::load(storage)) {
    if (persisted->admin() != config.administrator) {
      spdlog::warn("Configured administrator {} ignored; persisted {} kept",
                   strongbox::schema::to_string(config.administrator),
                   strongbox::schema::to_string(persisted->admin()));
    }
    if (persisted->parameters().withdrawal_ceiling !=
        config.withdrawal_ceiling) {
      spdlog::warn(
          "Configured withdrawal ceiling {} ignored; persisted {} kept",
          config.withdrawal_ceiling.str(),
          persisted->parameters().withdrawal_ceiling.str());
    }
    if (persisted->parameters().stable_withdrawal_ceiling !=
        config.stable_withdrawal_ceiling) {
      spdlog::warn(
          "Configured stable withdrawal ceiling {} ignored; persisted {} kept",
          config.stable_withdrawal_ceiling.str(),
          persisted->parameters().stable_withdrawal_ceiling.str());
    }
    return *persisted;
  }

  auto fresh = admin::administrator{
      config.administrator, config.oracle_reference,
      policy_parameters_t{
          .version = 1,
          .global_deposit_ceiling = config.global_deposit_ceiling,
          .bank_capital_ceiling = config.bank_capital_ceiling,
          .withdrawal_ceiling = config.withdrawal_ceiling,
          .stable_withdrawal_ceiling = config.stable_withdrawal_ceiling}};
  storage.write_batch(fresh.rows());
  spdlog::info("Initialised administrative state for {}",
               strongbox::schema::to_string(config.administrator));
  return fresh;
}

const config::bank_config_t& validated(const config::bank_config_t& config) {
  auto error = std::string{};
  if (!config::validate(config, error)) {
    strongbox::common::critical("invalid bank configuration: " + error);
  }
  return config;
}

}  // namespace

bank::bank(ledger::storage_t& storage,
           const config::bank_config_t& config,
           const oracle::feed_registry& feeds,
           settlement::native_channel& native,
           settlement::stable_token& stable,
           oracle::time_source_t now)
    : storage_{storage},
      stable_token_{validated(config).stable_token},
      oracle_{feeds, config.oracle, now},
      ledger_{storage},
      events_{storage},
      admin_{load_administrator(storage, config)},
      settlement_{native, stable, config.vault},
      now_{std::move(now)} {
  spdlog::info(
      "Bank ready: vault {}, stable token {}, oracle {}, {} event(s) logged",
      strongbox::schema::to_string(settlement_.vault()),
      strongbox::schema::to_string(stable_token_),
      strongbox::schema::to_string(admin_.oracle_reference()),
      events_.last_id());
}

operation_result_t bank::deposit(const address_t& caller,
                                 const asset_id_t asset,
                                 const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = common::reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    return reject(kDepositCodespace, make_reentrant_failure(caller, amount));
  }
  if (auto failure = policy::check_amount(amount)) {
    failure->account = caller;
    return reject(kDepositCodespace, *failure);
  }

  auto stable_value = amount;
  if (asset == asset_id_t::native) {
    auto failure = failure_t{};
    auto converted = oracle_.convert_native_to_stable(admin_.oracle_reference(),
                                                      amount, failure);
    if (!converted) {
      failure.account = caller;
      return reject(kDepositCodespace, failure);
    }
    stable_value = *converted;
  }
  if (auto failure = policy::check_deposit(ledger_.totals(),
                                           admin_.parameters(), stable_value)) {
    failure->account = caller;
    return reject(kDepositCodespace, *failure);
  }

  auto checkpoint = ledger::vault_ledger::checkpoint{ledger_};
  if (!ledger_.record_deposit(caller, asset, amount, stable_value)) {
    return reject(
        kDepositCodespace,
        failure_t{.code = error_code::arithmetic_overflow,
                  .message = "deposit of " + amount.str() +
                             " would overflow the balance or lifetime "
                             "deposits",
                  .amount = amount,
                  .limit = std::nullopt,
                  .account = caller});
  }
  auto failure = settlement_.pull(asset, caller, amount);
  if (guard.reentry_attempted()) {
    // A nested call was refused during the transfer; the deposit fails even
    // if the transfer itself went through.
    if (!failure && settlement_.push(asset, caller, amount)) {
      strongbox::common::critical("re-entered deposit could not be refunded");
    }
    return reject(kDepositCodespace, make_reentrant_failure(caller, amount));
  }
  if (failure) {
    return reject(kDepositCodespace, *failure);
  }
  return finish(kDepositCodespace, checkpoint,
                deposit_recorded_t{.user = caller, .asset = asset, .amount = amount},
                caller, amount);
}

operation_result_t bank::deposit_native(const address_t& caller,
                                        const amount_t& amount) {
  return deposit(caller, asset_id_t::native, amount);
}

operation_result_t bank::deposit_stable(const address_t& caller,
                                        const amount_t& amount) {
  return deposit(caller, asset_id_t::stable, amount);
}

operation_result_t bank::withdraw(const address_t& caller,
                                  const asset_id_t asset,
                                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = common::reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    return reject(kWithdrawCodespace, make_reentrant_failure(caller, amount));
  }
  if (auto failure = policy::check_amount(amount)) {
    failure->account = caller;
    return reject(kWithdrawCodespace, *failure);
  }

  const auto& ceiling = policy::withdrawal_ceiling(admin_.parameters(), asset);
  if (auto failure = policy::check_withdrawal(
          caller, amount, ceiling, ledger_.balance_of(caller, asset))) {
    return reject(kWithdrawCodespace, *failure);
  }

  auto checkpoint = ledger::vault_ledger::checkpoint{ledger_};
  if (!ledger_.record_withdrawal(caller, asset, amount)) {
    strongbox::common::critical("admitted withdrawal exceeds the balance");
  }
  auto failure = settlement_.push(asset, caller, amount);
  if (guard.reentry_attempted()) {
    if (!failure && settlement_.pull(asset, caller, amount)) {
      strongbox::common::critical(
          "re-entered withdrawal could not be reclaimed");
    }
    return reject(kWithdrawCodespace, make_reentrant_failure(caller, amount));
  }
  if (failure) {
    return reject(kWithdrawCodespace, *failure);
  }
  return finish(
      kWithdrawCodespace, checkpoint,
      withdrawal_recorded_t{.user = caller, .asset = asset, .amount = amount},
      caller, amount);
}

operation_result_t bank::withdraw_native(const address_t& caller,
                                         const amount_t& amount) {
  return withdraw(caller, asset_id_t::native, amount);
}

operation_result_t bank::withdraw_stable(const address_t& caller,
                                         const amount_t& amount) {
  return withdraw(caller, asset_id_t::stable, amount);
}

operation_result_t bank::set_oracle_reference(const address_t& caller,
                                              const address_t& reference) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = common::reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    return reject(kAdminCodespace,
                  make_reentrant_failure(caller, std::nullopt));
  }
  if (auto failure = admin_.set_oracle_reference(caller, reference)) {
    return reject(kAdminCodespace, *failure);
  }
  return finish_admin(oracle_reference_changed_t{.reference = reference},
                      caller);
}

operation_result_t bank::set_bank_capital_ceiling(const address_t& caller,
                                                  const amount_t& value) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = common::reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    return reject(kAdminCodespace, make_reentrant_failure(caller, value));
  }
  if (auto failure = admin_.set_bank_capital_ceiling(caller, value)) {
    return reject(kAdminCodespace, *failure);
  }
  return finish_admin(bank_capital_ceiling_changed_t{.value = value}, caller);
}

operation_result_t bank::set_global_deposit_ceiling(const address_t& caller,
                                                    const amount_t& value) {
  auto lock = std::scoped_lock{mutex_};
  auto guard = common::reentrancy_guard{reentrancy_};
  if (!guard.acquired()) {
    return reject(kAdminCodespace, make_reentrant_failure(caller, value));
  }
  if (auto failure = admin_.set_global_deposit_ceiling(caller, value)) {
    return reject(kAdminCodespace, *failure);
  }
  return finish_admin(global_deposit_ceiling_changed_t{.value = value},
                      caller);
}

amount_t bank::balance_of(const address_t& user,
                          const asset_id_t asset) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.balance_of(user, asset);
}

ledger_totals_t bank::totals() const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.totals();
}

amount_t bank::holdings(const asset_id_t asset) const {
  auto lock = std::scoped_lock{mutex_};
  return ledger_.holdings(asset);
}

policy_parameters_t bank::parameters() const {
  auto lock = std::scoped_lock{mutex_};
  return admin_.parameters();
}

address_t bank::oracle_reference() const {
  auto lock = std::scoped_lock{mutex_};
  return admin_.oracle_reference();
}

address_t bank::administrator() const {
  auto lock = std::scoped_lock{mutex_};
  return admin_.admin();
}

const address_t& bank::vault() const {
  return settlement_.vault();
}

std::optional<amount_t> bank::total_held_value(failure_t& failure) const {
  auto lock = std::scoped_lock{mutex_};
  auto native = oracle_.convert_native_to_stable(
      admin_.oracle_reference(), settlement_.on_hand(asset_id_t::native),
      failure);
  if (!native) {
    return std::nullopt;
  }
  const auto stable = settlement_.on_hand(asset_id_t::stable);
  if (*native > std::numeric_limits<amount_t>::max() - stable) {
    failure = failure_t{.code = error_code::arithmetic_overflow,
                        .message = "held value exceeds 256 bits",
                        .amount = std::nullopt,
                        .limit = std::nullopt,
                        .account = settlement_.vault()};
    return std::nullopt;
  }
  return *native + stable;
}

std::vector<event_record_t> bank::events(const uint64_t from,
                                         const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  return events_.range(from, to);
}

hash32_t bank::event_head() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.head();
}

uint64_t bank::last_event_id() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.last_id();
}

bool bank::verify_events() const {
  auto lock = std::scoped_lock{mutex_};
  return events_.verify();
}

operation_result_t bank::finish(const std::string_view codespace,
                                ledger::vault_ledger::checkpoint& checkpoint,
                                const ledger_event_t& event,
                                const address_t& account,
                                const amount_t& amount) {
  auto staged = events_.stage(event, now_());
  checkpoint.commit(staged.rows);
  events_.accept(staged.record);
  spdlog::debug("{} {} of {} for {}", codespace, event_type(event),
                amount.str(), strongbox::schema::to_string(account));

  auto result = operation_result_t{};
  result.code = 0;
  result.log = std::string{event_type(event)};
  result.codespace = std::string{codespace};
  result.amount = amount;
  result.account = account;
  result.events.push_back(std::move(staged.record));
  return result;
}

operation_result_t bank::finish_admin(const ledger_event_t& event,
                                      const address_t& caller) {
  auto staged = events_.stage(event, now_());
  auto rows = admin_.rows();
  rows.insert(std::end(rows), std::begin(staged.rows), std::end(staged.rows));
  storage_.write_batch(rows);
  events_.accept(staged.record);

  auto result = operation_result_t{};
  result.code = 0;
  result.log = std::string{event_type(event)};
  result.codespace = std::string{kAdminCodespace};
  result.account = caller;
  result.events.push_back(std::move(staged.record));
  return result;
}

}  // namespace strongbox::execution
