#include <spdlog/spdlog.h>
#include <strongbox/common/critical.hpp>
#include <strongbox/ledger/vault_ledger.hpp>
#include <strongbox/schema/encoding/scale/rows.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

#include <iterator>
#include <limits>

using namespace strongbox::schema;

namespace strongbox::ledger {

vault_ledger::checkpoint::checkpoint(vault_ledger& ledger) : ledger_{ledger} {
  ledger_.begin();
}

vault_ledger::checkpoint::~checkpoint() {
  if (open_) {
    ledger_.rollback();
  }
}

void vault_ledger::checkpoint::commit(
    const std::vector<strongbox::storage::key_value_entry_t>& extra) {
  if (!open_) {
    strongbox::common::critical("ledger checkpoint committed twice");
  }
  auto rows = ledger_.pending_rows();
  rows.insert(std::end(rows), std::begin(extra), std::end(extra));
  ledger_.storage_.write_batch(rows);
  ledger_.close();
  open_ = false;
}

vault_ledger::vault_ledger(storage_t& storage) : storage_{storage} {
  load_persisted_state();
  spdlog::info("Vault ledger loaded: {} open position(s), {} deposit(s), {} "
               "withdrawal(s)",
               open_positions(), totals_.deposit_count,
               totals_.withdrawal_count);
}

bool vault_ledger::record_deposit(const address_t& user,
                                  const asset_id_t asset,
                                  const amount_t& amount,
                                  const amount_t& stable_value) {
  constexpr auto kMax = std::numeric_limits<amount_t>::max();
  const auto entry = balance_key_t{user, asset};
  const auto balance = balance_of(user, asset);
  if (amount > kMax - balance ||
      stable_value > kMax - totals_.total_deposits) {
    return false;
  }
  touch(entry);
  balances_[entry] = balance + amount;
  totals_.total_deposits += stable_value;
  totals_.deposit_count += 1;
  return true;
}

bool vault_ledger::record_withdrawal(const address_t& user,
                                     const asset_id_t asset,
                                     const amount_t& amount) {
  const auto entry = balance_key_t{user, asset};
  auto it = balances_.find(entry);
  if (it == std::end(balances_) || it->second < amount) {
    return false;
  }
  touch(entry);
  it->second -= amount;
  totals_.withdrawal_count += 1;
  return true;
}

amount_t vault_ledger::balance_of(const address_t& user,
                                  const asset_id_t asset) const {
  auto it = balances_.find(balance_key_t{user, asset});
  if (it == std::end(balances_)) {
    return amount_t{0};
  }
  return it->second;
}

ledger_totals_t vault_ledger::totals() const {
  return totals_;
}

amount_t vault_ledger::holdings(const asset_id_t asset) const {
  auto total = amount_t{0};
  for (const auto& [entry, balance] : balances_) {
    if (entry.second == asset) {
      total += balance;
    }
  }
  return total;
}

std::size_t vault_ledger::open_positions() const {
  auto count = std::size_t{0};
  for (const auto& [entry, balance] : balances_) {
    if (balance != 0) {
      ++count;
    }
  }
  return count;
}

void vault_ledger::begin() {
  if (journal_) {
    strongbox::common::critical("nested ledger checkpoint");
  }
  journal_ = journal_t{.totals = totals_, .balances = {}};
}

void vault_ledger::rollback() {
  if (!journal_) {
    return;
  }
  for (const auto& [touched, previous] : journal_->balances) {
    if (previous) {
      balances_[touched] = *previous;
    } else {
      balances_.erase(touched);
    }
  }
  totals_ = journal_->totals;
  journal_.reset();
  spdlog::debug("Ledger checkpoint rolled back");
}

std::vector<strongbox::storage::key_value_entry_t>
vault_ledger::pending_rows() {
  auto rows = std::vector<strongbox::storage::key_value_entry_t>{};
  if (!journal_) {
    return rows;
  }
  rows.reserve(journal_->balances.size() + 1);
  for (const auto& [touched, previous] : journal_->balances) {
    const auto balance = balance_of(touched.first, touched.second);
    rows.push_back({key::make_balance_key(touched.first, touched.second),
                    encoder_.encode(to_amount_bytes(balance))});
  }
  rows.push_back({key::make_key(key::kTotalsKey),
                  encoder_.encode(encoding::scale::to_row(totals_))});
  return rows;
}

void vault_ledger::close() {
  journal_.reset();
}

void vault_ledger::touch(const balance_key_t& entry) {
  if (!journal_) {
    strongbox::common::critical("ledger mutation outside of a checkpoint");
  }
  if (journal_->balances.contains(entry)) {
    return;
  }
  auto it = balances_.find(entry);
  journal_->balances.emplace(
      entry, it == std::end(balances_)
               ? std::nullopt
               : std::optional<amount_t>{it->second});
}

void vault_ledger::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  const auto totals_key = key::make_key(key::kTotalsKey);
  if (auto row = storage_.get<encoding::scale::totals_row_t>(
          encoder_, bytes_view_t{totals_key.data(), totals_key.size()})) {
    totals_ = encoding::scale::from_row(*row);
  }

  const auto prefix = make_bytes(key::kBalanceKeyPrefix);
  for (const auto& [raw_key, raw_value] :
       storage_.list_by_prefix(bytes_view_t{prefix.data(), prefix.size()})) {
    auto parsed = key::parse_balance_key(
        bytes_view_t{raw_key.data(), raw_key.size()});
    if (!parsed) {
      spdlog::warn("Skipping malformed balance key '{}'",
                   to_hex(bytes_view_t{raw_key.data(), raw_key.size()}));
      continue;
    }
    auto value = encoder_.try_decode<encoding::scale::balance_row_t>(
        bytes_view_t{raw_value.data(), raw_value.size()});
    if (!value) {
      strongbox::common::critical("failed to decode persisted balance row");
    }
    balances_[*parsed] = from_amount_bytes(*value);
  }
}

}  // namespace strongbox::ledger
