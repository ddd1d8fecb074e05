#include <spdlog/spdlog.h>
#include <strongbox/settlement/memory.hpp>

#include <iterator>

using namespace strongbox::schema;

namespace strongbox::settlement {

namespace {

amount_t lookup(const std::map<address_t, amount_t>& table,
                const address_t& account) {
  auto it = table.find(account);
  if (it == std::end(table)) {
    return amount_t{0};
  }
  return it->second;
}

}  // namespace

memory_native_channel::memory_native_channel(address_t vault)
    : vault_{vault} {}

bool memory_native_channel::receive(const address_t& from,
                                    const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return move(from, vault_, amount);
}

bool memory_native_channel::send(const address_t& to, const amount_t& amount) {
  auto hook = recipient_hook_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    if (lookup(wallets_, vault_) < amount) {
      return false;
    }
    if (auto it = hooks_.find(to); it != std::end(hooks_)) {
      hook = it->second;
    }
  }
  // The hook runs unlocked and before any value moves.
  if (hook && !hook(to, amount)) {
    spdlog::debug("Recipient {} rejected native payment of {}",
                  strongbox::schema::to_string(to), amount.str());
    return false;
  }
  auto lock = std::scoped_lock{mutex_};
  return move(vault_, to, amount);
}

amount_t memory_native_channel::vault_balance() const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(wallets_, vault_);
}

void memory_native_channel::mint(const address_t& account,
                                 const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  wallets_[account] += amount;
}

amount_t memory_native_channel::balance_of(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(wallets_, account);
}

void memory_native_channel::set_recipient_hook(const address_t& account,
                                               recipient_hook_t hook) {
  auto lock = std::scoped_lock{mutex_};
  hooks_[account] = std::move(hook);
}

void memory_native_channel::clear_recipient_hook(const address_t& account) {
  auto lock = std::scoped_lock{mutex_};
  hooks_.erase(account);
}

bool memory_native_channel::move(const address_t& from,
                                 const address_t& to,
                                 const amount_t& amount) {
  auto& source = wallets_[from];
  if (source < amount) {
    return false;
  }
  source -= amount;
  wallets_[to] += amount;
  return true;
}

memory_stable_token::memory_stable_token(address_t holder) : holder_{holder} {}

bool memory_stable_token::transfer_from(const address_t& from,
                                        const address_t& to,
                                        const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  auto& allowance = allowances_[from];
  if (allowance < amount) {
    spdlog::debug("Allowance of {} is {}, {} requested",
                  strongbox::schema::to_string(from), allowance.str(),
                  amount.str());
    return false;
  }
  if (!move(from, to, amount)) {
    return false;
  }
  allowance -= amount;
  return true;
}

bool memory_stable_token::transfer(const address_t& to,
                                   const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  return move(holder_, to, amount);
}

amount_t memory_stable_token::balance_of(const address_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(balances_, account);
}

void memory_stable_token::mint(const address_t& account,
                               const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  balances_[account] += amount;
}

void memory_stable_token::approve(const address_t& owner,
                                  const amount_t& amount) {
  auto lock = std::scoped_lock{mutex_};
  allowances_[owner] = amount;
}

amount_t memory_stable_token::allowance(const address_t& owner) const {
  auto lock = std::scoped_lock{mutex_};
  return lookup(allowances_, owner);
}

void memory_stable_token::freeze(const address_t& account, const bool frozen) {
  auto lock = std::scoped_lock{mutex_};
  if (frozen) {
    frozen_.insert(account);
  } else {
    frozen_.erase(account);
  }
}

bool memory_stable_token::move(const address_t& from,
                               const address_t& to,
                               const amount_t& amount) {
  if (frozen_.contains(from) || frozen_.contains(to)) {
    return false;
  }
  auto& source = balances_[from];
  if (source < amount) {
    return false;
  }
  source -= amount;
  balances_[to] += amount;
  return true;
}

}  // namespace strongbox::settlement
