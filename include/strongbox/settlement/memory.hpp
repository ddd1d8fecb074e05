#pragma once

#include <strongbox/schema/primitives.hpp>
#include <strongbox/settlement/asset_channel.hpp>

#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <utility>

// In-process settlement backends. Balances live in maps; nothing leaves the
// process. Used by the CLI and the tests.
namespace strongbox::settlement {

/// Code run when a native payment is offered to its recipient, before any
/// value moves. Returning false rejects the payment and nothing is moved.
using recipient_hook_t =
    std::function<bool(const strongbox::schema::address_t& recipient,
                       const strongbox::schema::amount_t& amount)>;

class memory_native_channel final : public native_channel {
 public:
  explicit memory_native_channel(strongbox::schema::address_t vault);

  bool receive(const strongbox::schema::address_t& from,
               const strongbox::schema::amount_t& amount) override;
  bool send(const strongbox::schema::address_t& to,
            const strongbox::schema::amount_t& amount) override;
  strongbox::schema::amount_t vault_balance() const override;

  void mint(const strongbox::schema::address_t& account,
            const strongbox::schema::amount_t& amount);
  strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& account) const;

  void set_recipient_hook(const strongbox::schema::address_t& account,
                          recipient_hook_t hook);
  void clear_recipient_hook(const strongbox::schema::address_t& account);

 private:
  bool move(const strongbox::schema::address_t& from,
            const strongbox::schema::address_t& to,
            const strongbox::schema::amount_t& amount);

  strongbox::schema::address_t vault_;
  mutable std::mutex mutex_;
  std::map<strongbox::schema::address_t, strongbox::schema::amount_t> wallets_;
  std::map<strongbox::schema::address_t, recipient_hook_t> hooks_;
};

/// Token ledger with allowances. `holder` is the account whose balance
/// `transfer` spends and the only spender `transfer_from` honours.
class memory_stable_token final : public stable_token {
 public:
  explicit memory_stable_token(strongbox::schema::address_t holder);

  bool transfer_from(const strongbox::schema::address_t& from,
                     const strongbox::schema::address_t& to,
                     const strongbox::schema::amount_t& amount) override;
  bool transfer(const strongbox::schema::address_t& to,
                const strongbox::schema::amount_t& amount) override;
  strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& account) const override;

  void mint(const strongbox::schema::address_t& account,
            const strongbox::schema::amount_t& amount);

  /// Let the holder pull up to `amount` from `owner`.
  void approve(const strongbox::schema::address_t& owner,
               const strongbox::schema::amount_t& amount);
  strongbox::schema::amount_t allowance(
      const strongbox::schema::address_t& owner) const;

  /// Transfers touching a frozen account fail.
  void freeze(const strongbox::schema::address_t& account, bool frozen);

 private:
  bool move(const strongbox::schema::address_t& from,
            const strongbox::schema::address_t& to,
            const strongbox::schema::amount_t& amount);

  strongbox::schema::address_t holder_;
  mutable std::mutex mutex_;
  std::map<strongbox::schema::address_t, strongbox::schema::amount_t>
      balances_;
  std::map<strongbox::schema::address_t, strongbox::schema::amount_t>
      allowances_;
  std::set<strongbox::schema::address_t> frozen_;
};

}  // namespace strongbox::settlement
