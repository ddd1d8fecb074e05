#pragma once

#include <strongbox/schema/primitives.hpp>

// Value-transfer boundaries. Every call reports success as a bool and the
// caller must check it; a `false` leaves balances where they were.
namespace strongbox::settlement {

/// Chain-native value moving in and out of the vault.
class native_channel {
 public:
  virtual ~native_channel() = default;

  /// Pull `amount` from `from` into the vault.
  virtual bool receive(const strongbox::schema::address_t& from,
                       const strongbox::schema::amount_t& amount) = 0;

  /// Pay `amount` out of the vault. May run code owned by `to`, including
  /// calls back into the ledger.
  virtual bool send(const strongbox::schema::address_t& to,
                    const strongbox::schema::amount_t& amount) = 0;

  virtual strongbox::schema::amount_t vault_balance() const = 0;
};

/// The designated stable token, seen from the vault's side.
class stable_token {
 public:
  virtual ~stable_token() = default;

  virtual bool transfer_from(const strongbox::schema::address_t& from,
                             const strongbox::schema::address_t& to,
                             const strongbox::schema::amount_t& amount) = 0;

  /// Transfer out of the vault's own balance.
  virtual bool transfer(const strongbox::schema::address_t& to,
                        const strongbox::schema::amount_t& amount) = 0;

  virtual strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& account) const = 0;
};

}  // namespace strongbox::settlement
