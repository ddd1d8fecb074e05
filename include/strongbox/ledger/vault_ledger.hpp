#pragma once

#include <strongbox/ledger/backend.hpp>
#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/primitives.hpp>

#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace strongbox::ledger {

/// Authoritative `(user, asset) -> balance` table and lifetime aggregates.
///
/// Mutations are only legal inside an open `checkpoint`. A checkpoint
/// journals the prior value of everything it touches; committing persists
/// the touched rows in one storage batch, destroying it uncommitted restores
/// the journalled values.
class vault_ledger final {
 public:
  class checkpoint final {
   public:
    explicit checkpoint(vault_ledger& ledger);
    ~checkpoint();

    checkpoint(const checkpoint&) = delete;
    checkpoint& operator=(const checkpoint&) = delete;
    checkpoint(checkpoint&&) = delete;
    checkpoint& operator=(checkpoint&&) = delete;

    /// Persist the touched ledger rows together with `extra` in one atomic
    /// write and close the checkpoint.
    void commit(const std::vector<strongbox::storage::key_value_entry_t>&
                    extra = {});

   private:
    vault_ledger& ledger_;
    bool open_{true};
  };

  explicit vault_ledger(storage_t& storage);

  vault_ledger(const vault_ledger&) = delete;
  vault_ledger& operator=(const vault_ledger&) = delete;

  /// Credit `amount` and add `stable_value` to lifetime deposits. Returns
  /// false, leaving everything untouched, when the balance or the lifetime
  /// total would no longer fit in 256 bits.
  bool record_deposit(const strongbox::schema::address_t& user,
                      strongbox::schema::asset_id_t asset,
                      const strongbox::schema::amount_t& amount,
                      const strongbox::schema::amount_t& stable_value);

  /// Debit `amount`. Returns false, leaving everything untouched, when the
  /// balance is smaller than `amount`.
  bool record_withdrawal(const strongbox::schema::address_t& user,
                         strongbox::schema::asset_id_t asset,
                         const strongbox::schema::amount_t& amount);

  strongbox::schema::amount_t balance_of(
      const strongbox::schema::address_t& user,
      strongbox::schema::asset_id_t asset) const;

  strongbox::schema::ledger_totals_t totals() const;

  /// Sum of every balance recorded for `asset`.
  strongbox::schema::amount_t holdings(
      strongbox::schema::asset_id_t asset) const;

  /// Number of (user, asset) rows with a non-zero balance.
  std::size_t open_positions() const;

 private:
  using balance_key_t = std::pair<strongbox::schema::address_t,
                                  strongbox::schema::asset_id_t>;

  struct journal_t final {
    strongbox::schema::ledger_totals_t totals;
    std::map<balance_key_t, std::optional<strongbox::schema::amount_t>>
        balances;
  };

  void begin();
  void rollback();
  std::vector<strongbox::storage::key_value_entry_t> pending_rows();
  void close();
  void touch(const balance_key_t& entry);
  void load_persisted_state();

  storage_t& storage_;
  encoder_t encoder_;
  std::map<balance_key_t, strongbox::schema::amount_t> balances_;
  strongbox::schema::ledger_totals_t totals_;
  std::optional<journal_t> journal_;
};

}  // namespace strongbox::ledger
