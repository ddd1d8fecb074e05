#pragma once

#include <strongbox/ledger/backend.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/policy_parameters.hpp>
#include <strongbox/schema/primitives.hpp>

#include <optional>
#include <vector>

namespace strongbox::admin {

/// Owns the administrator identity, the oracle reference and the policy
/// parameters. Only the administrator may change them; changes apply at once
/// and are not bounded by the current ledger totals.
class administrator final {
 public:
  administrator(strongbox::schema::address_t admin,
                strongbox::schema::address_t oracle_reference,
                strongbox::schema::policy_parameters_t parameters);

  const strongbox::schema::address_t& admin() const;
  const strongbox::schema::address_t& oracle_reference() const;
  const strongbox::schema::policy_parameters_t& parameters() const;

  /// `unauthorized` naming `caller` unless it is the administrator.
  std::optional<strongbox::schema::failure_t> authorize(
      const strongbox::schema::address_t& caller) const;

  std::optional<strongbox::schema::failure_t> set_oracle_reference(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::address_t& reference);

  std::optional<strongbox::schema::failure_t> set_bank_capital_ceiling(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& value);

  std::optional<strongbox::schema::failure_t> set_global_deposit_ceiling(
      const strongbox::schema::address_t& caller,
      const strongbox::schema::amount_t& value);

  /// Policy row and admin row, ready for a storage batch.
  std::vector<strongbox::storage::key_value_entry_t> rows() const;

  /// Administrative state persisted by a previous run, if any.
  static std::optional<administrator> load(
      const strongbox::ledger::storage_t& storage);

 private:
  strongbox::schema::address_t admin_;
  strongbox::schema::address_t oracle_reference_;
  strongbox::schema::policy_parameters_t parameters_;
};

}  // namespace strongbox::admin
