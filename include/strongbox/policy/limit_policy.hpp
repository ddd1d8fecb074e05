#pragma once

#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/failure.hpp>
#include <strongbox/schema/ledger_totals.hpp>
#include <strongbox/schema/policy_parameters.hpp>
#include <strongbox/schema/primitives.hpp>

#include <optional>

// Admission guards. Each returns std::nullopt when the operation may proceed
// and the violated condition otherwise. None of them mutate anything.
namespace strongbox::policy {

/// Deposits and withdrawals of zero are rejected outright.
std::optional<strongbox::schema::failure_t> check_amount(
    const strongbox::schema::amount_t& amount);

/// `stable_amount` is the deposit already expressed in stable units. A deposit
/// landing exactly on a ceiling is admitted.
std::optional<strongbox::schema::failure_t> check_deposit(
    const strongbox::schema::ledger_totals_t& totals,
    const strongbox::schema::policy_parameters_t& parameters,
    const strongbox::schema::amount_t& stable_amount);

/// Fixed per-withdrawal ceiling of `asset`, in that asset's smallest units.
const strongbox::schema::amount_t& withdrawal_ceiling(
    const strongbox::schema::policy_parameters_t& parameters,
    strongbox::schema::asset_id_t asset);

/// Per-transaction ceiling first, then the caller's balance. `ceiling` and
/// `balance` are in the same unit as `amount`.
std::optional<strongbox::schema::failure_t> check_withdrawal(
    const strongbox::schema::address_t& user,
    const strongbox::schema::amount_t& amount,
    const strongbox::schema::amount_t& ceiling,
    const strongbox::schema::amount_t& balance);

}  // namespace strongbox::policy
