#include <strongbox/policy/limit_policy.hpp>

#include <limits>

using namespace strongbox::schema;

namespace strongbox::policy {

namespace {

// True when `base + amount` would exceed `ceiling`, overflow included.
bool exceeds(const amount_t& base,
             const amount_t& amount,
             const amount_t& ceiling) {
  if (amount > std::numeric_limits<amount_t>::max() - base) {
    return true;
  }
  return base + amount > ceiling;
}

}  // namespace

std::optional<failure_t> check_amount(const amount_t& amount) {
  if (amount == 0) {
    return failure_t{.code = error_code::zero_amount,
                     .message = "amount must be greater than zero",
                     .amount = amount};
  }
  return std::nullopt;
}

std::optional<failure_t> check_deposit(const ledger_totals_t& totals,
                                       const policy_parameters_t& parameters,
                                       const amount_t& stable_amount) {
  if (exceeds(totals.total_deposits, stable_amount,
              parameters.global_deposit_ceiling)) {
    return failure_t{
        .code = error_code::global_limit_exceeded,
        .message = "deposit of " + stable_amount.str() +
                   " stable units would exceed the global deposit ceiling",
        .amount = stable_amount,
        .limit = parameters.global_deposit_ceiling};
  }
  if (exceeds(totals.total_deposits, stable_amount,
              parameters.bank_capital_ceiling)) {
    return failure_t{
        .code = error_code::bank_capital_exceeded,
        .message = "deposit of " + stable_amount.str() +
                   " stable units would exceed the bank capital ceiling",
        .amount = stable_amount,
        .limit = parameters.bank_capital_ceiling};
  }
  return std::nullopt;
}

const amount_t& withdrawal_ceiling(const policy_parameters_t& parameters,
                                   const asset_id_t asset) {
  if (asset == asset_id_t::stable) {
    return parameters.stable_withdrawal_ceiling;
  }
  return parameters.withdrawal_ceiling;
}

std::optional<failure_t> check_withdrawal(const address_t& user,
                                          const amount_t& amount,
                                          const amount_t& ceiling,
                                          const amount_t& balance) {
  if (amount > ceiling) {
    return failure_t{
        .code = error_code::per_transaction_limit_exceeded,
        .message = "withdrawal of " + amount.str() +
                   " exceeds the per-transaction ceiling of " + ceiling.str(),
        .amount = amount,
        .limit = ceiling,
        .account = user};
  }
  if (balance < amount) {
    return failure_t{.code = error_code::insufficient_balance,
                     .message = "withdrawal of " + amount.str() +
                                " exceeds balance of " + balance.str(),
                     .amount = amount,
                     .limit = balance,
                     .account = user};
  }
  return std::nullopt;
}

}  // namespace strongbox::policy
