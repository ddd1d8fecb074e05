#pragma once
#include <strongbox/schema/asset_id.hpp>
#include <strongbox/schema/primitives.hpp>

#include <string_view>
#include <variant>

// Schema type: ledger event.
// Audit stream payloads emitted after an operation has fully settled.
namespace strongbox::schema {

struct deposit_recorded_t final {
  address_t user{};
  asset_id_t asset{};
  amount_t amount{};
};

struct withdrawal_recorded_t final {
  address_t user{};
  asset_id_t asset{};
  amount_t amount{};
};

struct oracle_reference_changed_t final {
  address_t reference{};
};

struct bank_capital_ceiling_changed_t final {
  amount_t value{};
};

struct global_deposit_ceiling_changed_t final {
  amount_t value{};
};

using ledger_event_t = std::variant<deposit_recorded_t,
                                    withdrawal_recorded_t,
                                    oracle_reference_changed_t,
                                    bank_capital_ceiling_changed_t,
                                    global_deposit_ceiling_changed_t>;

inline std::string_view event_type(const ledger_event_t& event) {
  return std::visit(
      overloaded{
          [](const deposit_recorded_t&) {
            return std::string_view{"DepositRecorded"};
          },
          [](const withdrawal_recorded_t&) {
            return std::string_view{"WithdrawalRecorded"};
          },
          [](const oracle_reference_changed_t&) {
            return std::string_view{"OracleReferenceChanged"};
          },
          [](const bank_capital_ceiling_changed_t&) {
            return std::string_view{"BankCapitalCeilingChanged"};
          },
          [](const global_deposit_ceiling_changed_t&) {
            return std::string_view{"GlobalDepositCeilingChanged"};
          }},
      event);
}

}  // namespace strongbox::schema
