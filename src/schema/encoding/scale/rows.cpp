#include <strongbox/schema/encoding/scale/rows.hpp>

using namespace strongbox::schema;

namespace strongbox::schema::encoding::scale {

namespace {

enum class event_kind : uint8_t {
  deposit_recorded = 0,
  withdrawal_recorded = 1,
  oracle_reference_changed = 2,
  bank_capital_ceiling_changed = 3,
  global_deposit_ceiling_changed = 4,
};

}  // namespace

totals_row_t to_row(const ledger_totals_t& totals) {
  return totals_row_t{totals.version, to_amount_bytes(totals.total_deposits),
                      totals.deposit_count, totals.withdrawal_count};
}

ledger_totals_t from_row(const totals_row_t& row) {
  return ledger_totals_t{
      .version = std::get<0>(row),
      .total_deposits = from_amount_bytes(std::get<1>(row)),
      .deposit_count = std::get<2>(row),
      .withdrawal_count = std::get<3>(row)};
}

policy_row_t to_row(const policy_parameters_t& parameters) {
  return policy_row_t{parameters.version,
                      to_amount_bytes(parameters.global_deposit_ceiling),
                      to_amount_bytes(parameters.bank_capital_ceiling),
                      to_amount_bytes(parameters.withdrawal_ceiling),
                      to_amount_bytes(parameters.stable_withdrawal_ceiling)};
}

policy_parameters_t from_row(const policy_row_t& row) {
  return policy_parameters_t{
      .version = std::get<0>(row),
      .global_deposit_ceiling = from_amount_bytes(std::get<1>(row)),
      .bank_capital_ceiling = from_amount_bytes(std::get<2>(row)),
      .withdrawal_ceiling = from_amount_bytes(std::get<3>(row)),
      .stable_withdrawal_ceiling = from_amount_bytes(std::get<4>(row))};
}

event_payload_row_t to_payload_row(const event_record_t& record) {
  auto kind = event_kind{};
  auto address = address_t{};
  auto asset = uint8_t{};
  auto amount = amount_t{};
  std::visit(overloaded{[&](const deposit_recorded_t& event) {
                          kind = event_kind::deposit_recorded;
                          address = event.user;
                          asset = static_cast<uint8_t>(event.asset);
                          amount = event.amount;
                        },
                        [&](const withdrawal_recorded_t& event) {
                          kind = event_kind::withdrawal_recorded;
                          address = event.user;
                          asset = static_cast<uint8_t>(event.asset);
                          amount = event.amount;
                        },
                        [&](const oracle_reference_changed_t& event) {
                          kind = event_kind::oracle_reference_changed;
                          address = event.reference;
                        },
                        [&](const bank_capital_ceiling_changed_t& event) {
                          kind = event_kind::bank_capital_ceiling_changed;
                          amount = event.value;
                        },
                        [&](const global_deposit_ceiling_changed_t& event) {
                          kind = event_kind::global_deposit_ceiling_changed;
                          amount = event.value;
                        }},
             record.event);
  return event_payload_row_t{record.version,
                             record.event_id,
                             record.recorded_at,
                             static_cast<uint8_t>(kind),
                             address,
                             asset,
                             to_amount_bytes(amount)};
}

event_row_t to_row(const event_record_t& record) {
  return event_row_t{to_payload_row(record), record.chain_hash};
}

std::optional<event_record_t> from_row(const event_row_t& row) {
  const auto& payload = std::get<0>(row);
  auto record = event_record_t{};
  record.version = std::get<0>(payload);
  record.event_id = std::get<1>(payload);
  record.recorded_at = std::get<2>(payload);
  record.chain_hash = std::get<1>(row);

  const auto& address = std::get<4>(payload);
  const auto amount = from_amount_bytes(std::get<6>(payload));
  switch (static_cast<event_kind>(std::get<3>(payload))) {
    case event_kind::deposit_recorded:
    case event_kind::withdrawal_recorded: {
      auto asset = try_make_asset_id(std::get<5>(payload));
      if (!asset) {
        return std::nullopt;
      }
      if (static_cast<event_kind>(std::get<3>(payload)) ==
          event_kind::deposit_recorded) {
        record.event = deposit_recorded_t{
            .user = address, .asset = *asset, .amount = amount};
      } else {
        record.event = withdrawal_recorded_t{
            .user = address, .asset = *asset, .amount = amount};
      }
      return record;
    }
    case event_kind::oracle_reference_changed:
      record.event = oracle_reference_changed_t{.reference = address};
      return record;
    case event_kind::bank_capital_ceiling_changed:
      record.event = bank_capital_ceiling_changed_t{.value = amount};
      return record;
    case event_kind::global_deposit_ceiling_changed:
      record.event = global_deposit_ceiling_changed_t{.value = amount};
      return record;
  }
  return std::nullopt;
}

}  // namespace strongbox::schema::encoding::scale
