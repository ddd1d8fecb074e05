#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: ledger totals.
// Lifetime aggregates. `total_deposits` is stable-denominated inflow and is
// never reduced by withdrawals.
namespace strongbox::schema {

template <uint16_t Version>
struct ledger_totals;

template <>
struct ledger_totals<1> final {
  uint16_t version{1};
  amount_t total_deposits{};
  uint64_t deposit_count{};
  uint64_t withdrawal_count{};
};

using ledger_totals_t = ledger_totals<1>;

}  // namespace strongbox::schema
