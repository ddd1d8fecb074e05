#pragma once
#include <strongbox/schema/primitives.hpp>

// Schema type: policy parameters.
// Capital ceilings in stable units (administrator tunable) and the fixed
// per-withdrawal ceilings, one per asset in that asset's smallest units.
namespace strongbox::schema {

template <uint16_t Version>
struct policy_parameters;

template <>
struct policy_parameters<1> final {
  uint16_t version{1};
  amount_t global_deposit_ceiling{};
  amount_t bank_capital_ceiling{};
  amount_t withdrawal_ceiling{};
  amount_t stable_withdrawal_ceiling{};
};

using policy_parameters_t = policy_parameters<1>;

}  // namespace strongbox::schema
