#include <spdlog/spdlog.h>
#include <strongbox/admin/administrator.hpp>
#include <strongbox/schema/encoding/scale/rows.hpp>
#include <strongbox/schema/key/ledger_keys.hpp>

using namespace strongbox::schema;

namespace strongbox::admin {

administrator::administrator(address_t admin,
                             address_t oracle_reference,
                             policy_parameters_t parameters)
    : admin_{admin},
      oracle_reference_{oracle_reference},
      parameters_{parameters} {}

const address_t& administrator::admin() const {
  return admin_;
}

const address_t& administrator::oracle_reference() const {
  return oracle_reference_;
}

const policy_parameters_t& administrator::parameters() const {
  return parameters_;
}

std::optional<failure_t> administrator::authorize(
    const address_t& caller) const {
  if (caller == admin_) {
    return std::nullopt;
  }
  return failure_t{.code = error_code::unauthorized,
                   .message = "caller " + strongbox::schema::to_string(caller) +
                              " is not the administrator",
                   .amount = std::nullopt,
                   .limit = std::nullopt,
                   .account = caller};
}

std::optional<failure_t> administrator::set_oracle_reference(
    const address_t& caller,
    const address_t& reference) {
  if (auto failure = authorize(caller)) {
    return failure;
  }
  spdlog::info("Oracle reference {} -> {}",
               strongbox::schema::to_string(oracle_reference_),
               strongbox::schema::to_string(reference));
  oracle_reference_ = reference;
  return std::nullopt;
}

std::optional<failure_t> administrator::set_bank_capital_ceiling(
    const address_t& caller,
    const amount_t& value) {
  if (auto failure = authorize(caller)) {
    return failure;
  }
  spdlog::info("Bank capital ceiling {} -> {}",
               strongbox::schema::to_string(parameters_.bank_capital_ceiling),
               strongbox::schema::to_string(value));
  parameters_.bank_capital_ceiling = value;
  return std::nullopt;
}

std::optional<failure_t> administrator::set_global_deposit_ceiling(
    const address_t& caller,
    const amount_t& value) {
  if (auto failure = authorize(caller)) {
    return failure;
  }
  spdlog::info("Global deposit ceiling {} -> {}",
               strongbox::schema::to_string(parameters_.global_deposit_ceiling),
               strongbox::schema::to_string(value));
  parameters_.global_deposit_ceiling = value;
  return std::nullopt;
}

std::vector<strongbox::storage::key_value_entry_t> administrator::rows()
    const {
  auto encoder = strongbox::ledger::encoder_t{};
  return {{key::make_key(key::kPolicyKey),
           encoder.encode(encoding::scale::to_row(parameters_))},
          {key::make_key(key::kAdminKey),
           encoder.encode(
               encoding::scale::admin_row_t{admin_, oracle_reference_})}};
}

std::optional<administrator> administrator::load(
    const strongbox::ledger::storage_t& storage) {
  auto encoder = strongbox::ledger::encoder_t{};
  const auto policy_key = key::make_key(key::kPolicyKey);
  const auto admin_key = key::make_key(key::kAdminKey);
  auto policy = storage.get<encoding::scale::policy_row_t>(
      encoder, bytes_view_t{policy_key.data(), policy_key.size()});
  auto admin = storage.get<encoding::scale::admin_row_t>(
      encoder, bytes_view_t{admin_key.data(), admin_key.size()});
  if (!policy || !admin) {
    return std::nullopt;
  }
  return administrator{std::get<0>(*admin), std::get<1>(*admin),
                       encoding::scale::from_row(*policy)};
}

}  // namespace strongbox::admin
