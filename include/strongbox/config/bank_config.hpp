#pragma once

#include <strongbox/oracle/price_oracle.hpp>
#include <strongbox/schema/primitives.hpp>

#include <boost/program_options.hpp>

#include <optional>
#include <string>

namespace strongbox::config {

/// Everything needed to stand up a bank instance.
struct bank_config_t final {
  strongbox::schema::address_t administrator{};
  strongbox::schema::address_t vault{};
  strongbox::schema::address_t stable_token{};
  strongbox::schema::address_t oracle_reference{};
  strongbox::schema::amount_t global_deposit_ceiling{};
  strongbox::schema::amount_t bank_capital_ceiling{};
  strongbox::schema::amount_t withdrawal_ceiling{};
  strongbox::schema::amount_t stable_withdrawal_ceiling{};
  strongbox::oracle::oracle_settings_t oracle{};
};

/// Option group shared by the command line and INI config files.
boost::program_options::options_description make_bank_options();

/// Build and validate a config from parsed options.
std::optional<bank_config_t> make_bank_config(
    const boost::program_options::variables_map& vm,
    std::string& error);

/// Read an INI-style file holding the bank options. Unknown keys are ignored.
std::optional<bank_config_t> load_bank_config(const std::string& path,
                                              std::string& error);

bool validate(const bank_config_t& config, std::string& error);

}  // namespace strongbox::config
