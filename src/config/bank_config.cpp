#include <strongbox/config/bank_config.hpp>

#include <fstream>

using namespace strongbox::schema;

namespace strongbox::config {

namespace {

namespace po = boost::program_options;

std::optional<address_t> read_address(const po::variables_map& vm,
                                      const std::string& name,
                                      std::string& error) {
  if (!vm.contains(name)) {
    error = "missing required option '" + name + "'";
    return std::nullopt;
  }
  auto address = try_make_address(vm[name].as<std::string>());
  if (!address) {
    error = "option '" + name + "' is not a 20-byte hex address";
    return std::nullopt;
  }
  return address;
}

std::optional<amount_t> read_amount(const po::variables_map& vm,
                                    const std::string& name,
                                    std::string& error) {
  if (!vm.contains(name)) {
    error = "missing required option '" + name + "'";
    return std::nullopt;
  }
  auto amount = try_parse_amount(vm[name].as<std::string>());
  if (!amount) {
    error = "option '" + name + "' is not an unsigned 256-bit integer";
    return std::nullopt;
  }
  return amount;
}

}  // namespace

po::options_description make_bank_options() {
  auto defaults = strongbox::oracle::oracle_settings_t{};
  auto description = po::options_description{"Bank"};
  description.add_options()(
      "administrator", po::value<std::string>(),
      "Address allowed to retune ceilings and the oracle reference")(
      "vault", po::value<std::string>(), "Address holding custodied value")(
      "stable-token", po::value<std::string>(),
      "Address of the designated stable token")(
      "oracle", po::value<std::string>(), "Address of the trusted price feed")(
      "global-deposit-ceiling", po::value<std::string>(),
      "Lifetime deposit ceiling in stable smallest units")(
      "bank-capital-ceiling", po::value<std::string>(),
      "Bank capital ceiling in stable smallest units")(
      "withdrawal-ceiling", po::value<std::string>(),
      "Per-withdrawal ceiling in native smallest units")(
      "stable-withdrawal-ceiling", po::value<std::string>(),
      "Per-withdrawal ceiling in stable smallest units")(
      "native-decimals",
      po::value<uint32_t>()->default_value(defaults.native_decimals),
      "Decimals of the native asset")(
      "feed-decimals",
      po::value<uint32_t>()->default_value(defaults.feed_decimals),
      "Decimals of the price feed answer")(
      "stable-decimals",
      po::value<uint32_t>()->default_value(defaults.stable_decimals),
      "Decimals of the stable accounting unit")(
      "heartbeat-seconds",
      po::value<uint64_t>()->default_value(defaults.heartbeat_seconds),
      "Maximum age of a price before it is stale");
  return description;
}

std::optional<bank_config_t> make_bank_config(const po::variables_map& vm,
                                              std::string& error) {
  auto config = bank_config_t{};
  auto administrator = read_address(vm, "administrator", error);
  auto vault = read_address(vm, "vault", error);
  auto stable_token = read_address(vm, "stable-token", error);
  auto oracle_reference = read_address(vm, "oracle", error);
  auto global_ceiling = read_amount(vm, "global-deposit-ceiling", error);
  auto capital_ceiling = read_amount(vm, "bank-capital-ceiling", error);
  auto withdrawal_ceiling = read_amount(vm, "withdrawal-ceiling", error);
  auto stable_withdrawal_ceiling =
      read_amount(vm, "stable-withdrawal-ceiling", error);
  if (!administrator || !vault || !stable_token || !oracle_reference ||
      !global_ceiling || !capital_ceiling || !withdrawal_ceiling ||
      !stable_withdrawal_ceiling) {
    return std::nullopt;
  }
  config.administrator = *administrator;
  config.vault = *vault;
  config.stable_token = *stable_token;
  config.oracle_reference = *oracle_reference;
  config.global_deposit_ceiling = *global_ceiling;
  config.bank_capital_ceiling = *capital_ceiling;
  config.withdrawal_ceiling = *withdrawal_ceiling;
  config.stable_withdrawal_ceiling = *stable_withdrawal_ceiling;
  config.oracle.native_decimals = vm["native-decimals"].as<uint32_t>();
  config.oracle.feed_decimals = vm["feed-decimals"].as<uint32_t>();
  config.oracle.stable_decimals = vm["stable-decimals"].as<uint32_t>();
  config.oracle.heartbeat_seconds = vm["heartbeat-seconds"].as<uint64_t>();
  if (!validate(config, error)) {
    return std::nullopt;
  }
  return config;
}

std::optional<bank_config_t> load_bank_config(const std::string& path,
                                              std::string& error) {
  auto file = std::ifstream{path};
  if (!file) {
    error = "cannot open config file '" + path + "'";
    return std::nullopt;
  }
  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(file, make_bank_options(), true), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    error = path + ": " + e.what();
    return std::nullopt;
  }
  return make_bank_config(vm, error);
}

bool validate(const bank_config_t& config, std::string& error) {
  if (is_zero(config.administrator)) {
    error = "administrator must not be the zero address";
    return false;
  }
  if (is_zero(config.vault)) {
    error = "vault must not be the zero address";
    return false;
  }
  if (is_zero(config.oracle_reference)) {
    error = "oracle reference must not be the zero address";
    return false;
  }
  if (config.oracle.native_decimals > 77 || config.oracle.feed_decimals > 77 ||
      config.oracle.native_decimals + config.oracle.feed_decimals > 77) {
    error = "native plus feed decimals must stay below 78";
    return false;
  }
  if (config.oracle.stable_decimals >
      config.oracle.native_decimals + config.oracle.feed_decimals) {
    error = "stable decimals exceed native plus feed decimals";
    return false;
  }
  return true;
}

}  // namespace strongbox::config
