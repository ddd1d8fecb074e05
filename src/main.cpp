#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <strongbox/config/bank_config.hpp>
#include <strongbox/execution/bank.hpp>
#include <strongbox/oracle/price_feed.hpp>
#include <strongbox/settlement/memory.hpp>
#include <strongbox/storage/rocksdb/storage.hpp>

#include <chrono>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

using namespace strongbox::schema;

namespace {

timestamp_seconds_t wall_clock_seconds() {
  return static_cast<timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

struct fund_entry_t final {
  address_t account{};
  asset_id_t asset{};
  amount_t amount{};
};

// `<address>:<asset>:<amount>`
std::optional<fund_entry_t> parse_fund_entry(const std::string& text) {
  const auto first = text.find(':');
  const auto second = text.find(':', first == std::string::npos ? 0 : first + 1);
  if (first == std::string::npos || second == std::string::npos) {
    return std::nullopt;
  }
  auto account = try_make_address(std::string_view{text}.substr(0, first));
  auto asset = try_parse_asset_id(
      std::string_view{text}.substr(first + 1, second - first - 1));
  auto amount = try_parse_amount(std::string_view{text}.substr(second + 1));
  if (!account || !asset || !amount) {
    return std::nullopt;
  }
  return fund_entry_t{.account = *account, .asset = *asset, .amount = *amount};
}

void print_result(const std::string& command,
                  const operation_result_t& result) {
  std::cout << command << ": code=" << result.code;
  if (!succeeded(result)) {
    std::cout << " ("
              << strongbox::schema::to_string(
                     static_cast<error_code>(result.code))
              << ")";
  }
  std::cout << " " << result.log << std::endl;
}

void print_event(const event_record_t& record) {
  std::cout << "  #" << record.event_id << " " << event_type(record.event)
            << " at " << record.recorded_at << " chain="
            << to_hex(bytes_view_t{record.chain_hash.data(),
                                   record.chain_hash.size()})
            << std::endl;
}

struct script_context_t final {
  strongbox::execution::bank& bank;
  strongbox::settlement::memory_stable_token& stable;
};

// Runs one script line. Returns false when the line could not be parsed.
bool run_command(script_context_t& context, const std::string& line) {
  auto in = std::istringstream{line};
  auto command = std::string{};
  in >> command;
  auto args = std::vector<std::string>{};
  for (auto arg = std::string{}; in >> arg;) {
    args.push_back(arg);
  }

  auto& bank = context.bank;
  auto address_arg = [&](const size_t i) -> std::optional<address_t> {
    return i < args.size() ? try_make_address(args[i]) : std::nullopt;
  };
  auto amount_arg = [&](const size_t i) -> std::optional<amount_t> {
    return i < args.size() ? try_parse_amount(args[i]) : std::nullopt;
  };

  if (command == "deposit-native" || command == "deposit-stable" ||
      command == "withdraw-native" || command == "withdraw-stable") {
    auto caller = address_arg(0);
    auto amount = amount_arg(1);
    if (!caller || !amount) {
      return false;
    }
    const auto asset = command.ends_with("native") ? asset_id_t::native
                                                   : asset_id_t::stable;
    print_result(command, command.starts_with("deposit")
                              ? bank.deposit(*caller, asset, *amount)
                              : bank.withdraw(*caller, asset, *amount));
    return true;
  }
  if (command == "approve") {
    auto owner = address_arg(0);
    auto amount = amount_arg(1);
    if (!owner || !amount) {
      return false;
    }
    context.stable.approve(*owner, *amount);
    std::cout << command << ": allowance " << amount->str() << std::endl;
    return true;
  }
  if (command == "balance") {
    auto user = address_arg(0);
    auto asset = args.size() > 1 ? try_parse_asset_id(args[1]) : std::nullopt;
    if (!user || !asset) {
      return false;
    }
    std::cout << command << ": " << bank.balance_of(*user, *asset).str()
              << std::endl;
    return true;
  }
  if (command == "set-oracle") {
    auto caller = address_arg(0);
    auto reference = address_arg(1);
    if (!caller || !reference) {
      return false;
    }
    print_result(command, bank.set_oracle_reference(*caller, *reference));
    return true;
  }
  if (command == "set-bank-cap" || command == "set-global-cap") {
    auto caller = address_arg(0);
    auto value = amount_arg(1);
    if (!caller || !value) {
      return false;
    }
    print_result(command,
                 command == "set-bank-cap"
                     ? bank.set_bank_capital_ceiling(*caller, *value)
                     : bank.set_global_deposit_ceiling(*caller, *value));
    return true;
  }
  if (command == "held-value") {
    auto failure = failure_t{};
    if (auto value = bank.total_held_value(failure)) {
      std::cout << command << ": " << value->str() << std::endl;
    } else {
      std::cout << command << ": code=" << static_cast<uint32_t>(failure.code)
                << " (" << strongbox::schema::to_string(failure.code) << ") "
                << failure.message << std::endl;
    }
    return true;
  }
  if (command == "totals") {
    const auto totals = bank.totals();
    std::cout << command << ": deposits=" << totals.total_deposits.str()
              << " deposit_count=" << totals.deposit_count
              << " withdrawal_count=" << totals.withdrawal_count << std::endl;
    return true;
  }
  if (command == "events") {
    auto from = uint64_t{1};
    auto to = bank.last_event_id();
    try {
      if (args.size() > 0) {
        from = std::stoull(args[0]);
      }
      if (args.size() > 1) {
        to = std::stoull(args[1]);
      }
    } catch (const std::exception&) {
      return false;
    }
    const auto head = bank.event_head();
    std::cout << command << ": head="
              << to_hex(bytes_view_t{head.data(), head.size()})
              << (bank.verify_events() ? " verified" : " BROKEN") << std::endl;
    for (const auto& record : bank.events(from, to)) {
      print_event(record);
    }
    return true;
  }
  return false;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "strongbox.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "strongbox", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto config_path = std::string{};
  auto db_path = std::string{};
  auto script_path = std::string{};
  auto price_text = std::string{};
  auto price_updated_at = uint64_t{};
  auto fund = std::vector<std::string>{};

  auto vm = boost::program_options::variables_map{};
  auto description =
      boost::program_options::options_description{"Strongbox"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", boost::program_options::value<std::string>(&config_path),
      "INI file holding the bank options")(
      "db,d",
      boost::program_options::value<std::string>(&db_path)->default_value(
          "strongbox.db"),
      "RocksDB directory")(
      "script,s", boost::program_options::value<std::string>(&script_path),
      "File of ledger commands, one per line")(
      "fund", boost::program_options::value<std::vector<std::string>>(&fund),
      "Seed a wallet: <address>:<asset>:<amount>; stable funds are also "
      "approved for the vault")(
      "price",
      boost::program_options::value<std::string>(&price_text)->default_value(
          "200000000000"),
      "Answer published by the fixed price feed")(
      "price-updated-at",
      boost::program_options::value<uint64_t>(&price_updated_at),
      "Timestamp of the published answer; defaults to now")(
      "verbose,v", "Enable debug output");
  description.add(strongbox::config::make_bank_options());

  try {
    boost::program_options::store(
        boost::program_options::parse_command_line(argc, argv, description),
        vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        spdlog::error("Cannot open config file '{}'",
                      vm["config"].as<std::string>());
        spdlog::shutdown();
        return 1;
      }
      boost::program_options::store(
          boost::program_options::parse_config_file(file, description), vm);
    }
    boost::program_options::notify(vm);
  } catch (const boost::program_options::error& e) {
    spdlog::error("{}", e.what());
    spdlog::shutdown();
    return 1;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto error = std::string{};
  auto config = strongbox::config::make_bank_config(vm, error);
  if (!config) {
    spdlog::error("Invalid configuration: {}", error);
    spdlog::shutdown();
    return 1;
  }
  auto price = try_parse_amount(price_text);
  if (!price) {
    spdlog::error("--price must be an unsigned integer");
    spdlog::shutdown();
    return 1;
  }
  if (!vm.contains("price-updated-at")) {
    price_updated_at = wall_clock_seconds();
  }

  auto feeds = strongbox::oracle::feed_registry{};
  feeds.register_feed(config->oracle_reference,
                      std::make_shared<strongbox::oracle::fixed_price_feed>(
                          static_cast<price_t>(*price), price_updated_at));

  auto storage = strongbox::storage::make_storage<
      strongbox::storage::rocksdb_storage_tag>(db_path);
  auto native = strongbox::settlement::memory_native_channel{config->vault};
  auto stable = strongbox::settlement::memory_stable_token{config->vault};
  auto bank = strongbox::execution::bank{
      storage, *config, feeds, native, stable, wall_clock_seconds};

  native.mint(config->vault, bank.holdings(asset_id_t::native));
  stable.mint(config->vault, bank.holdings(asset_id_t::stable));
  for (const auto& entry_text : fund) {
    auto entry = parse_fund_entry(entry_text);
    if (!entry) {
      spdlog::error("Malformed --fund entry '{}'", entry_text);
      spdlog::shutdown();
      return 1;
    }
    if (entry->asset == asset_id_t::native) {
      native.mint(entry->account, entry->amount);
    } else {
      stable.mint(entry->account, entry->amount);
      stable.approve(entry->account, entry->amount);
    }
  }

  if (script_path.empty()) {
    spdlog::info("No script given; ledger opened at '{}'", db_path);
    spdlog::shutdown();
    return 0;
  }
  auto script = std::ifstream{script_path};
  if (!script) {
    spdlog::error("Cannot open script '{}'", script_path);
    spdlog::shutdown();
    return 1;
  }

  auto context = script_context_t{.bank = bank, .stable = stable};
  auto malformed = size_t{0};
  auto line_number = size_t{0};
  for (auto line = std::string{}; std::getline(script, line);) {
    ++line_number;
    if (line.empty() || line.starts_with('#')) {
      continue;
    }
    if (!run_command(context, line)) {
      spdlog::error("{}:{}: cannot run '{}'", script_path, line_number, line);
      ++malformed;
    }
  }

  spdlog::shutdown();
  return malformed == 0 ? 0 : 2;
}
