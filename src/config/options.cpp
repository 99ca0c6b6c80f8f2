#include <onlyswap/config/node_config.hpp>
#include <algorithm>
#include <array>
#include <fstream>
#include <sstream>
#include <string_view>

namespace onlyswap::config {

namespace {

inline constexpr auto kLogLevels = std::array<std::string_view, 7>{
    "trace", "debug", "info", "warn", "error", "critical", "off"};

std::optional<std::string> validate(const node_config& config) {
  if (config.src_chain_id == config.dst_chain_id) {
    return "source and destination chain ids must differ";
  }
  if (std::ranges::find(kLogLevels, config.log_level) == std::end(kLogLevels)) {
    return "unknown log level '" + config.log_level + "'";
  }
  for (const auto& [name, value] :
       std::array<std::pair<std::string_view, const std::string*>, 3>{
           {{"amount-in", &config.amount_in},
            {"amount-out", &config.amount_out},
            {"solver-fee", &config.solver_fee}}}) {
    auto amount = onlyswap::schema::try_make_amount(*value);
    if (!amount || *amount == 0) {
      return std::string{name} + " must be a positive decimal amount";
    }
  }
  return onlyswap::config::validate(config.router);
}

}  // namespace

boost::program_options::options_description make_options_description(
    node_config& config) {
  namespace po = boost::program_options;
  auto description = po::options_description{"onlyswap"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(),
      "INI style configuration file")(
      "src-chain-id", po::value(&config.src_chain_id)->default_value(1),
      "Chain id of the source ledger")(
      "dst-chain-id", po::value(&config.dst_chain_id)->default_value(2),
      "Chain id of the destination ledger")(
      "src-db",
      po::value(&config.src_db_path)->default_value("onlyswap_src.db"),
      "RocksDB path of the source ledger")(
      "dst-db",
      po::value(&config.dst_db_path)->default_value("onlyswap_dst.db"),
      "RocksDB path of the destination ledger")(
      "log-level", po::value(&config.log_level)->default_value("info"),
      "trace, debug, info, warn, error, critical or off")(
      "log-file", po::value(&config.log_file)->default_value("onlyswap.log"),
      "Log file written next to the console output")(
      "amount-in",
      po::value(&config.amount_in)->default_value("10000000000000000000"),
      "Amount the requester locks on the source ledger")(
      "amount-out",
      po::value(&config.amount_out)->default_value("9500000000000000000"),
      "Amount the solver delivers on the destination ledger")(
      "solver-fee",
      po::value(&config.solver_fee)->default_value("1000000000000000000"),
      "Fee paid to the solver on top of the refund")(
      "demo-cancellation", po::bool_switch(&config.demo_cancellation),
      "Run a staged cancellation instead of a relay")(
      "router.version",
      po::value(&config.router.version)->default_value("1.0.0"),
      "Version reported by the settlement engine")(
      "router.fee-bps",
      po::value(&config.router.verification_fee_bps)->default_value(500),
      "Verification fee in basis points")(
      "router.max-fee-bps",
      po::value(&config.router.max_fee_bps)->default_value(5000),
      "Upper bound of the verification fee")(
      "router.upgrade-delay",
      po::value(&config.router.minimum_contract_upgrade_delay)
          ->default_value(2 * onlyswap::schema::kSecondsPerDay),
      "Minimum contract upgrade delay in seconds")(
      "router.cancellation-window",
      po::value(&config.router.cancellation_window)
          ->default_value(onlyswap::schema::kSecondsPerDay),
      "Swap request cancellation window in seconds");
  return description;
}

options_result parse_options(const int argc, const char* const argv[]) {
  namespace po = boost::program_options;
  auto result = options_result{};
  auto description = make_options_description(result.config);

  auto help = std::ostringstream{};
  help << description;
  result.help = help.str();

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      auto file = std::ifstream{path};
      if (!file) {
        result.error = "cannot open config file " + path;
        return result;
      }
      po::store(po::parse_config_file(file, description), vm);
    }
    po::notify(vm);
  } catch (const po::error& e) {
    result.error = e.what();
    return result;
  }

  if (vm.contains("help")) {
    result.help_requested = true;
    return result;
  }
  if (auto error = validate(result.config)) {
    result.error = *error;
  }
  return result;
}

}  // namespace onlyswap::config
