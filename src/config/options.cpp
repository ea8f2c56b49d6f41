#include <boost/program_options.hpp>
#include <cmath>
#include <remit/config/options.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <sstream>

namespace po = boost::program_options;

using namespace remit::schema;

namespace remit::config {

namespace {

parse_result_t usage(const transfer_error_code code, std::string log) {
  return parse_result_t{
      .code = to_code(code), .log = std::move(log), .options = std::nullopt};
}

po::options_description make_transfer_options() {
  auto options = po::options_description{"Transfer"};
  options.add_options()(
      "amount", po::value<std::string>(),
      "amount in base units; use with --denom instead of <coin>")(
      "denom", po::value<std::string>(), "denomination for --amount")(
      "destination", po::value<std::string>(),
      "destination address instead of the positional one")(
      "memo", po::value<std::string>()->default_value(""),
      "transaction memo")(
      "skip-address-check",
      "accept any charset-valid destination, not only bech32 with the "
      "network prefix")(
      "balance-check", po::value<std::string>()->default_value("fatal"),
      "fatal|advisory: whether a failed destination balance lookup aborts");
  return options;
}

po::options_description make_network_options() {
  auto options = po::options_description{"Network"};
  options.add_options()(
      "network", po::value<std::string>()->default_value("osmosis-testnet"),
      "osmosis-testnet|osmosis-mainnet|cosmos-hub|local")(
      "grpc-endpoint", po::value<std::string>(), "host:port of the node")(
      "chain-id", po::value<std::string>(), "chain id override")(
      "address-prefix", po::value<std::string>(), "bech32 prefix override")(
      "fee-denom", po::value<std::string>(), "fee denomination override")(
      "gas-price", po::value<double>(), "fee per unit of gas")(
      "gas-multiplier", po::value<double>(),
      "factor applied to simulated gas")(
      "tls", po::value<bool>(), "use TLS for the gRPC channel")(
      "request-timeout-ms", po::value<uint64_t>()->default_value(15000),
      "deadline for each call to the node")(
      "confirmation-timeout-ms", po::value<uint64_t>()->default_value(60000),
      "how long to wait for the transaction to be included")(
      "poll-interval-ms", po::value<uint64_t>()->default_value(1000),
      "delay between inclusion checks");
  return options;
}

po::options_description make_credential_options() {
  auto options = po::options_description{"Credential"};
  options.add_options()(
      "mnemonic-file", po::value<std::string>(),
      "file holding the secret recovery phrase (default wallet/wallet.key)")(
      "mnemonic-env", po::value<std::string>(),
      "environment variable holding the secret recovery phrase");
  return options;
}

po::options_description make_output_options() {
  auto options = po::options_description{"Output"};
  options.add_options()(
      "log-dir", po::value<std::string>()->default_value("logs"),
      "directory for per-run log files")(
      "log-level", po::value<std::string>()->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "report-file", po::value<std::string>(),
      "also write the JSON report to this file");
  return options;
}

std::string make_help_text(const po::options_description& visible) {
  auto out = std::ostringstream{};
  out << "Usage:\n"
      << "  remit [options] <amount><denom> <destination>\n"
      << "  remit [options] --amount <digits> --denom <denom> <destination>\n\n"
      << visible;
  return out.str();
}

}  // namespace

parse_result_t parse_options(const int argc, const char* const* argv) {
  auto generic = po::options_description{"Generic"};
  generic.add_options()("help,h", "show help")(
      "verbose,v", "debug logging")(
      "config", po::value<std::string>(),
      "config file with any of the options below");

  auto configurable = po::options_description{};
  configurable.add(make_transfer_options())
      .add(make_network_options())
      .add(make_credential_options())
      .add(make_output_options());

  auto hidden = po::options_description{};
  hidden.add_options()("args", po::value<std::vector<std::string>>(),
                       "positional arguments");

  auto command_line = po::options_description{};
  command_line.add(generic).add(configurable).add(hidden);

  auto visible = po::options_description{};
  visible.add(generic).add(configurable);

  auto positional = po::positional_options_description{};
  positional.add("args", -1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(command_line)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file<char>(
                    vm["config"].as<std::string>().c_str(), configurable),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    return usage(transfer_error_code::usage_error, ex.what());
  }

  auto options = options_t{};
  if (vm.contains("help")) {
    options.help = true;
    options.help_text = make_help_text(visible);
    return parse_result_t{.code = 0, .log = {}, .options = std::move(options)};
  }

  if (vm.contains("args")) {
    options.positional = vm["args"].as<std::vector<std::string>>();
  }
  if (vm.contains("amount")) {
    options.amount = vm["amount"].as<std::string>();
  }
  if (vm.contains("denom")) {
    options.denomination = vm["denom"].as<std::string>();
  }
  if (options.amount.has_value() != options.denomination.has_value()) {
    return usage(transfer_error_code::usage_error,
                 "--amount and --denom must be given together");
  }
  if (vm.contains("destination")) {
    options.destination = vm["destination"].as<std::string>();
  }

  auto network_name = vm["network"].as<std::string>();
  auto network = try_from_string<network_id>(network_name);
  if (!network) {
    return usage(transfer_error_code::usage_error,
                 "unknown network '" + network_name + "'");
  }
  options.network = make_network(*network);
  if (vm.contains("grpc-endpoint")) {
    options.network.grpc_endpoint = vm["grpc-endpoint"].as<std::string>();
  }
  if (vm.contains("chain-id")) {
    options.network.chain_id = vm["chain-id"].as<std::string>();
  }
  if (vm.contains("address-prefix")) {
    options.network.address_prefix = vm["address-prefix"].as<std::string>();
  }
  if (vm.contains("fee-denom")) {
    options.network.fee_denom = vm["fee-denom"].as<std::string>();
  }
  if (vm.contains("gas-price")) {
    options.network.gas_price = vm["gas-price"].as<double>();
  }
  if (vm.contains("gas-multiplier")) {
    options.network.gas_multiplier = vm["gas-multiplier"].as<double>();
  }
  if (vm.contains("tls")) {
    options.network.use_tls = vm["tls"].as<bool>();
  }
  options.network.request_timeout = vm["request-timeout-ms"].as<uint64_t>();
  options.network.confirmation_timeout =
      vm["confirmation-timeout-ms"].as<uint64_t>();
  options.network.poll_interval = vm["poll-interval-ms"].as<uint64_t>();
  options.network.memo = vm["memo"].as<std::string>();

  if (!(options.network.gas_price >= 0.0) ||
      !std::isfinite(options.network.gas_price)) {
    return usage(transfer_error_code::usage_error,
                 "--gas-price must be a finite, non-negative number");
  }
  if (!(options.network.gas_multiplier > 0.0) ||
      !std::isfinite(options.network.gas_multiplier)) {
    return usage(transfer_error_code::usage_error,
                 "--gas-multiplier must be a finite, positive number");
  }
  if (options.network.request_timeout == 0 ||
      options.network.poll_interval == 0) {
    return usage(transfer_error_code::usage_error,
                 "--request-timeout-ms and --poll-interval-ms must be positive");
  }

  if (vm.contains("mnemonic-file") && vm.contains("mnemonic-env")) {
    return usage(transfer_error_code::credential_ambiguous,
                 "--mnemonic-file and --mnemonic-env are mutually exclusive");
  }
  if (vm.contains("mnemonic-file")) {
    options.credential = remit::wallet::file_credential_t{
        std::filesystem::path{vm["mnemonic-file"].as<std::string>()}};
  } else if (vm.contains("mnemonic-env")) {
    options.credential = remit::wallet::env_credential_t{
        vm["mnemonic-env"].as<std::string>()};
  }

  auto policy_name = vm["balance-check"].as<std::string>();
  auto policy = from_string(policy_name,
                            remit::execution::kBalanceCheckPolicyMappings);
  if (!policy) {
    return usage(transfer_error_code::usage_error,
                 "unknown --balance-check '" + policy_name + "'");
  }
  options.balance_check = *policy;
  options.skip_address_check = vm.contains("skip-address-check");

  if (vm.contains("report-file")) {
    options.report_file =
        std::filesystem::path{vm["report-file"].as<std::string>()};
  }

  options.log.directory =
      std::filesystem::path{vm["log-dir"].as<std::string>()};
  auto level_name = vm["log-level"].as<std::string>();
  auto level = remit::logging::try_parse_level(level_name);
  if (!level) {
    return usage(transfer_error_code::usage_error,
                 "unknown --log-level '" + level_name + "'");
  }
  options.log.level = *level;
  if (vm.contains("verbose")) {
    options.log.level = spdlog::level::debug;
  }

  return parse_result_t{.code = 0, .log = {}, .options = std::move(options)};
}

}  // namespace remit::config
