#include <csignal>
#include <spdlog/spdlog.h>
#include <atomic>
#include <iostream>
#include <remit/chain/grpc/client.hpp>
#include <remit/config/options.hpp>
#include <remit/execution/orchestrator.hpp>
#include <remit/execution/report.hpp>
#include <remit/logging/logging.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/validation/validator.hpp>
#include <string>

using remit::schema::transfer_error_code;

std::atomic<bool>& interrupt_requested() {
  static std::atomic<bool> requested{};
  return requested;
}

void signal_handler(int) {
  interrupt_requested() = true;
}

namespace {

constexpr auto kExitSuccess = 0;
constexpr auto kExitFailure = 1;
constexpr auto kExitUsage = 2;

remit::validation::validation_result_t usage_failure(std::string log) {
  return remit::validation::validation_result_t{
      .code = remit::schema::to_code(transfer_error_code::usage_error),
      .field = remit::validation::input_field::arguments,
      .log = std::move(log),
      .request = std::nullopt};
}

// Picks the validator entry point matching how the coin and destination were
// supplied.
remit::validation::validation_result_t validate_input(
    const remit::config::options_t& options,
    const remit::validation::validator& validator) {
  const auto& positional = options.positional;
  if (options.amount) {
    if (options.destination) {
      if (!positional.empty()) {
        return usage_failure(
            "unexpected positional arguments with --amount, --denom and "
            "--destination");
      }
      return validator.validate(*options.amount, *options.denomination,
                                *options.destination);
    }
    if (positional.size() != 1) {
      return usage_failure(
          "expected exactly 1 argument (<address>) with --amount and "
          "--denom, got " +
          std::to_string(positional.size()));
    }
    return validator.validate(*options.amount, *options.denomination,
                              positional[0]);
  }
  if (options.destination) {
    if (positional.size() != 1) {
      return usage_failure(
          "expected exactly 1 argument (<amount><token>) with "
          "--destination, got " +
          std::to_string(positional.size()));
    }
    return validator.validate(std::string_view{positional[0]},
                              std::string_view{*options.destination});
  }
  return validator.validate(std::span<const std::string>{positional});
}

}  // namespace

int main(int argc, char* argv[]) {
  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  auto parsed = remit::config::parse_options(argc, argv);
  if (parsed.code != 0) {
    std::cerr << "remit: " << parsed.log << "\nTry 'remit --help'.\n";
    return kExitUsage;
  }
  const auto& options = *parsed.options;
  if (options.help) {
    std::cout << options.help_text << std::endl;
    return kExitSuccess;
  }

  auto logger = remit::logging::make_logger(options.log);
  spdlog::set_default_logger(logger);

  auto validator_options = remit::validation::validator_options_t{};
  if (!options.skip_address_check) {
    validator_options.address_prefix = options.network.address_prefix;
  }
  auto validator = remit::validation::validator{validator_options};
  auto validated = validate_input(options, validator);
  if (validated.code != 0) {
    logger->error("validation failed ({}): {}",
                  remit::validation::to_string(validated.field),
                  validated.log);
    spdlog::shutdown();
    return validated.code ==
                   remit::schema::to_code(transfer_error_code::usage_error)
               ? kExitUsage
               : kExitFailure;
  }

  auto connector = remit::chain::grpc_connector{};
  auto orchestrator = remit::execution::orchestrator{
      connector, options.network, options.credential, logger,
      interrupt_requested()};
  orchestrator.set_balance_check(options.balance_check);
  auto result = orchestrator.execute(*validated.request);

  auto exit_code = result.code == 0 ? kExitSuccess : kExitFailure;
  if (result.receipt) {
    auto error = std::string{};
    auto json = remit::execution::render_report(*result.receipt, error);
    if (!json) {
      logger->error("{}", error);
      exit_code = kExitFailure;
    } else {
      if (result.code == 0) {
        logger->info("report {}", *json);
      } else {
        logger->error("report {}", *json);
      }
      std::cout << *json << std::endl;
      if (options.report_file &&
          !remit::execution::write_report(*options.report_file, *json,
                                          error)) {
        logger->error("{}", error);
        exit_code = kExitFailure;
      }
    }
  }

  spdlog::shutdown();
  return exit_code;
}
