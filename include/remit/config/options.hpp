#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <remit/execution/orchestrator.hpp>
#include <remit/logging/logging.hpp>
#include <remit/schema/network.hpp>
#include <remit/wallet/credential_source.hpp>
#include <string>
#include <vector>

namespace remit::config {

/// Everything one run needs, resolved from the command line and an optional
/// config file. Transfer inputs are kept as raw strings; the validator owns
/// their interpretation.
struct options_t final {
  bool help{false};
  std::string help_text;

  std::vector<std::string> positional;
  std::optional<std::string> amount;
  std::optional<std::string> denomination;
  std::optional<std::string> destination;

  remit::schema::network_t network;
  remit::wallet::credential_source_t credential{
      remit::wallet::file_credential_t{
          std::filesystem::path{remit::wallet::kDefaultWalletKeyPath}}};
  remit::execution::balance_check_policy balance_check{
      remit::execution::balance_check_policy::fatal};
  bool skip_address_check{false};
  std::optional<std::filesystem::path> report_file;
  remit::logging::log_options_t log;
};

/// `options` is set only when `code` is 0. A non-zero code is always a usage
/// problem: unknown or malformed options, conflicting credential sources, or
/// out-of-range numeric settings.
struct parse_result_t final {
  uint32_t code{};
  std::string log;
  std::optional<options_t> options;
};

parse_result_t parse_options(int argc, const char* const* argv);

}  // namespace remit::config
