#pragma once

#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace remit::logging {

inline constexpr auto kLogPattern =
    std::string_view{"%Y-%m-%d %H:%M:%S.%e [%^%l%$] [%n] %v"};

struct log_options_t final {
  std::filesystem::path directory{"logs"};
  spdlog::level::level_enum level{spdlog::level::info};
};

/// `remit_YYYY-MM-DD_HH-MM-SS.log` for the local time of `now`.
std::string make_log_file_name(std::chrono::system_clock::time_point now);

/// Parse one of trace, debug, info, warn, error, critical, off.
std::optional<spdlog::level::level_enum> try_parse_level(std::string_view name);

/// Run logger writing to stderr and to a per-run file under
/// `options.directory`. The directory is created when missing; failing to
/// create it or open the file is fatal.
std::shared_ptr<spdlog::logger> make_logger(const log_options_t& options);

}  // namespace remit::logging
