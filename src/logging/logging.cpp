#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <array>
#include <ctime>
#include <remit/common/critical.hpp>
#include <remit/logging/logging.hpp>
#include <system_error>

namespace remit::logging {

std::string make_log_file_name(const std::chrono::system_clock::time_point now) {
  auto time = std::chrono::system_clock::to_time_t(now);
  auto local = std::tm{};
  localtime_r(&time, &local);
  auto buffer = std::array<char, 32>{};
  auto size = std::strftime(buffer.data(), buffer.size(), "%Y-%m-%d_%H-%M-%S",
                            &local);
  return "remit_" + std::string{buffer.data(), size} + ".log";
}

std::optional<spdlog::level::level_enum> try_parse_level(
    const std::string_view name) {
  if (name == "off") {
    return spdlog::level::off;
  }
  // from_str maps unknown names to off.
  auto level = spdlog::level::from_str(std::string{name});
  if (level == spdlog::level::off) {
    return std::nullopt;
  }
  return level;
}

std::shared_ptr<spdlog::logger> make_logger(const log_options_t& options) {
  auto error = std::error_code{};
  std::filesystem::create_directories(options.directory, error);
  if (error) {
    remit::common::critical("cannot create log directory '" +
                            options.directory.string() +
                            "': " + error.message());
  }
  auto path =
      options.directory / make_log_file_name(std::chrono::system_clock::now());

  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink = std::shared_ptr<spdlog::sinks::basic_file_sink_mt>{};
  try {
    file_sink =
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(path.string(), false);
  } catch (const spdlog::spdlog_ex& ex) {
    remit::common::critical("cannot open log file '" + path.string() +
                            "': " + ex.what());
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "remit", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  logger->set_pattern(std::string{kLogPattern});
  logger->set_level(options.level);
  logger->flush_on(spdlog::level::err);
  return logger;
}

}  // namespace remit::logging
