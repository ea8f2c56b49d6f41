#include <gtest/gtest.h>
#include <remit/logging/logging.hpp>
#include <remit/testing/common.hpp>

#include <ctime>
#include <filesystem>
#include <string>

using remit::logging::try_parse_level;

TEST(logging, log_file_name_uses_local_time) {
  auto local = std::tm{};
  local.tm_year = 2024 - 1900;
  local.tm_mon = 2;
  local.tm_mday = 5;
  local.tm_hour = 7;
  local.tm_min = 8;
  local.tm_sec = 9;
  local.tm_isdst = -1;
  auto now = std::chrono::system_clock::from_time_t(std::mktime(&local));

  EXPECT_EQ(remit::logging::make_log_file_name(now),
            "remit_2024-03-05_07-08-09.log");
}

TEST(logging, parses_level_names) {
  EXPECT_EQ(try_parse_level("trace"), spdlog::level::trace);
  EXPECT_EQ(try_parse_level("debug"), spdlog::level::debug);
  EXPECT_EQ(try_parse_level("info"), spdlog::level::info);
  EXPECT_EQ(try_parse_level("warn"), spdlog::level::warn);
  EXPECT_EQ(try_parse_level("error"), spdlog::level::err);
  EXPECT_EQ(try_parse_level("critical"), spdlog::level::critical);
  EXPECT_EQ(try_parse_level("off"), spdlog::level::off);
  EXPECT_FALSE(try_parse_level("verbose").has_value());
  EXPECT_FALSE(try_parse_level("").has_value());
}

TEST(logging, make_logger_creates_directory_and_run_file) {
  auto dir = remit::testing::make_temp_path("remit_logging") / "nested";
  auto logger = remit::logging::make_logger(
      remit::logging::log_options_t{.directory = dir,
                                    .level = spdlog::level::warn});
  ASSERT_NE(logger, nullptr);
  EXPECT_EQ(logger->name(), "remit");
  EXPECT_EQ(logger->level(), spdlog::level::warn);

  auto files = 0;
  for (const auto& entry : std::filesystem::directory_iterator{dir}) {
    auto name = entry.path().filename().string();
    EXPECT_EQ(name.rfind("remit_", 0), 0u) << name;
    EXPECT_EQ(entry.path().extension(), ".log");
    ++files;
  }
  EXPECT_EQ(files, 1);

  logger.reset();
  remit::testing::remove_path(dir.parent_path());
}
