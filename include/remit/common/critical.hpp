#pragma once

#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

namespace remit::common {

/// Report an unrecoverable setup failure and end the process with exit code 1.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::exit(EXIT_FAILURE);
}

}  // namespace remit::common
