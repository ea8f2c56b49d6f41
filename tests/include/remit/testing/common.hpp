#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace remit::testing {

/// BIP-39 test phrase; derives cosmos19rl4cm2hmr8afy4kldpxz3fka4jguq0auqdal4.
inline constexpr auto kTestPhrase = std::string_view{
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon "
    "abandon abandon about"};
inline constexpr auto kTestCosmosAddress =
    std::string_view{"cosmos19rl4cm2hmr8afy4kldpxz3fka4jguq0auqdal4"};

inline std::filesystem::path make_temp_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  return std::filesystem::temp_directory_path() /
         (std::string{prefix} + "_" +
          std::to_string(static_cast<unsigned long long>(now)));
}

inline void remove_path(const std::filesystem::path& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline void write_file(const std::filesystem::path& path,
                       const std::string_view content) {
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path());
  }
  auto out = std::ofstream{path, std::ios::binary | std::ios::trunc};
  out << content;
}

inline std::string read_file(const std::filesystem::path& path) {
  auto in = std::ifstream{path, std::ios::binary};
  return std::string{std::istreambuf_iterator<char>{in},
                     std::istreambuf_iterator<char>{}};
}

/// Sets an environment variable for the lifetime of the object.
class scoped_env final {
 public:
  scoped_env(std::string name, const std::optional<std::string>& value)
      : name_{std::move(name)} {
    if (const auto* previous = std::getenv(name_.c_str())) {
      previous_ = std::string{previous};
    }
    if (value) {
      ::setenv(name_.c_str(), value->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }
  scoped_env(const scoped_env&) = delete;
  scoped_env& operator=(const scoped_env&) = delete;
  ~scoped_env() {
    if (previous_) {
      ::setenv(name_.c_str(), previous_->c_str(), 1);
    } else {
      ::unsetenv(name_.c_str());
    }
  }

 private:
  std::string name_;
  std::optional<std::string> previous_;
};

}  // namespace remit::testing
