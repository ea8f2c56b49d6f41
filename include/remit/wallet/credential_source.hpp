#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <remit/wallet/secret_phrase.hpp>
#include <string>
#include <string_view>
#include <variant>

namespace remit::wallet {

inline constexpr auto kDefaultWalletKeyPath =
    std::string_view{"wallet/wallet.key"};

/// Secret phrase stored as the full content of a file.
struct file_credential_t final {
  std::filesystem::path path;
};

/// Secret phrase stored directly in an environment variable.
struct env_credential_t final {
  std::string name;
};

using credential_source_t = std::variant<file_credential_t, env_credential_t>;

/// Result of reading the secret from its configured source. `phrase` is set
/// only when `code` is 0.
struct credential_result_t final {
  uint32_t code{};
  std::string log;
  std::optional<secret_phrase_t> phrase;
};

/// Read the phrase once, trimming surrounding whitespace. Missing, unreadable
/// and empty sources are distinct failures; none of them echo secret content.
credential_result_t resolve_credential(const credential_source_t& source);

/// Human-readable description of where the secret comes from, safe to log.
std::string describe(const credential_source_t& source);

}  // namespace remit::wallet
