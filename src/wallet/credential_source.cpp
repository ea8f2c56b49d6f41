#include <remit/crypto/hash.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/wallet/credential_source.hpp>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iterator>
#include <system_error>

namespace remit::wallet {

namespace {

using remit::schema::transfer_error_code;

void wipe(std::string& secret) {
  if (!secret.empty()) {
    remit::crypto::cleanse(secret.data(), secret.size());
  }
  secret.clear();
}

credential_result_t fail(const transfer_error_code code, std::string log) {
  return credential_result_t{.code = remit::schema::to_code(code),
                             .log = std::move(log),
                             .phrase = std::nullopt};
}

std::string trim_ascii_whitespace(std::string input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  auto trimmed = input.substr(first, last - first);
  wipe(input);
  return trimmed;
}

credential_result_t accept(std::string raw, const std::string& where) {
  auto trimmed = secret_phrase_t{trim_ascii_whitespace(std::move(raw))};
  if (trimmed.empty()) {
    return fail(transfer_error_code::credential_missing,
                where + " is empty; it must contain the secret recovery phrase");
  }
  return credential_result_t{.code = 0, .log = {}, .phrase = std::move(trimmed)};
}

credential_result_t resolve_file(const file_credential_t& source) {
  auto error = std::error_code{};
  auto where = describe(credential_source_t{source});
  if (!std::filesystem::exists(source.path, error)) {
    return fail(transfer_error_code::credential_missing,
                "cannot find " + where +
                    ". Create it with your secret recovery phrase on a single "
                    "line (words separated by spaces), or use --mnemonic-env "
                    "to read the phrase from an environment variable");
  }
  if (std::filesystem::is_directory(source.path, error)) {
    return fail(transfer_error_code::credential_unreadable,
                where + " is a directory, expected a file");
  }

  auto input = std::ifstream{source.path, std::ios::binary};
  if (!input.good()) {
    return fail(transfer_error_code::credential_unreadable,
                "failed opening " + where);
  }
  auto content = std::string{std::istreambuf_iterator<char>{input},
                             std::istreambuf_iterator<char>{}};
  if (input.bad()) {
    wipe(content);
    return fail(transfer_error_code::credential_unreadable,
                "failed reading " + where);
  }
  return accept(std::move(content), where);
}

credential_result_t resolve_env(const env_credential_t& source) {
  auto where = describe(credential_source_t{source});
  if (source.name.empty()) {
    return fail(transfer_error_code::credential_missing,
                "no environment variable name configured for the secret "
                "recovery phrase");
  }
  const auto* value = std::getenv(source.name.c_str());
  if (value == nullptr) {
    return fail(transfer_error_code::credential_missing,
                where + " is not set. Export it with your secret recovery "
                        "phrase, or use --mnemonic-file");
  }
  return accept(std::string{value}, where);
}

}  // namespace

credential_result_t resolve_credential(const credential_source_t& source) {
  return std::visit(
      overloaded{
          [](const file_credential_t& file) { return resolve_file(file); },
          [](const env_credential_t& env) { return resolve_env(env); }},
      source);
}

std::string describe(const credential_source_t& source) {
  return std::visit(
      overloaded{[](const file_credential_t& file) {
                   return "wallet key file '" + file.path.string() + "'";
                 },
                 [](const env_credential_t& env) {
                   return "environment variable '" + env.name + "'";
                 }},
      source);
}

}  // namespace remit::wallet
