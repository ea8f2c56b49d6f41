#include <remit/encoding/bech32.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/validation/validator.hpp>

#include <utility>

namespace remit::validation {

namespace {

using remit::schema::transfer_error_code;

constexpr auto kExpectedPositionalCount = std::size_t{2};

bool is_digit(const char c) {
  return c >= '0' && c <= '9';
}

bool is_letter(const char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

validation_result_t fail(const transfer_error_code code,
                         const input_field field,
                         std::string log) {
  return validation_result_t{.code = remit::schema::to_code(code),
                             .field = field,
                             .log = std::move(log),
                             .request = std::nullopt};
}

}  // namespace

std::string_view to_string(const input_field field) {
  switch (field) {
    case input_field::arguments:
      return "arguments";
    case input_field::coin:
      return "amount/token";
    case input_field::amount:
      return "amount";
    case input_field::denomination:
      return "token";
    case input_field::destination:
      return "address";
    case input_field::none:
    default:
      return "none";
  }
}

std::optional<std::pair<std::string_view, std::string_view>> split_coin(
    const std::string_view coin) {
  auto i = std::size_t{0};
  while (i < coin.size() && is_digit(coin[i])) {
    ++i;
  }
  auto digits_end = i;
  if (digits_end == 0) {
    return std::nullopt;
  }

  while (i < coin.size() && is_letter(coin[i])) {
    ++i;
  }
  if (i == digits_end) {
    return std::nullopt;
  }

  // Optional "-<digits>" groups, e.g. "ERC-20".
  while (i < coin.size()) {
    if (coin[i] != '-') {
      return std::nullopt;
    }
    ++i;
    auto group_start = i;
    while (i < coin.size() && is_digit(coin[i])) {
      ++i;
    }
    if (i == group_start) {
      return std::nullopt;
    }
  }

  return std::pair{coin.substr(0, digits_end), coin.substr(digits_end)};
}

bool is_restricted_identifier(const std::string_view value) {
  if (value.empty()) {
    return false;
  }
  for (const auto c : value) {
    if (!is_digit(c) && !is_letter(c) && c != '-' && c != '_') {
      return false;
    }
  }
  return true;
}

validator::validator(validator_options_t options)
    : options_{std::move(options)} {}

validation_result_t validator::validate(
    const std::span<const std::string> positional) const {
  if (positional.size() != kExpectedPositionalCount) {
    return fail(transfer_error_code::usage_error, input_field::arguments,
                "expected exactly " + std::to_string(kExpectedPositionalCount) +
                    " arguments (<amount><token> <address>), got " +
                    std::to_string(positional.size()));
  }
  return validate(std::string_view{positional[0]},
                  std::string_view{positional[1]});
}

validation_result_t validator::validate(
    const std::string_view coin,
    const std::string_view destination) const {
  auto parts = split_coin(coin);
  if (!parts) {
    return fail(transfer_error_code::malformed_coin, input_field::coin,
                "malformed amount/token '" + std::string{coin} +
                    "': expected digits followed by a token symbol, e.g. "
                    "100uosmo or 1000ERC-20");
  }
  return validate(parts->first, parts->second, destination);
}

validation_result_t validator::validate(
    const std::string_view amount,
    const std::string_view denomination,
    const std::string_view destination) const {
  auto parsed = remit::schema::try_make_amount(amount);
  if (!parsed) {
    return fail(transfer_error_code::invalid_amount, input_field::amount,
                "invalid amount '" + std::string{amount} +
                    "': expected an unsigned integer below 2^256");
  }
  if (parsed->is_zero()) {
    return fail(transfer_error_code::zero_amount, input_field::amount,
                "invalid amount: a transfer must move more than zero units");
  }

  if (!is_restricted_identifier(denomination)) {
    return fail(transfer_error_code::invalid_denomination,
                input_field::denomination,
                "invalid token '" + std::string{denomination} +
                    "': only letters, digits, '-' and '_' are allowed");
  }

  if (!is_restricted_identifier(destination)) {
    return fail(transfer_error_code::invalid_address, input_field::destination,
                "invalid address format: only letters, digits, '-' and '_' "
                "are allowed");
  }

  if (options_.address_prefix) {
    auto decoded = remit::encoding::bech32_decode(destination);
    if (!decoded) {
      return fail(transfer_error_code::invalid_address,
                  input_field::destination,
                  "invalid address format: '" + std::string{destination} +
                      "' is not a valid bech32 address");
    }
    if (decoded->hrp != *options_.address_prefix) {
      return fail(transfer_error_code::address_prefix_mismatch,
                  input_field::destination,
                  "invalid address format: expected prefix '" +
                      *options_.address_prefix + "', got '" + decoded->hrp +
                      "'");
    }
  }

  return validation_result_t{
      .code = 0,
      .field = input_field::none,
      .log = {},
      .request = remit::schema::transaction_request_t{
          *parsed, std::string{denomination}, std::string{destination}}};
}

}  // namespace remit::validation
