#pragma once

#include <cstdint>
#include <optional>
#include <remit/schema/transaction_request.hpp>
#include <span>
#include <string>
#include <string_view>

namespace remit::validation {

/// Which input a validation failure refers to.
enum class input_field : uint8_t {
  none = 0,
  arguments = 1,
  coin = 2,
  amount = 3,
  denomination = 4,
  destination = 5,
};

std::string_view to_string(input_field field);

/// Result of validating one transfer's inputs. `request` is set only when
/// `code` is 0; there is no partially-valid result.
struct validation_result_t final {
  uint32_t code{};
  input_field field{input_field::none};
  std::string log;
  std::optional<remit::schema::transaction_request_t> request;
};

struct validator_options_t final {
  /// When set, the destination must also be a bech32 address with this
  /// human-readable part.
  std::optional<std::string> address_prefix;
};

/// Turns untrusted command-line input into a transaction request.
///
/// Validation is pure: it performs no I/O and returns the same result for the
/// same input. Rules are checked in order and the first failure wins.
class validator final {
 public:
  validator() = default;
  explicit validator(validator_options_t options);

  /// Positional form: exactly two fields, `<amount><denom>` and
  /// `<destination>`.
  validation_result_t validate(std::span<const std::string> positional) const;

  /// Combined `<amount><denom>` string plus destination.
  validation_result_t validate(std::string_view coin,
                               std::string_view destination) const;

  /// Already-separated amount and denomination plus destination.
  validation_result_t validate(std::string_view amount,
                               std::string_view denomination,
                               std::string_view destination) const;

 private:
  validator_options_t options_;
};

/// Splits `<digits><letters>(-<digits>)*` into amount digits and denomination.
/// Returns std::nullopt when the input does not have that shape.
std::optional<std::pair<std::string_view, std::string_view>> split_coin(
    std::string_view coin);

/// Letters, digits, '-' and '_' only; non-empty.
bool is_restricted_identifier(std::string_view value);

}  // namespace remit::validation
