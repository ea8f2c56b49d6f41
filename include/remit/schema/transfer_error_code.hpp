#pragma once

#include <array>
#include <cstdint>
#include <remit/schema/enum_string.hpp>
#include <string_view>

// Failure taxonomy for one transfer run: stable numeric codes shared by the
// validator, the credential layer, the orchestrator and the exit report.
namespace remit::schema {

enum class transfer_error_code : uint32_t {
  usage_error = 1,
  malformed_coin = 10,
  invalid_amount = 11,
  zero_amount = 12,
  invalid_denomination = 13,
  invalid_address = 14,
  address_prefix_mismatch = 15,
  credential_missing = 20,
  credential_unreadable = 21,
  credential_ambiguous = 22,
  malformed_secret_phrase = 23,
  wallet_derivation_failed = 24,
  connectivity_error = 30,
  query_error = 40,
  broadcast_error = 50,
  confirmation_timeout = 51,
  interrupted = 60,
  logical_failure = 70,
};

inline constexpr auto kTransferErrorCodeMappings = std::array{
    std::pair<std::string_view, transfer_error_code>{
        "usage_error", transfer_error_code::usage_error},
    std::pair<std::string_view, transfer_error_code>{
        "malformed_coin", transfer_error_code::malformed_coin},
    std::pair<std::string_view, transfer_error_code>{
        "invalid_amount", transfer_error_code::invalid_amount},
    std::pair<std::string_view, transfer_error_code>{
        "zero_amount", transfer_error_code::zero_amount},
    std::pair<std::string_view, transfer_error_code>{
        "invalid_denomination", transfer_error_code::invalid_denomination},
    std::pair<std::string_view, transfer_error_code>{
        "invalid_address", transfer_error_code::invalid_address},
    std::pair<std::string_view, transfer_error_code>{
        "address_prefix_mismatch",
        transfer_error_code::address_prefix_mismatch},
    std::pair<std::string_view, transfer_error_code>{
        "credential_missing", transfer_error_code::credential_missing},
    std::pair<std::string_view, transfer_error_code>{
        "credential_unreadable", transfer_error_code::credential_unreadable},
    std::pair<std::string_view, transfer_error_code>{
        "credential_ambiguous", transfer_error_code::credential_ambiguous},
    std::pair<std::string_view, transfer_error_code>{
        "malformed_secret_phrase",
        transfer_error_code::malformed_secret_phrase},
    std::pair<std::string_view, transfer_error_code>{
        "wallet_derivation_failed",
        transfer_error_code::wallet_derivation_failed},
    std::pair<std::string_view, transfer_error_code>{
        "connectivity_error", transfer_error_code::connectivity_error},
    std::pair<std::string_view, transfer_error_code>{
        "query_error", transfer_error_code::query_error},
    std::pair<std::string_view, transfer_error_code>{
        "broadcast_error", transfer_error_code::broadcast_error},
    std::pair<std::string_view, transfer_error_code>{
        "confirmation_timeout", transfer_error_code::confirmation_timeout},
    std::pair<std::string_view, transfer_error_code>{
        "interrupted", transfer_error_code::interrupted},
    std::pair<std::string_view, transfer_error_code>{
        "logical_failure", transfer_error_code::logical_failure},
};

inline constexpr std::string_view to_string(const transfer_error_code value) {
  return name_of(value, kTransferErrorCodeMappings);
}

inline constexpr uint32_t to_code(const transfer_error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace remit::schema
