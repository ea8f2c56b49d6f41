#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <remit/crypto/secp256k1.hpp>
#include <remit/schema/primitives.hpp>
#include <span>
#include <string_view>
#include <vector>

// BIP-32 private key derivation over secp256k1.
namespace remit::crypto {

inline constexpr auto kHardenedIndex = uint32_t{0x80000000u};

struct extended_private_key final {
  extended_private_key() = default;
  extended_private_key(const extended_private_key&) = default;
  extended_private_key& operator=(const extended_private_key&) = default;
  ~extended_private_key();

  private_key_t key{};
  std::array<uint8_t, 32> chain_code{};
};

using extended_private_key_t = extended_private_key;

std::optional<extended_private_key_t> make_master_key(
    const remit::schema::bytes_view_t& seed);

std::optional<extended_private_key_t> derive_child(
    const extended_private_key_t& parent,
    uint32_t index);

std::optional<extended_private_key_t> derive_path(
    const remit::schema::bytes_view_t& seed,
    std::span<const uint32_t> path);

/// Parse "m/44'/118'/0'/0/0" style paths; `'` or `h` marks hardened steps.
std::optional<std::vector<uint32_t>> parse_derivation_path(
    std::string_view path);

}  // namespace remit::crypto
