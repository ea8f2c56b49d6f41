#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <remit/schema/primitives.hpp>

namespace remit::crypto {

using private_key_t = std::array<uint8_t, 32>;
using public_key_t = std::array<uint8_t, 33>;
using compact_signature_t = std::array<uint8_t, 64>;

/// Compressed SEC1 public key for `private_key`; std::nullopt when the scalar
/// is zero or not below the curve order.
std::optional<public_key_t> derive_public_key(const private_key_t& private_key);

/// ECDSA over SHA-256(message), returned as `r || s` with s normalized to the
/// lower half of the curve order.
std::optional<compact_signature_t> sign(
    const remit::schema::bytes_view_t& message,
    const private_key_t& private_key);

/// Verify a compact `r || s` signature over SHA-256(message). High-S
/// signatures are rejected.
bool verify(const remit::schema::bytes_view_t& message,
            const public_key_t& public_key,
            const compact_signature_t& signature);

}  // namespace remit::crypto
