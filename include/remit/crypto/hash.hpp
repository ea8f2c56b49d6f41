#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <remit/schema/primitives.hpp>
#include <string_view>

namespace remit::crypto {

using sha512_t = std::array<uint8_t, 64>;

remit::schema::hash32_t sha256(const remit::schema::bytes_view_t& data);
remit::schema::hash20_t ripemd160(const remit::schema::bytes_view_t& data);

/// RIPEMD160(SHA256(data)), the Cosmos SDK secp256k1 address hash.
remit::schema::hash20_t hash160(const remit::schema::bytes_view_t& data);

sha512_t hmac_sha512(const remit::schema::bytes_view_t& key,
                     const remit::schema::bytes_view_t& data);

std::optional<sha512_t> pbkdf2_hmac_sha512(std::string_view password,
                                           std::string_view salt,
                                           uint32_t iterations);

/// Overwrite memory that held secret material.
void cleanse(void* data, std::size_t size);

}  // namespace remit::crypto
