#pragma once

#include <optional>
#include <remit/schema/primitives.hpp>
#include <string>
#include <string_view>

// BIP-173 bech32 as used by Cosmos SDK account addresses.
namespace remit::encoding {

struct bech32_decoded_t final {
  std::string hrp;
  /// Payload regrouped to 8-bit bytes.
  remit::schema::bytes_t data;
};

/// Encode 8-bit `data` under `hrp`. Returns std::nullopt for an empty or
/// non-printable hrp.
std::optional<std::string> bech32_encode(std::string_view hrp,
                                         const remit::schema::bytes_view_t& data);

/// Decode and verify the checksum. Mixed case, bad characters, bad padding
/// and strings over 90 characters are rejected. The returned hrp is lower
/// case.
std::optional<bech32_decoded_t> bech32_decode(std::string_view encoded);

}  // namespace remit::encoding
