#pragma once

#include <cstdint>
#include <optional>
#include <remit/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace remit::wallet {

/// Position of `word` in the BIP-39 English wordlist.
std::optional<uint16_t> find_bip39_word(std::string_view word);

/// Decode a BIP-39 English phrase to its entropy.
///
/// The phrase must have 12, 15, 18, 21 or 24 whitespace-separated words, each
/// in the wordlist, and the trailing checksum bits must equal the leading bits
/// of SHA-256(entropy). On failure `error` names the offending word by
/// position only. The caller owns the returned secret and should cleanse it.
std::optional<remit::schema::bytes_t> decode_phrase(std::string_view phrase,
                                                    std::string& error);

}  // namespace remit::wallet
