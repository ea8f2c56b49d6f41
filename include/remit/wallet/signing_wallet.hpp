#pragma once

#include <cstdint>
#include <optional>
#include <remit/crypto/secp256k1.hpp>
#include <remit/schema/primitives.hpp>
#include <remit/wallet/secret_phrase.hpp>
#include <string>
#include <string_view>

namespace remit::wallet {

/// Cosmos SDK default account path (coin type 118, first account).
inline constexpr auto kCosmosDerivationPath =
    std::string_view{"m/44'/118'/0'/0/0"};

class signing_wallet;

struct wallet_result_t;

/// Derive the signing wallet for `phrase` whose address uses `address_prefix`.
///
/// Malformed phrases yield `malformed_secret_phrase`; any other derivation
/// failure (bad prefix, crypto backend error) yields
/// `wallet_derivation_failed`.
wallet_result_t derive_wallet(const secret_phrase_t& phrase,
                              std::string_view address_prefix);

/// Public address plus signing capability derived from a secret phrase.
///
/// Private key bytes never leave this object and are cleansed on destruction.
class signing_wallet final {
 public:
  signing_wallet(const signing_wallet&) = delete;
  signing_wallet& operator=(const signing_wallet&) = delete;
  signing_wallet(signing_wallet&& other) noexcept;
  signing_wallet& operator=(signing_wallet&& other) noexcept;
  ~signing_wallet();

  const std::string& address() const { return address_; }
  const remit::crypto::public_key_t& public_key() const { return public_key_; }

  /// secp256k1 signature over SHA-256(message).
  std::optional<remit::crypto::compact_signature_t> sign(
      const remit::schema::bytes_view_t& message) const;

 private:
  friend wallet_result_t derive_wallet(const secret_phrase_t& phrase,
                                       std::string_view address_prefix);

  signing_wallet(const remit::crypto::private_key_t& private_key,
                 const remit::crypto::public_key_t& public_key,
                 std::string address);

  remit::crypto::private_key_t private_key_{};
  remit::crypto::public_key_t public_key_{};
  std::string address_;
};

using signing_wallet_t = signing_wallet;

struct wallet_result_t final {
  uint32_t code{};
  std::string log;
  std::optional<signing_wallet_t> wallet;
};

/// True when `phrase` decodes as a BIP-39 English phrase with a valid
/// checksum.
bool is_well_formed_phrase(std::string_view phrase);

/// Address for a compressed secp256k1 public key under `address_prefix`.
std::optional<std::string> make_address(
    const remit::crypto::public_key_t& public_key,
    std::string_view address_prefix);

}  // namespace remit::wallet
