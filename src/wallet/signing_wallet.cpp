#include <remit/crypto/bip32.hpp>
#include <remit/crypto/hash.hpp>
#include <remit/encoding/bech32.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/wallet/mnemonic.hpp>
#include <remit/wallet/signing_wallet.hpp>

#include <utility>

namespace remit::wallet {

namespace {

using remit::schema::transfer_error_code;

constexpr auto kSeedSalt = std::string_view{"mnemonic"};
constexpr auto kSeedIterations = uint32_t{2048};

wallet_result_t fail(const transfer_error_code code, std::string log) {
  return wallet_result_t{.code = remit::schema::to_code(code),
                         .log = std::move(log),
                         .wallet = std::nullopt};
}

bool is_space(const char c) {
  return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Collapses whitespace runs to single spaces, the form the seed is computed
// over.
std::string normalize_phrase(const std::string_view phrase) {
  auto out = std::string{};
  out.reserve(phrase.size());
  for (const auto c : phrase) {
    if (is_space(c)) {
      if (!out.empty() && out.back() != ' ') {
        out.push_back(' ');
      }
      continue;
    }
    out.push_back(c);
  }
  if (!out.empty() && out.back() == ' ') {
    out.pop_back();
  }
  return out;
}

}  // namespace

signing_wallet::signing_wallet(const remit::crypto::private_key_t& private_key,
                               const remit::crypto::public_key_t& public_key,
                               std::string address)
    : private_key_{private_key},
      public_key_{public_key},
      address_{std::move(address)} {}

signing_wallet::signing_wallet(signing_wallet&& other) noexcept
    : private_key_{other.private_key_},
      public_key_{other.public_key_},
      address_{std::move(other.address_)} {
  remit::crypto::cleanse(other.private_key_.data(), other.private_key_.size());
}

signing_wallet& signing_wallet::operator=(signing_wallet&& other) noexcept {
  if (this != &other) {
    private_key_ = other.private_key_;
    public_key_ = other.public_key_;
    address_ = std::move(other.address_);
    remit::crypto::cleanse(other.private_key_.data(),
                           other.private_key_.size());
  }
  return *this;
}

signing_wallet::~signing_wallet() {
  remit::crypto::cleanse(private_key_.data(), private_key_.size());
}

std::optional<remit::crypto::compact_signature_t> signing_wallet::sign(
    const remit::schema::bytes_view_t& message) const {
  return remit::crypto::sign(message, private_key_);
}

bool is_well_formed_phrase(const std::string_view phrase) {
  auto error = std::string{};
  auto entropy = decode_phrase(phrase, error);
  if (!entropy) {
    return false;
  }
  remit::crypto::cleanse(entropy->data(), entropy->size());
  return true;
}

std::optional<std::string> make_address(
    const remit::crypto::public_key_t& public_key,
    const std::string_view address_prefix) {
  auto hash = remit::crypto::hash160(
      remit::schema::bytes_view_t{public_key.data(), public_key.size()});
  return remit::encoding::bech32_encode(
      address_prefix, remit::schema::bytes_view_t{hash.data(), hash.size()});
}

wallet_result_t derive_wallet(const secret_phrase_t& phrase,
                              const std::string_view address_prefix) {
  auto error = std::string{};
  auto entropy = decode_phrase(phrase.view(), error);
  if (!entropy) {
    return fail(transfer_error_code::malformed_secret_phrase,
                std::move(error));
  }
  remit::crypto::cleanse(entropy->data(), entropy->size());
  if (address_prefix.empty()) {
    return fail(transfer_error_code::wallet_derivation_failed,
                "address prefix must not be empty");
  }

  auto normalized = secret_phrase_t{normalize_phrase(phrase.view())};
  auto seed = remit::crypto::pbkdf2_hmac_sha512(normalized.view(), kSeedSalt,
                                                kSeedIterations);
  if (!seed) {
    return fail(transfer_error_code::wallet_derivation_failed,
                "seed derivation failed");
  }

  auto path = remit::crypto::parse_derivation_path(kCosmosDerivationPath);
  auto key = remit::crypto::derive_path(
      remit::schema::bytes_view_t{seed->data(), seed->size()}, *path);
  remit::crypto::cleanse(seed->data(), seed->size());
  if (!key) {
    return fail(transfer_error_code::wallet_derivation_failed,
                "key derivation along " + std::string{kCosmosDerivationPath} +
                    " failed");
  }

  auto public_key = remit::crypto::derive_public_key(key->key);
  if (!public_key) {
    return fail(transfer_error_code::wallet_derivation_failed,
                "public key derivation failed");
  }
  auto address = make_address(*public_key, address_prefix);
  if (!address) {
    return fail(transfer_error_code::wallet_derivation_failed,
                "invalid address prefix '" + std::string{address_prefix} +
                    "'");
  }

  return wallet_result_t{
      .code = 0,
      .log = {},
      .wallet = signing_wallet_t{key->key, *public_key, std::move(*address)}};
}

}  // namespace remit::wallet
