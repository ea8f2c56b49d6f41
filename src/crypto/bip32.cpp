#include <remit/crypto/bip32.hpp>
#include <remit/crypto/hash.hpp>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <charconv>
#include <memory>

namespace remit::crypto {

namespace {

using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;

constexpr auto kMasterSecret = std::string_view{"Bitcoin seed"};

// Splits I = HMAC-SHA512 output into (IL, IR); IL is added to `parent` mod n.
std::optional<extended_private_key_t> make_key(const sha512_t& digest,
                                               const private_key_t* parent) {
  auto group = ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                            EC_GROUP_free};
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto tweak = bignum_ptr{BN_bin2bn(digest.data(), 32, nullptr), BN_clear_free};
  if (!group || !ctx || !tweak) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  if (BN_cmp(tweak.get(), order) >= 0) {
    return std::nullopt;
  }

  auto scalar = bignum_ptr{BN_new(), BN_clear_free};
  if (!scalar) {
    return std::nullopt;
  }
  if (parent == nullptr) {
    if (BN_copy(scalar.get(), tweak.get()) == nullptr) {
      return std::nullopt;
    }
  } else {
    auto parent_scalar = bignum_ptr{
        BN_bin2bn(parent->data(), static_cast<int>(parent->size()), nullptr),
        BN_clear_free};
    if (!parent_scalar || BN_mod_add(scalar.get(), tweak.get(),
                                     parent_scalar.get(), order,
                                     ctx.get()) != 1) {
      return std::nullopt;
    }
  }
  if (BN_is_zero(scalar.get())) {
    return std::nullopt;
  }

  auto out = extended_private_key_t{};
  if (BN_bn2binpad(scalar.get(), out.key.data(),
                   static_cast<int>(out.key.size())) !=
      static_cast<int>(out.key.size())) {
    return std::nullopt;
  }
  std::copy_n(digest.data() + 32, out.chain_code.size(),
              out.chain_code.data());
  return out;
}

}  // namespace

extended_private_key::~extended_private_key() {
  cleanse(key.data(), key.size());
  cleanse(chain_code.data(), chain_code.size());
}

std::optional<extended_private_key_t> make_master_key(
    const remit::schema::bytes_view_t& seed) {
  auto digest = hmac_sha512(remit::schema::make_bytes_view(kMasterSecret), seed);
  auto key = make_key(digest, nullptr);
  cleanse(digest.data(), digest.size());
  return key;
}

std::optional<extended_private_key_t> derive_child(
    const extended_private_key_t& parent,
    const uint32_t index) {
  auto data = remit::schema::bytes_t{};
  data.reserve(37);
  if ((index & kHardenedIndex) != 0) {
    data.push_back(0x00);
    data.insert(data.end(), parent.key.begin(), parent.key.end());
  } else {
    auto public_key = derive_public_key(parent.key);
    if (!public_key) {
      return std::nullopt;
    }
    data.insert(data.end(), public_key->begin(), public_key->end());
  }
  data.push_back(static_cast<uint8_t>((index >> 24u) & 0xFFu));
  data.push_back(static_cast<uint8_t>((index >> 16u) & 0xFFu));
  data.push_back(static_cast<uint8_t>((index >> 8u) & 0xFFu));
  data.push_back(static_cast<uint8_t>(index & 0xFFu));

  auto digest = hmac_sha512(
      remit::schema::bytes_view_t{parent.chain_code.data(),
                                  parent.chain_code.size()},
      remit::schema::make_bytes_view(data));
  cleanse(data.data(), data.size());
  auto child = make_key(digest, &parent.key);
  cleanse(digest.data(), digest.size());
  return child;
}

std::optional<extended_private_key_t> derive_path(
    const remit::schema::bytes_view_t& seed,
    const std::span<const uint32_t> path) {
  auto key = make_master_key(seed);
  for (const auto index : path) {
    if (!key) {
      return std::nullopt;
    }
    key = derive_child(*key, index);
  }
  return key;
}

std::optional<std::vector<uint32_t>> parse_derivation_path(
    std::string_view path) {
  if (path.empty() || path.front() != 'm') {
    return std::nullopt;
  }
  path.remove_prefix(1);

  auto out = std::vector<uint32_t>{};
  while (!path.empty()) {
    if (path.front() != '/') {
      return std::nullopt;
    }
    path.remove_prefix(1);
    auto end = path.find('/');
    auto segment = path.substr(0, end);
    path = end == std::string_view::npos ? std::string_view{}
                                         : path.substr(end);

    auto hardened = false;
    if (!segment.empty() && (segment.back() == '\'' || segment.back() == 'h' ||
                             segment.back() == 'H')) {
      hardened = true;
      segment.remove_suffix(1);
    }
    auto value = uint32_t{};
    auto [ptr, ec] =
        std::from_chars(segment.data(), segment.data() + segment.size(), value);
    if (segment.empty() || ec != std::errc{} ||
        ptr != segment.data() + segment.size() || value >= kHardenedIndex) {
      return std::nullopt;
    }
    out.push_back(hardened ? (value | kHardenedIndex) : value);
  }
  return out;
}

}  // namespace remit::crypto
