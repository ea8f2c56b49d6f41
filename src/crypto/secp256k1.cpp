#include <remit/crypto/secp256k1.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <memory>
#include <vector>

namespace remit::crypto {

namespace {

using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using param_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

ec_group_ptr make_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

bool is_valid_scalar(const BIGNUM* scalar, const EC_GROUP* group) {
  return !BN_is_zero(scalar) && BN_cmp(scalar, EC_GROUP_get0_order(group)) < 0;
}

bool is_low_s(const BIGNUM* s, const EC_GROUP* group) {
  auto half_order = bignum_ptr{BN_dup(EC_GROUP_get0_order(group)),
                               BN_clear_free};
  if (!half_order || BN_rshift1(half_order.get(), half_order.get()) != 1) {
    return false;
  }
  return BN_cmp(s, half_order.get()) <= 0;
}

evp_pkey_ptr make_private_pkey(const private_key_t& private_key,
                               const public_key_t& public_key) {
  auto empty = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto priv = bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_clear_free};
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!priv || !builder) {
    return empty;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(),
                                      OSSL_PKEY_PARAM_GROUP_NAME, "secp256k1",
                                      0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             priv.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return empty;
  }
  auto params =
      param_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  if (!params) {
    return empty;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return empty;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return empty;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

std::optional<public_key_t> derive_public_key(
    const private_key_t& private_key) {
  auto group = make_group();
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto scalar = bignum_ptr{
      BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()),
                nullptr),
      BN_clear_free};
  if (!group || !ctx || !scalar || !is_valid_scalar(scalar.get(), group.get())) {
    return std::nullopt;
  }

  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), scalar.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }

  auto out = public_key_t{};
  if (EC_POINT_point2oct(group.get(), point.get(), POINT_CONVERSION_COMPRESSED,
                         out.data(), out.size(), ctx.get()) != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<compact_signature_t> sign(
    const remit::schema::bytes_view_t& message,
    const private_key_t& private_key) {
  auto public_key = derive_public_key(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  auto pkey = make_private_pkey(private_key, *public_key);
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!pkey || !ctx ||
      EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                         pkey.get()) != 1) {
    return std::nullopt;
  }

  auto der_length = std::size_t{0};
  if (EVP_DigestSign(ctx.get(), nullptr, &der_length, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_length);
  if (EVP_DigestSign(ctx.get(), der.data(), &der_length, message.data(),
                     message.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_length)),
      ECDSA_SIG_free};
  auto group = make_group();
  if (!ecdsa_sig || !group) {
    return std::nullopt;
  }

  const BIGNUM* r = nullptr;
  const BIGNUM* s = nullptr;
  ECDSA_SIG_get0(ecdsa_sig.get(), &r, &s);

  // The chain only accepts the lower of the two equivalent s values.
  auto normalized_s = bignum_ptr{BN_dup(s), BN_clear_free};
  if (!normalized_s) {
    return std::nullopt;
  }
  if (!is_low_s(s, group.get()) &&
      BN_sub(normalized_s.get(), EC_GROUP_get0_order(group.get()), s) != 1) {
    return std::nullopt;
  }

  auto out = compact_signature_t{};
  if (BN_bn2binpad(r, out.data(), 32) != 32 ||
      BN_bn2binpad(normalized_s.get(), out.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  return out;
}

bool verify(const remit::schema::bytes_view_t& message,
            const public_key_t& public_key,
            const compact_signature_t& signature) {
  auto group = make_group();
  auto r = bignum_ptr{BN_bin2bn(signature.data(), 32, nullptr), BN_clear_free};
  auto s =
      bignum_ptr{BN_bin2bn(signature.data() + 32, 32, nullptr), BN_clear_free};
  if (!group || !r || !s || !is_low_s(s.get(), group.get())) {
    return false;
  }

  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return false;
  }

  auto* group_name = const_cast<char*>("secp256k1");
  auto params =
      std::array{OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME,
                                                  group_name, 0),
                 OSSL_PARAM_construct_octet_string(
                     OSSL_PKEY_PARAM_PUB_KEY,
                     const_cast<unsigned char*>(public_key.data()),
                     public_key.size()),
                 OSSL_PARAM_construct_end()};

  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_PUBLIC_KEY,
                        params.data()) != 1) {
    return false;
  }
  auto pkey = evp_pkey_ptr{raw_pkey, EVP_PKEY_free};

  auto ecdsa_sig = ecdsa_sig_ptr{ECDSA_SIG_new(), ECDSA_SIG_free};
  if (!ecdsa_sig ||
      ECDSA_SIG_set0(ecdsa_sig.get(), r.release(), s.release()) != 1) {
    return false;
  }

  auto der_len = i2d_ECDSA_SIG(ecdsa_sig.get(), nullptr);
  if (der_len <= 0) {
    return false;
  }
  auto der = std::vector<uint8_t>(static_cast<size_t>(der_len));
  auto* der_ptr = der.data();
  i2d_ECDSA_SIG(ecdsa_sig.get(), &der_ptr);

  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return false;
  }

  auto ok = false;
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr,
                           pkey.get()) == 1) {
    ok = EVP_DigestVerify(ctx.get(), der.data(), der.size(), message.data(),
                          message.size()) == 1;
  }
  return ok;
}

}  // namespace remit::crypto
