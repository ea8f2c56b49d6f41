#include <gtest/gtest.h>
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/obj_mac.h>
#include <remit/crypto/secp256k1.hpp>
#include <remit/encoding/hex.hpp>

#include <algorithm>
#include <memory>
#include <string_view>

using remit::schema::make_bytes_view;

namespace {

remit::crypto::private_key_t test_key() {
  auto key = remit::crypto::private_key_t{};
  auto bytes = remit::encoding::try_from_hex(
      "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
  std::copy(bytes->begin(), bytes->end(), key.begin());
  return key;
}

// Replace s with n - s, producing the equivalent high-S signature.
remit::crypto::compact_signature_t flip_s(
    const remit::crypto::compact_signature_t& signature) {
  auto group = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>{
      EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free};
  auto s = std::unique_ptr<BIGNUM, decltype(&BN_free)>{
      BN_bin2bn(signature.data() + 32, 32, nullptr), BN_free};
  auto flipped = std::unique_ptr<BIGNUM, decltype(&BN_free)>{BN_new(), BN_free};
  BN_sub(flipped.get(), EC_GROUP_get0_order(group.get()), s.get());
  auto out = signature;
  BN_bn2binpad(flipped.get(), out.data() + 32, 32);
  return out;
}

}  // namespace

TEST(secp256k1, sign_then_verify) {
  auto key = test_key();
  auto public_key = remit::crypto::derive_public_key(key);
  ASSERT_TRUE(public_key.has_value());

  auto message = make_bytes_view(std::string_view{"sign doc bytes"});
  auto signature = remit::crypto::sign(message, key);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(remit::crypto::verify(message, *public_key, *signature));

  auto other = make_bytes_view(std::string_view{"sign doc bytez"});
  EXPECT_FALSE(remit::crypto::verify(other, *public_key, *signature));
}

TEST(secp256k1, signatures_are_low_s) {
  auto key = test_key();
  auto public_key = remit::crypto::derive_public_key(key);
  ASSERT_TRUE(public_key.has_value());
  auto message = make_bytes_view(std::string_view{"low-s"});

  for (auto i = 0; i < 8; ++i) {
    auto signature = remit::crypto::sign(message, key);
    ASSERT_TRUE(signature.has_value());
    // The top bit of a low s is always clear.
    EXPECT_LT((*signature)[32], 0x80);
    EXPECT_TRUE(remit::crypto::verify(message, *public_key, *signature));
    EXPECT_FALSE(
        remit::crypto::verify(message, *public_key, flip_s(*signature)));
  }
}

TEST(secp256k1, rejects_out_of_range_private_keys) {
  auto zero = remit::crypto::private_key_t{};
  EXPECT_FALSE(remit::crypto::derive_public_key(zero).has_value());
  EXPECT_FALSE(
      remit::crypto::sign(make_bytes_view(std::string_view{"x"}), zero)
          .has_value());

  auto all_ones = remit::crypto::private_key_t{};
  all_ones.fill(0xff);
  EXPECT_FALSE(remit::crypto::derive_public_key(all_ones).has_value());
}
