#include <gtest/gtest.h>
#include <remit/crypto/hash.hpp>
#include <remit/encoding/hex.hpp>

#include <string>
#include <string_view>

using remit::encoding::to_hex;
using remit::schema::make_bytes_view;

TEST(hash, sha256_of_abc) {
  auto digest = remit::crypto::sha256(make_bytes_view(std::string_view{"abc"}));
  EXPECT_EQ(to_hex(digest),
            "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(hash, ripemd160_of_abc) {
  auto digest =
      remit::crypto::ripemd160(make_bytes_view(std::string_view{"abc"}));
  EXPECT_EQ(to_hex(digest), "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(hash, hash160_chains_sha256_and_ripemd160) {
  auto data = make_bytes_view(std::string_view{"remit"});
  auto inner = remit::crypto::sha256(data);
  EXPECT_EQ(remit::crypto::hash160(data), remit::crypto::ripemd160(inner));
}

TEST(hash, hmac_sha512_rfc4231_case_2) {
  auto mac = remit::crypto::hmac_sha512(
      make_bytes_view(std::string_view{"Jefe"}),
      make_bytes_view(std::string_view{"what do ya want for nothing?"}));
  EXPECT_EQ(to_hex(mac),
            "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
            "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(hash, pbkdf2_matches_bip39_seed_vector) {
  auto seed = remit::crypto::pbkdf2_hmac_sha512(
      "abandon abandon abandon abandon abandon abandon abandon abandon "
      "abandon abandon abandon about",
      "mnemonicTREZOR", 2048);
  ASSERT_TRUE(seed.has_value());
  EXPECT_EQ(to_hex(*seed),
            "c55257c360c07c72029aebc1b53c05ed0362ada38ead3e3e9efa3708e5349553"
            "1f09a6987599d18264c1e1c92f2cf141630c7a3c4ab7c81b2f001698e7463b04");
}

TEST(hash, cleanse_zeroes_buffer) {
  auto secret = std::string{"top secret"};
  remit::crypto::cleanse(secret.data(), secret.size());
  EXPECT_EQ(secret, std::string(10, '\0'));
}
