#include <gtest/gtest.h>
#include <remit/crypto/secp256k1.hpp>
#include <remit/encoding/bech32.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/testing/common.hpp>
#include <remit/wallet/signing_wallet.hpp>

#include <string>

using remit::schema::to_code;
using remit::schema::transfer_error_code;
using remit::wallet::derive_wallet;
using remit::wallet::secret_phrase_t;

namespace {

secret_phrase_t test_phrase() {
  return secret_phrase_t{std::string{remit::testing::kTestPhrase}};
}

}  // namespace

TEST(signing_wallet, derives_known_cosmos_address) {
  auto result = derive_wallet(test_phrase(), "cosmos");
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_TRUE(result.wallet.has_value());
  EXPECT_EQ(result.wallet->address(), remit::testing::kTestCosmosAddress);
}

TEST(signing_wallet, prefix_changes_only_the_encoding) {
  auto cosmos = derive_wallet(test_phrase(), "cosmos");
  auto osmo = derive_wallet(test_phrase(), "osmo");
  ASSERT_EQ(cosmos.code, 0u);
  ASSERT_EQ(osmo.code, 0u);
  EXPECT_EQ(osmo.wallet->address().rfind("osmo1", 0), 0u);
  EXPECT_EQ(cosmos.wallet->public_key(), osmo.wallet->public_key());

  auto cosmos_data = remit::encoding::bech32_decode(cosmos.wallet->address());
  auto osmo_data = remit::encoding::bech32_decode(osmo.wallet->address());
  ASSERT_TRUE(cosmos_data && osmo_data);
  EXPECT_EQ(cosmos_data->data, osmo_data->data);
}

TEST(signing_wallet, derivation_is_deterministic_and_whitespace_tolerant) {
  auto spaced = std::string{remit::testing::kTestPhrase};
  for (auto pos = spaced.find(' '); pos != std::string::npos;
       pos = spaced.find(' ', pos + 3)) {
    spaced.replace(pos, 1, "  \t");
  }
  auto first = derive_wallet(test_phrase(), "osmo");
  auto second = derive_wallet(secret_phrase_t{spaced}, "osmo");
  ASSERT_EQ(first.code, 0u);
  ASSERT_EQ(second.code, 0u) << second.log;
  EXPECT_EQ(first.wallet->address(), second.wallet->address());
}

TEST(signing_wallet, rejects_malformed_phrases) {
  for (const auto* phrase :
       {"", "abandon", "abandon abandon abandon",
        "Abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon about",
        "abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon about1",
        "abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon",
        "abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon abandon",
        "abandon hello abandon abandon abandon abandon abandon abandon "
        "abandon abandon abandon about"}) {
    auto result = derive_wallet(secret_phrase_t{phrase}, "osmo");
    EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_secret_phrase))
        << phrase;
    EXPECT_FALSE(result.wallet.has_value());
    EXPECT_EQ(result.log.find("abandon"), std::string::npos);
  }
}

TEST(signing_wallet, lowercase_words_alone_are_not_a_phrase) {
  auto result = derive_wallet(
      secret_phrase_t{"hello world this is not a real wallet phrase at all okay"},
      "osmo");
  EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_secret_phrase));
  EXPECT_FALSE(result.wallet.has_value());
  EXPECT_EQ(result.log.find("hello"), std::string::npos);
  EXPECT_FALSE(remit::wallet::is_well_formed_phrase(
      "hello world this is not a real wallet phrase at all okay"));
  EXPECT_TRUE(remit::wallet::is_well_formed_phrase(remit::testing::kTestPhrase));
}

TEST(signing_wallet, empty_prefix_fails_derivation) {
  auto result = derive_wallet(test_phrase(), "");
  EXPECT_EQ(result.code, to_code(transfer_error_code::wallet_derivation_failed));
  EXPECT_FALSE(result.wallet.has_value());
}

TEST(signing_wallet, signatures_verify_under_wallet_key) {
  auto result = derive_wallet(test_phrase(), "osmo");
  ASSERT_EQ(result.code, 0u);
  auto message = remit::schema::make_bytes_view(std::string_view{"payload"});
  auto signature = result.wallet->sign(message);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(remit::crypto::verify(message, result.wallet->public_key(),
                                    *signature));
}

TEST(signing_wallet, moved_wallet_keeps_identity) {
  auto result = derive_wallet(test_phrase(), "osmo");
  ASSERT_EQ(result.code, 0u);
  auto address = result.wallet->address();
  auto moved = std::move(*result.wallet);
  EXPECT_EQ(moved.address(), address);
  auto message = remit::schema::make_bytes_view(std::string_view{"after move"});
  auto signature = moved.sign(message);
  ASSERT_TRUE(signature.has_value());
  EXPECT_TRUE(remit::crypto::verify(message, moved.public_key(), *signature));
}

TEST(secret_phrase, move_leaves_source_empty) {
  auto phrase = secret_phrase_t{"alpha beta"};
  auto moved = std::move(phrase);
  EXPECT_EQ(moved.view(), "alpha beta");
  EXPECT_TRUE(phrase.empty());
}
