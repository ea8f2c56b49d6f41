#include <gtest/gtest.h>
#include <remit/encoding/bech32.hpp>
#include <remit/testing/common.hpp>

#include <string>

using remit::encoding::bech32_decode;
using remit::encoding::bech32_encode;

TEST(bech32, accepts_reference_vectors) {
  for (const auto* encoded :
       {"A12UEL5L", "a12uel5l",
        "abcdef1qpzry9x8gf2tvdw0s3jn54khce6mua7lmqqqxw",
        "split1checkupstagehandshakeupstreamerranterredcaperred2y9e3w",
        "an83characterlonghumanreadablepartthatcontainsthenumber1andtheexcludedcharactersbio1tt5tgs"}) {
    EXPECT_TRUE(bech32_decode(encoded).has_value()) << encoded;
  }
}

TEST(bech32, decoded_hrp_is_lower_case) {
  auto decoded = bech32_decode("A12UEL5L");
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->hrp, "a");
  EXPECT_TRUE(decoded->data.empty());
}

TEST(bech32, rejects_invalid_strings) {
  for (const auto* encoded :
       {"pzry9x0s0muk", "1pzry9x0s0muk", "x1b4n0q5v", "li1dgmt3", "A1G7SGD8",
        "10a06t8", "1qzzfhee", "a12UEL5L", ""}) {
    EXPECT_FALSE(bech32_decode(encoded).has_value()) << encoded;
  }
  EXPECT_FALSE(bech32_decode(std::string{"\x20"} + "1nwldj5").has_value());
}

TEST(bech32, rejects_strings_over_ninety_characters) {
  auto encoded = std::string{
      "an84characterslonghumanreadablepartthatcontainsthenumber1andtheexcluded"
      "charactersbio1569pvx"};
  EXPECT_FALSE(bech32_decode(encoded).has_value());
}

TEST(bech32, reencodes_cosmos_address_under_another_prefix) {
  auto decoded = bech32_decode(remit::testing::kTestCosmosAddress);
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(decoded->hrp, "cosmos");
  EXPECT_EQ(decoded->data.size(), 20u);

  auto same = bech32_encode("cosmos", decoded->data);
  ASSERT_TRUE(same.has_value());
  EXPECT_EQ(*same, remit::testing::kTestCosmosAddress);

  auto osmo = bech32_encode("osmo", decoded->data);
  ASSERT_TRUE(osmo.has_value());
  EXPECT_EQ(osmo->rfind("osmo1", 0), 0u);
  auto back = bech32_decode(*osmo);
  ASSERT_TRUE(back.has_value());
  EXPECT_EQ(back->data, decoded->data);
}

TEST(bech32, single_character_change_breaks_checksum) {
  auto address = std::string{remit::testing::kTestCosmosAddress};
  address[10] = address[10] == 'q' ? 'p' : 'q';
  EXPECT_FALSE(bech32_decode(address).has_value());
}

TEST(bech32, rejects_empty_prefix_on_encode) {
  auto data = remit::schema::bytes_t{1, 2, 3};
  EXPECT_FALSE(bech32_encode("", data).has_value());
}
