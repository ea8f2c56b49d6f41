#include <gtest/gtest.h>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/testing/common.hpp>
#include <remit/validation/validator.hpp>

#include <string>
#include <vector>

using remit::schema::to_code;
using remit::schema::transfer_error_code;
using remit::validation::input_field;
using remit::validation::validator;

namespace {

constexpr auto kBitcoinStyleAddress =
    std::string_view{"1A1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa"};

// 2^256 - 1 and 2^256.
constexpr auto kMaxAmount = std::string_view{
    "115792089237316195423570985008687907853269984665640564039457584007913129639"
    "935"};
constexpr auto kOverflowAmount = std::string_view{
    "115792089237316195423570985008687907853269984665640564039457584007913129639"
    "936"};

}  // namespace

TEST(validator, accepts_amount_and_token) {
  auto result = validator{}.validate(std::string_view{"1000BTC"},
                                     kBitcoinStyleAddress);
  ASSERT_EQ(result.code, 0u);
  ASSERT_TRUE(result.request.has_value());
  EXPECT_EQ(result.request->amount(), remit::schema::amount_t{1000});
  EXPECT_EQ(result.request->denomination(), "BTC");
  EXPECT_EQ(result.request->destination(), kBitcoinStyleAddress);
  EXPECT_EQ(result.field, input_field::none);
}

TEST(validator, accepts_hyphenated_numeric_token_suffix) {
  auto result = validator{}.validate(
      std::string_view{"1000ERC-20"},
      std::string_view{"ethA1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa"});
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.request->amount(), remit::schema::amount_t{1000});
  EXPECT_EQ(result.request->denomination(), "ERC-20");
  EXPECT_EQ(result.request->destination(),
            "ethA1zP1eP5QGefi2DMPTfTL5SLmv7DivfNa");
}

TEST(validator, rejects_amount_without_token) {
  auto result = validator{}.validate(std::string_view{"1000234"},
                                     kBitcoinStyleAddress);
  EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_coin));
  EXPECT_EQ(result.field, input_field::coin);
  EXPECT_EQ(result.log.rfind("malformed amount/token", 0), 0u);
  EXPECT_FALSE(result.request.has_value());
}

TEST(validator, rejects_trailing_punctuation_in_coin) {
  auto result =
      validator{}.validate(std::string_view{"239btc!"}, kBitcoinStyleAddress);
  EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_coin));
  EXPECT_EQ(result.log.rfind("malformed amount/token", 0), 0u);
}

TEST(validator, rejects_invalid_address_characters) {
  auto result = validator{}.validate(
      std::string_view{"239btc"},
      std::string_view{"1A1zP1eP5Qef!i2DMPTfTL5SLmv7DivfNa"});
  EXPECT_EQ(result.code, to_code(transfer_error_code::invalid_address));
  EXPECT_EQ(result.field, input_field::destination);
  EXPECT_NE(result.log.find("invalid address format"), std::string::npos);
  EXPECT_FALSE(result.request.has_value());
}

TEST(validator, address_rejected_whatever_the_coin_shape) {
  for (const auto* address : {"", "a b", "osmo1/abc", "addr.1", "x\n"}) {
    auto result =
        validator{}.validate(std::string_view{"5uosmo"}, std::string_view{address});
    EXPECT_EQ(result.code, to_code(transfer_error_code::invalid_address))
        << address;
    EXPECT_EQ(result.field, input_field::destination);
  }
}

TEST(validator, first_failing_rule_wins) {
  auto result = validator{}.validate(std::string_view{"239btc!"},
                                     std::string_view{"bad address!"});
  EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_coin));
}

TEST(validator, rejects_malformed_coin_shapes) {
  for (const auto* coin :
       {"", "btc", "100", "-5btc", "5 btc", "5btc-", "5btc-x", "5btc20",
        "5ibc/ABC", "5btc--20", "+5btc"}) {
    auto result =
        validator{}.validate(std::string_view{coin}, kBitcoinStyleAddress);
    EXPECT_EQ(result.code, to_code(transfer_error_code::malformed_coin))
        << coin;
  }
}

TEST(validator, rejects_zero_amount) {
  auto result =
      validator{}.validate(std::string_view{"0uosmo"}, kBitcoinStyleAddress);
  EXPECT_EQ(result.code, to_code(transfer_error_code::zero_amount));
  EXPECT_EQ(result.field, input_field::amount);

  auto padded =
      validator{}.validate(std::string_view{"000uosmo"}, kBitcoinStyleAddress);
  EXPECT_EQ(padded.code, to_code(transfer_error_code::zero_amount));
}

TEST(validator, amount_range_is_256_bits) {
  auto max = validator{}.validate(kMaxAmount, "uosmo", kBitcoinStyleAddress);
  ASSERT_EQ(max.code, 0u);
  EXPECT_EQ(remit::schema::to_string(max.request->amount()), kMaxAmount);

  auto overflow =
      validator{}.validate(kOverflowAmount, "uosmo", kBitcoinStyleAddress);
  EXPECT_EQ(overflow.code, to_code(transfer_error_code::invalid_amount));
  EXPECT_EQ(overflow.field, input_field::amount);

  auto combined = validator{}.validate(
      std::string_view{std::string{kOverflowAmount} + "uosmo"},
      kBitcoinStyleAddress);
  EXPECT_EQ(combined.code, to_code(transfer_error_code::invalid_amount));
}

TEST(validator, typed_coin_skips_pattern_stage) {
  auto result = validator{}.validate("25", "ERC_20", kBitcoinStyleAddress);
  ASSERT_EQ(result.code, 0u);
  EXPECT_EQ(result.request->denomination(), "ERC_20");

  auto bad_amount = validator{}.validate("2x5", "uosmo", kBitcoinStyleAddress);
  EXPECT_EQ(bad_amount.code, to_code(transfer_error_code::invalid_amount));

  auto bad_token = validator{}.validate("25", "uo$mo", kBitcoinStyleAddress);
  EXPECT_EQ(bad_token.code, to_code(transfer_error_code::invalid_denomination));
  EXPECT_EQ(bad_token.field, input_field::denomination);
}

TEST(validator, positional_count_is_a_usage_error) {
  auto one = std::vector<std::string>{"100uosmo"};
  auto three = std::vector<std::string>{"100uosmo", "a", "b"};
  auto none = std::vector<std::string>{};
  for (const auto& args : {one, three, none}) {
    auto result = validator{}.validate(std::span<const std::string>{args});
    EXPECT_EQ(result.code, to_code(transfer_error_code::usage_error));
    EXPECT_EQ(result.field, input_field::arguments);
  }

  auto two = std::vector<std::string>{"100uosmo", std::string{kBitcoinStyleAddress}};
  auto result = validator{}.validate(std::span<const std::string>{two});
  EXPECT_EQ(result.code, 0u);
}

TEST(validator, validation_is_deterministic) {
  auto check = validator{};
  for (const auto* coin : {"1000BTC", "1000234", "0uosmo"}) {
    auto first = check.validate(std::string_view{coin}, kBitcoinStyleAddress);
    auto second = check.validate(std::string_view{coin}, kBitcoinStyleAddress);
    EXPECT_EQ(first.code, second.code);
    EXPECT_EQ(first.field, second.field);
    EXPECT_EQ(first.log, second.log);
    EXPECT_EQ(first.request.has_value(), second.request.has_value());
    if (first.request && second.request) {
      EXPECT_TRUE(*first.request == *second.request);
    }
  }
}

TEST(validator, checks_bech32_prefix_when_configured) {
  auto cosmos = validator{remit::validation::validator_options_t{
      .address_prefix = std::string{"cosmos"}}};
  auto ok = cosmos.validate(std::string_view{"5uatom"},
                            remit::testing::kTestCosmosAddress);
  EXPECT_EQ(ok.code, 0u);

  auto osmo = validator{remit::validation::validator_options_t{
      .address_prefix = std::string{"osmo"}}};
  auto mismatch = osmo.validate(std::string_view{"5uosmo"},
                                remit::testing::kTestCosmosAddress);
  EXPECT_EQ(mismatch.code,
            to_code(transfer_error_code::address_prefix_mismatch));
  EXPECT_EQ(mismatch.field, input_field::destination);

  auto not_bech32 = osmo.validate(std::string_view{"5uosmo"},
                                  kBitcoinStyleAddress);
  EXPECT_EQ(not_bech32.code, to_code(transfer_error_code::invalid_address));
  EXPECT_NE(not_bech32.log.find("invalid address format"), std::string::npos);
}

TEST(validator, split_coin_separates_amount_and_token) {
  auto parts = remit::validation::split_coin("1000ERC-20-1");
  ASSERT_TRUE(parts.has_value());
  EXPECT_EQ(parts->first, "1000");
  EXPECT_EQ(parts->second, "ERC-20-1");
  EXPECT_FALSE(remit::validation::split_coin("ERC-20").has_value());
}

TEST(validator, field_names_are_readable) {
  EXPECT_EQ(remit::validation::to_string(input_field::coin), "amount/token");
  EXPECT_EQ(remit::validation::to_string(input_field::destination), "address");
  EXPECT_EQ(remit::validation::to_string(input_field::denomination), "token");
}
