#include <gtest/gtest.h>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/testing/common.hpp>
#include <remit/wallet/credential_source.hpp>

#include <string>

using remit::schema::to_code;
using remit::schema::transfer_error_code;
using remit::wallet::env_credential_t;
using remit::wallet::file_credential_t;
using remit::wallet::resolve_credential;

namespace {

constexpr auto kEnvName = "REMIT_TEST_MNEMONIC";

}  // namespace

TEST(credential_source, reads_and_trims_file) {
  auto dir = remit::testing::make_temp_path("remit_credential");
  auto path = dir / "wallet.key";
  remit::testing::write_file(
      path, "\n  " + std::string{remit::testing::kTestPhrase} + " \r\n");

  auto result = resolve_credential(file_credential_t{path});
  ASSERT_EQ(result.code, 0u) << result.log;
  ASSERT_TRUE(result.phrase.has_value());
  EXPECT_EQ(result.phrase->view(), remit::testing::kTestPhrase);
  remit::testing::remove_path(dir);
}

TEST(credential_source, missing_file_explains_how_to_create_it) {
  auto path = remit::testing::make_temp_path("remit_absent") / "wallet.key";
  auto result = resolve_credential(file_credential_t{path});
  EXPECT_EQ(result.code, to_code(transfer_error_code::credential_missing));
  EXPECT_FALSE(result.phrase.has_value());
  EXPECT_NE(result.log.find(path.string()), std::string::npos);
  EXPECT_NE(result.log.find("Create it"), std::string::npos);
}

TEST(credential_source, empty_file_is_missing_credential) {
  auto dir = remit::testing::make_temp_path("remit_empty");
  auto path = dir / "wallet.key";
  remit::testing::write_file(path, " \n\t ");
  auto result = resolve_credential(file_credential_t{path});
  EXPECT_EQ(result.code, to_code(transfer_error_code::credential_missing));
  EXPECT_NE(result.log.find("is empty"), std::string::npos);
  remit::testing::remove_path(dir);
}

TEST(credential_source, directory_is_unreadable) {
  auto dir = remit::testing::make_temp_path("remit_dir");
  std::filesystem::create_directories(dir);
  auto result = resolve_credential(file_credential_t{dir});
  EXPECT_EQ(result.code, to_code(transfer_error_code::credential_unreadable));
  remit::testing::remove_path(dir);
}

TEST(credential_source, reads_environment_variable) {
  auto env = remit::testing::scoped_env{
      kEnvName, std::string{remit::testing::kTestPhrase} + "\n"};
  auto result = resolve_credential(env_credential_t{kEnvName});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_EQ(result.phrase->view(), remit::testing::kTestPhrase);
}

TEST(credential_source, unset_environment_variable_is_missing) {
  auto env = remit::testing::scoped_env{kEnvName, std::nullopt};
  auto result = resolve_credential(env_credential_t{kEnvName});
  EXPECT_EQ(result.code, to_code(transfer_error_code::credential_missing));
  EXPECT_NE(result.log.find(kEnvName), std::string::npos);
}

TEST(credential_source, failures_never_echo_the_secret) {
  auto env = remit::testing::scoped_env{kEnvName, std::string{"   "}};
  auto result = resolve_credential(env_credential_t{kEnvName});
  EXPECT_EQ(result.code, to_code(transfer_error_code::credential_missing));

  auto dir = remit::testing::make_temp_path("remit_nosecret");
  auto path = dir / "wallet.key";
  remit::testing::write_file(path, remit::testing::kTestPhrase);
  auto described = remit::wallet::describe(file_credential_t{path});
  EXPECT_EQ(described.find("abandon"), std::string::npos);
  remit::testing::remove_path(dir);
}

TEST(credential_source, describe_names_the_source) {
  EXPECT_EQ(remit::wallet::describe(file_credential_t{"wallet/wallet.key"}),
            "wallet key file 'wallet/wallet.key'");
  EXPECT_EQ(remit::wallet::describe(env_credential_t{"MNEMONIC"}),
            "environment variable 'MNEMONIC'");
}
