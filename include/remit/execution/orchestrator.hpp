#pragma once

#include <spdlog/spdlog.h>
#include <array>
#include <atomic>
#include <functional>
#include <memory>
#include <remit/chain/client.hpp>
#include <remit/schema/enum_string.hpp>
#include <remit/schema/network.hpp>
#include <remit/schema/transaction_request.hpp>
#include <remit/schema/transfer_result.hpp>
#include <remit/wallet/credential_source.hpp>
#include <remit/wallet/signing_wallet.hpp>

namespace remit::execution {

/// What a failed destination balance lookup does to the run.
enum class balance_check_policy : uint8_t {
  fatal = 0,
  advisory = 1,
};

inline constexpr auto kBalanceCheckPolicyMappings = std::array{
    std::pair<std::string_view, balance_check_policy>{
        "fatal", balance_check_policy::fatal},
    std::pair<std::string_view, balance_check_policy>{
        "advisory", balance_check_policy::advisory},
};

inline constexpr std::string_view to_string(const balance_check_policy value) {
  return remit::schema::name_of(value, kBalanceCheckPolicyMappings);
}

using wallet_deriver_t = std::function<remit::wallet::wallet_result_t(
    const remit::wallet::secret_phrase_t&,
    std::string_view)>;

/// Drives one validated transfer through the chain client.
///
/// Steps run strictly in order and the first failure ends the run:
/// credential, connect, destination balances, wallet derivation, broadcast,
/// outcome classification. The secret is read before any network call, so a
/// missing credential never touches the network. The connection and the
/// signing wallet live only for the duration of `execute`.
///
/// `interrupted` is polled between steps up to the broadcast. Once the
/// broadcast starts the run completes regardless.
class orchestrator final {
 public:
  orchestrator(remit::chain::connector& connector,
               remit::schema::network_t network,
               remit::wallet::credential_source_t credential,
               std::shared_ptr<spdlog::logger> logger,
               const std::atomic<bool>& interrupted);

  void set_balance_check(balance_check_policy policy);
  void set_wallet_deriver(wallet_deriver_t deriver);

  remit::schema::transfer_result_t execute(
      const remit::schema::transaction_request_t& request);

 private:
  remit::schema::transfer_result_t fail(remit::schema::transfer_error_code code,
                                        std::string_view codespace,
                                        std::string log) const;
  bool interrupted(std::string_view before_step) const;

  remit::chain::connector& connector_;
  remit::schema::network_t network_;
  remit::wallet::credential_source_t credential_;
  std::shared_ptr<spdlog::logger> logger_;
  const std::atomic<bool>& interrupted_;
  balance_check_policy balance_check_{balance_check_policy::fatal};
  wallet_deriver_t derive_wallet_;
};

}  // namespace remit::execution
