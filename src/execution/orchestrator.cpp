#include <remit/execution/orchestrator.hpp>
#include <remit/schema/transfer_error_code.hpp>

using namespace remit::schema;

namespace remit::execution {

orchestrator::orchestrator(remit::chain::connector& connector,
                           network_t network,
                           remit::wallet::credential_source_t credential,
                           std::shared_ptr<spdlog::logger> logger,
                           const std::atomic<bool>& interrupted)
    : connector_{connector},
      network_{std::move(network)},
      credential_{std::move(credential)},
      logger_{std::move(logger)},
      interrupted_{interrupted},
      derive_wallet_{&remit::wallet::derive_wallet} {}

void orchestrator::set_balance_check(const balance_check_policy policy) {
  balance_check_ = policy;
}

void orchestrator::set_wallet_deriver(wallet_deriver_t deriver) {
  derive_wallet_ = std::move(deriver);
}

transfer_result_t orchestrator::fail(const transfer_error_code code,
                                     const std::string_view codespace,
                                     std::string log) const {
  logger_->error("{} failed: {}", codespace, log);
  return transfer_result_t{.code = to_code(code),
                           .codespace = std::string{codespace},
                           .log = std::move(log),
                           .receipt = std::nullopt};
}

bool orchestrator::interrupted(const std::string_view before_step) const {
  if (!interrupted_.load()) {
    return false;
  }
  logger_->warn("interrupt received before {}; nothing was submitted",
                before_step);
  return true;
}

transfer_result_t orchestrator::execute(const transaction_request_t& request) {
  const auto amount = remit::schema::to_string(request.amount());
  logger_->info("transfer {}{} to {} on {} ({})", amount,
                request.denomination(), request.destination(),
                remit::schema::to_string(network_.id), network_.chain_id);

  auto credential = remit::wallet::resolve_credential(credential_);
  if (credential.code != 0) {
    return fail(static_cast<transfer_error_code>(credential.code), "credential",
                std::move(credential.log));
  }
  logger_->debug("secret phrase read from {}",
                 remit::wallet::describe(credential_));

  if (interrupted("connect")) {
    return fail(transfer_error_code::interrupted, "signal",
                "interrupted before connect");
  }

  logger_->info("connecting to {}", network_.grpc_endpoint);
  auto error = std::string{};
  auto connection = connector_.connect(network_, error);
  if (!connection) {
    return fail(transfer_error_code::connectivity_error, "connect",
                "cannot connect to " + network_.grpc_endpoint + ": " + error);
  }
  logger_->info("connected to {}", network_.grpc_endpoint);

  if (interrupted("balance query")) {
    return fail(transfer_error_code::interrupted, "signal",
                "interrupted before balance query");
  }

  auto balances = connection->all_balances(request.destination(), error);
  if (!balances) {
    if (balance_check_ == balance_check_policy::fatal) {
      return fail(transfer_error_code::query_error, "query",
                  "balance lookup for " + request.destination() +
                      " failed: " + error);
    }
    logger_->warn("balance lookup for {} failed, continuing: {}",
                  request.destination(), error);
  } else {
    logger_->info("{} holds {} denomination(s)", request.destination(),
                  balances->size());
    for (const auto& balance : *balances) {
      logger_->info("  balance {} {}", balance.amount, balance.denom);
    }
  }

  auto derived = derive_wallet_(*credential.phrase, network_.address_prefix);
  credential.phrase.reset();
  if (derived.code != 0 || !derived.wallet) {
    auto code = derived.code != 0
                    ? static_cast<transfer_error_code>(derived.code)
                    : transfer_error_code::wallet_derivation_failed;
    return fail(code, "derive", std::move(derived.log));
  }
  const auto& wallet = *derived.wallet;
  logger_->info("sender {}", wallet.address());
  logger_->info("destination {}", request.destination());

  if (interrupted("broadcast")) {
    return fail(transfer_error_code::interrupted, "signal",
                "interrupted before broadcast");
  }

  logger_->info("broadcasting {}{}", amount, request.denomination());
  auto send_error = remit::chain::send_error_t{};
  auto receipt = connection->send_coins(wallet, request.destination(),
                                        {request.coin()}, send_error);
  if (!receipt) {
    return fail(send_error.code, "broadcast", std::move(send_error.message));
  }

  if (receipt->code != 0) {
    auto log = "chain rejected transaction " + receipt->tx_hash + " with " +
               (receipt->codespace.empty() ? std::string{"code"}
                                           : receipt->codespace + " code") +
               " " + std::to_string(receipt->code);
    if (!receipt->raw_log.empty()) {
      log += ": " + receipt->raw_log;
    }
    auto result = fail(transfer_error_code::logical_failure, "chain",
                       std::move(log));
    result.receipt = std::move(receipt);
    return result;
  }

  logger_->info("transaction {} included at height {}", receipt->tx_hash,
                receipt->height);
  return transfer_result_t{.code = 0,
                           .codespace = {},
                           .log = {},
                           .receipt = std::move(receipt)};
}

}  // namespace remit::execution
