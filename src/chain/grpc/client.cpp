#include <cosmos/auth/v1beta1/auth.pb.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <remit/chain/grpc/client.hpp>
#include <thread>

using namespace remit::schema;

namespace remit::chain {

namespace {

// Page size for AllBalances.
constexpr auto kBalancePageLimit = uint64_t{100};

std::string describe_status(const grpc::Status& status) {
  return status.error_message() + " (grpc status " +
         std::to_string(static_cast<int>(status.error_code())) + ")";
}

}  // namespace

std::unique_ptr<connection> grpc_connector::connect(const network_t& network,
                                                    std::string& error) {
  auto credentials = std::shared_ptr<grpc::ChannelCredentials>{};
  if (network.use_tls) {
    credentials = grpc::SslCredentials(grpc::SslCredentialsOptions{});
  } else {
    credentials = grpc::InsecureChannelCredentials();
  }

  auto channel = grpc::CreateChannel(network.grpc_endpoint, credentials);
  auto deadline = std::chrono::system_clock::now() +
                  std::chrono::milliseconds{network.request_timeout};
  if (!channel->WaitForConnected(deadline)) {
    error = "unable to reach " + network.grpc_endpoint + " within " +
            std::to_string(network.request_timeout) + " ms";
    return nullptr;
  }
  spdlog::debug("gRPC channel ready: {} (tls={})", network.grpc_endpoint,
                network.use_tls);
  return std::make_unique<grpc_connection>(std::move(channel), network);
}

grpc_connection::grpc_connection(std::shared_ptr<grpc::Channel> channel,
                                 network_t network)
    : channel_{std::move(channel)},
      network_{std::move(network)},
      bank_{cosmos::bank::v1beta1::Query::NewStub(channel_)},
      auth_{cosmos::auth::v1beta1::Query::NewStub(channel_)},
      tx_{cosmos::tx::v1beta1::Service::NewStub(channel_)} {}

void grpc_connection::set_deadline(grpc::ClientContext& context) const {
  context.set_deadline(std::chrono::system_clock::now() +
                       std::chrono::milliseconds{network_.request_timeout});
}

std::optional<std::vector<coin_t>> grpc_connection::all_balances(
    const std::string_view address,
    std::string& error) {
  auto balances = std::vector<coin_t>{};
  auto next_key = std::string{};
  do {
    auto request = cosmos::bank::v1beta1::QueryAllBalancesRequest{};
    request.set_address(std::string{address});
    request.mutable_pagination()->set_limit(kBalancePageLimit);
    request.mutable_pagination()->set_key(next_key);

    auto response = cosmos::bank::v1beta1::QueryAllBalancesResponse{};
    auto context = grpc::ClientContext{};
    set_deadline(context);
    auto status = bank_->AllBalances(&context, request, &response);
    if (!status.ok()) {
      error = "AllBalances failed: " + describe_status(status);
      return std::nullopt;
    }
    for (const auto& balance : response.balances()) {
      balances.push_back(from_wire_coin(balance));
    }
    next_key = response.pagination().next_key();
  } while (!next_key.empty());
  return balances;
}

std::optional<account_t> grpc_connection::query_account(
    const std::string_view address,
    std::string& error) {
  auto request = cosmos::auth::v1beta1::QueryAccountRequest{};
  request.set_address(std::string{address});
  auto response = cosmos::auth::v1beta1::QueryAccountResponse{};
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto status = auth_->Account(&context, request, &response);
  if (!status.ok()) {
    error = "account lookup for " + std::string{address} +
            " failed: " + describe_status(status);
    return std::nullopt;
  }

  const auto& any = response.account();
  if (any.type_url() != kBaseAccountTypeUrl) {
    error = "unsupported account type '" + any.type_url() + "' for " +
            std::string{address};
    return std::nullopt;
  }
  auto base = cosmos::auth::v1beta1::BaseAccount{};
  if (!base.ParseFromString(any.value())) {
    error = "undecodable account record for " + std::string{address};
    return std::nullopt;
  }
  return account_t{.address = std::string{address},
                   .account_number = base.account_number(),
                   .sequence = base.sequence()};
}

std::optional<uint64_t> grpc_connection::simulate(const std::string& tx_bytes,
                                                  std::string& error) {
  auto request = cosmos::tx::v1beta1::SimulateRequest{};
  request.set_tx_bytes(tx_bytes);
  auto response = cosmos::tx::v1beta1::SimulateResponse{};
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto status = tx_->Simulate(&context, request, &response);
  if (!status.ok()) {
    error = "gas simulation failed: " + describe_status(status);
    return std::nullopt;
  }
  return response.gas_info().gas_used();
}

std::optional<cosmos::base::abci::v1beta1::TxResponse>
grpc_connection::broadcast(const std::string& tx_bytes, std::string& error) {
  auto request = cosmos::tx::v1beta1::BroadcastTxRequest{};
  request.set_tx_bytes(tx_bytes);
  request.set_mode(cosmos::tx::v1beta1::BROADCAST_MODE_SYNC);
  auto response = cosmos::tx::v1beta1::BroadcastTxResponse{};
  auto context = grpc::ClientContext{};
  set_deadline(context);
  auto status = tx_->BroadcastTx(&context, request, &response);
  if (!status.ok()) {
    error = "BroadcastTx failed: " + describe_status(status);
    return std::nullopt;
  }
  return response.tx_response();
}

std::optional<transaction_receipt_t> grpc_connection::await_inclusion(
    const std::string& tx_hash,
    send_error_t& error) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds{network_.confirmation_timeout};
  while (true) {
    auto request = cosmos::tx::v1beta1::GetTxRequest{};
    request.set_hash(tx_hash);
    auto response = cosmos::tx::v1beta1::GetTxResponse{};
    auto context = grpc::ClientContext{};
    set_deadline(context);
    auto status = tx_->GetTx(&context, request, &response);
    if (status.ok()) {
      return make_receipt(response.tx_response());
    }
    if (status.error_code() != grpc::StatusCode::NOT_FOUND) {
      error.code = transfer_error_code::broadcast_error;
      error.message = "GetTx for " + tx_hash +
                      " failed: " + describe_status(status);
      return std::nullopt;
    }
    if (std::chrono::steady_clock::now() +
            std::chrono::milliseconds{network_.poll_interval} >
        deadline) {
      error.code = transfer_error_code::confirmation_timeout;
      error.message = "transaction " + tx_hash +
                      " was broadcast but not seen in a block within " +
                      std::to_string(network_.confirmation_timeout) +
                      " ms; check its status before sending again";
      return std::nullopt;
    }
    spdlog::debug("transaction {} not yet included, polling", tx_hash);
    std::this_thread::sleep_for(
        std::chrono::milliseconds{network_.poll_interval});
  }
}

std::optional<transaction_receipt_t> grpc_connection::send_coins(
    const remit::wallet::signing_wallet_t& wallet,
    const std::string_view destination,
    const std::vector<coin_t>& coins,
    send_error_t& error) {
  error.code = transfer_error_code::broadcast_error;

  auto account = query_account(wallet.address(), error.message);
  if (!account) {
    return std::nullopt;
  }
  spdlog::debug("account {}: number={}, sequence={}", account->address,
                account->account_number, account->sequence);

  // Simulation skips signature verification, so an empty signature is enough.
  auto draft = make_send_transaction(wallet.public_key(), *account, destination,
                                     coins, {}, 0, network_.memo);
  auto simulated_gas = simulate(make_tx_raw(draft, {}), error.message);
  if (!simulated_gas) {
    return std::nullopt;
  }

  auto gas_limit = gas_limit_for(*simulated_gas, network_.gas_multiplier);
  auto fee = fee_for(gas_limit, network_.gas_price, network_.fee_denom);
  spdlog::debug("simulated gas {}, gas limit {}, fee {}{}", *simulated_gas,
                gas_limit, fee.amount, fee.denom);

  auto transaction = make_send_transaction(wallet.public_key(), *account,
                                           destination, coins, {fee},
                                           gas_limit, network_.memo);
  auto sign_doc = make_sign_doc(transaction, network_.chain_id,
                                account->account_number);
  auto signature = wallet.sign(make_bytes_view(sign_doc));
  if (!signature) {
    error.message = "signing the transaction failed";
    return std::nullopt;
  }
  auto tx_raw = make_tx_raw(
      transaction, std::string_view{reinterpret_cast<const char*>(
                                        signature->data()),
                                    signature->size()});
  auto tx_hash = make_tx_hash(tx_raw);

  auto response = broadcast(tx_raw, error.message);
  if (!response) {
    return std::nullopt;
  }
  if (response->code() != 0) {
    // Rejected by CheckTx: never enters a block.
    auto receipt = make_receipt(*response);
    receipt.height = 0;
    if (receipt.tx_hash.empty()) {
      receipt.tx_hash = tx_hash;
    }
    return receipt;
  }
  if (!response->txhash().empty()) {
    tx_hash = response->txhash();
  }
  return await_inclusion(tx_hash, error);
}

}  // namespace remit::chain
