#pragma once

#include <cosmos/auth/v1beta1/query.grpc.pb.h>
#include <cosmos/bank/v1beta1/query.grpc.pb.h>
#include <cosmos/tx/v1beta1/service.grpc.pb.h>
#include <grpcpp/grpcpp.h>
#include <memory>
#include <remit/chain/client.hpp>
#include <remit/chain/grpc/transaction_builder.hpp>

namespace remit::chain {

/// Opens gRPC channels to a Cosmos SDK node.
class grpc_connector final : public connector {
 public:
  std::unique_ptr<connection> connect(const remit::schema::network_t& network,
                                      std::string& error) override;
};

/// Cosmos SDK node reached over gRPC.
///
/// Uses the bank and auth query services and the tx service. Every call
/// carries the network's request timeout as its deadline.
class grpc_connection final : public connection {
 public:
  grpc_connection(std::shared_ptr<grpc::Channel> channel,
                  remit::schema::network_t network);

  std::optional<std::vector<remit::schema::coin_t>> all_balances(
      std::string_view address,
      std::string& error) override;

  std::optional<remit::schema::transaction_receipt_t> send_coins(
      const remit::wallet::signing_wallet_t& wallet,
      std::string_view destination,
      const std::vector<remit::schema::coin_t>& coins,
      send_error_t& error) override;

 private:
  std::optional<account_t> query_account(std::string_view address,
                                         std::string& error);
  std::optional<uint64_t> simulate(const std::string& tx_bytes,
                                   std::string& error);
  std::optional<cosmos::base::abci::v1beta1::TxResponse> broadcast(
      const std::string& tx_bytes,
      std::string& error);
  std::optional<remit::schema::transaction_receipt_t> await_inclusion(
      const std::string& tx_hash,
      send_error_t& error);

  void set_deadline(grpc::ClientContext& context) const;

  std::shared_ptr<grpc::Channel> channel_;
  remit::schema::network_t network_;
  std::unique_ptr<cosmos::bank::v1beta1::Query::Stub> bank_;
  std::unique_ptr<cosmos::auth::v1beta1::Query::Stub> auth_;
  std::unique_ptr<cosmos::tx::v1beta1::Service::Stub> tx_;
};

}  // namespace remit::chain
