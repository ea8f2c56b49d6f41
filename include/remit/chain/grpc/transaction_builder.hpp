#pragma once

#include <cosmos/base/abci/v1beta1/abci.pb.h>
#include <cosmos/base/v1beta1/coin.pb.h>
#include <cstdint>
#include <remit/crypto/secp256k1.hpp>
#include <remit/schema/coin.hpp>
#include <remit/schema/transaction_receipt.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace remit::chain {

inline constexpr auto kMsgSendTypeUrl =
    std::string_view{"/cosmos.bank.v1beta1.MsgSend"};
inline constexpr auto kSecp256k1PubKeyTypeUrl =
    std::string_view{"/cosmos.crypto.secp256k1.PubKey"};
inline constexpr auto kBaseAccountTypeUrl =
    std::string_view{"/cosmos.auth.v1beta1.BaseAccount"};

/// On-chain signer state needed to build a transaction.
struct account_t final {
  std::string address;
  uint64_t account_number{};
  uint64_t sequence{};
};

/// Serialized TxBody and AuthInfo of a single-signer transaction. The same
/// bytes go into the SignDoc and the TxRaw.
struct unsigned_transaction_t final {
  std::string body_bytes;
  std::string auth_info_bytes;
};

cosmos::base::v1beta1::Coin to_wire_coin(const remit::schema::coin_t& coin);
remit::schema::coin_t from_wire_coin(const cosmos::base::v1beta1::Coin& coin);

/// ceil(simulated_gas * multiplier); never below `simulated_gas`.
uint64_t gas_limit_for(uint64_t simulated_gas, double multiplier);

/// ceil(gas_limit * gas_price) of `fee_denom`.
remit::schema::coin_t fee_for(uint64_t gas_limit,
                              double gas_price,
                              std::string_view fee_denom);

/// MsgSend from `sender` to `destination` signed in SIGN_MODE_DIRECT.
unsigned_transaction_t make_send_transaction(
    const remit::crypto::public_key_t& sender_key,
    const account_t& sender,
    std::string_view destination,
    const std::vector<remit::schema::coin_t>& coins,
    const std::vector<remit::schema::coin_t>& fee_amount,
    uint64_t gas_limit,
    std::string_view memo);

/// Serialized SignDoc; this is the message the sender signs.
std::string make_sign_doc(const unsigned_transaction_t& transaction,
                          std::string_view chain_id,
                          uint64_t account_number);

/// Serialized TxRaw carrying one signature.
std::string make_tx_raw(const unsigned_transaction_t& transaction,
                        std::string_view signature);

/// Upper-case hex SHA-256 of the encoded transaction, as nodes report it.
std::string make_tx_hash(std::string_view tx_raw);

remit::schema::transaction_receipt_t make_receipt(
    const cosmos::base::abci::v1beta1::TxResponse& response);

}  // namespace remit::chain
