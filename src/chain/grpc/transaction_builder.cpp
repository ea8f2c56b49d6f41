#include <cosmos/bank/v1beta1/tx.pb.h>
#include <cosmos/crypto/secp256k1/keys.pb.h>
#include <cosmos/tx/v1beta1/tx.pb.h>
#include <algorithm>
#include <cmath>
#include <limits>
#include <remit/chain/grpc/transaction_builder.hpp>
#include <remit/crypto/hash.hpp>
#include <remit/encoding/hex.hpp>

using namespace remit::schema;

namespace remit::chain {

namespace {

// Decimal factors such as 1.3 or 0.025 are not exact in binary; products
// within this distance of an integer count as that integer.
constexpr auto kProductTolerance = 1e-6L;

// 2^64, the first product that no longer fits the result.
constexpr auto kProductLimit = 18446744073709551616.0L;

// Saturates at the largest uint64_t for products of 2^64 and above.
uint64_t ceil_product(const uint64_t value, const double factor) {
  auto product =
      static_cast<long double>(value) * static_cast<long double>(factor);
  if (!(product > 0.0L)) {
    return 0;
  }
  auto rounded = std::ceil(product - kProductTolerance);
  if (!std::isfinite(rounded) || rounded >= kProductLimit) {
    return std::numeric_limits<uint64_t>::max();
  }
  return static_cast<uint64_t>(rounded);
}

}  // namespace

cosmos::base::v1beta1::Coin to_wire_coin(const coin_t& coin) {
  auto wire = cosmos::base::v1beta1::Coin{};
  wire.set_denom(coin.denom);
  wire.set_amount(coin.amount);
  return wire;
}

coin_t from_wire_coin(const cosmos::base::v1beta1::Coin& coin) {
  return coin_t{.denom = coin.denom(), .amount = coin.amount()};
}

uint64_t gas_limit_for(const uint64_t simulated_gas, const double multiplier) {
  auto limit = ceil_product(simulated_gas, multiplier);
  return std::max(limit, simulated_gas);
}

coin_t fee_for(const uint64_t gas_limit,
               const double gas_price,
               const std::string_view fee_denom) {
  return coin_t{.denom = std::string{fee_denom},
                .amount = std::to_string(ceil_product(gas_limit, gas_price))};
}

unsigned_transaction_t make_send_transaction(
    const remit::crypto::public_key_t& sender_key,
    const account_t& sender,
    const std::string_view destination,
    const std::vector<coin_t>& coins,
    const std::vector<coin_t>& fee_amount,
    const uint64_t gas_limit,
    const std::string_view memo) {
  auto message = cosmos::bank::v1beta1::MsgSend{};
  message.set_from_address(sender.address);
  message.set_to_address(std::string{destination});
  for (const auto& coin : coins) {
    *message.add_amount() = to_wire_coin(coin);
  }

  auto body = cosmos::tx::v1beta1::TxBody{};
  auto* any = body.add_messages();
  any->set_type_url(std::string{kMsgSendTypeUrl});
  any->set_value(message.SerializeAsString());
  body.set_memo(std::string{memo});

  auto public_key = cosmos::crypto::secp256k1::PubKey{};
  public_key.set_key(std::string{sender_key.begin(), sender_key.end()});

  auto auth_info = cosmos::tx::v1beta1::AuthInfo{};
  auto* signer = auth_info.add_signer_infos();
  signer->mutable_public_key()->set_type_url(
      std::string{kSecp256k1PubKeyTypeUrl});
  signer->mutable_public_key()->set_value(public_key.SerializeAsString());
  signer->mutable_mode_info()->mutable_single()->set_mode(
      cosmos::tx::signing::v1beta1::SIGN_MODE_DIRECT);
  signer->set_sequence(sender.sequence);

  auto* fee = auth_info.mutable_fee();
  for (const auto& coin : fee_amount) {
    *fee->add_amount() = to_wire_coin(coin);
  }
  fee->set_gas_limit(gas_limit);

  return unsigned_transaction_t{.body_bytes = body.SerializeAsString(),
                                .auth_info_bytes =
                                    auth_info.SerializeAsString()};
}

std::string make_sign_doc(const unsigned_transaction_t& transaction,
                          const std::string_view chain_id,
                          const uint64_t account_number) {
  auto sign_doc = cosmos::tx::v1beta1::SignDoc{};
  sign_doc.set_body_bytes(transaction.body_bytes);
  sign_doc.set_auth_info_bytes(transaction.auth_info_bytes);
  sign_doc.set_chain_id(std::string{chain_id});
  sign_doc.set_account_number(account_number);
  return sign_doc.SerializeAsString();
}

std::string make_tx_raw(const unsigned_transaction_t& transaction,
                        const std::string_view signature) {
  auto tx_raw = cosmos::tx::v1beta1::TxRaw{};
  tx_raw.set_body_bytes(transaction.body_bytes);
  tx_raw.set_auth_info_bytes(transaction.auth_info_bytes);
  tx_raw.add_signatures(std::string{signature});
  return tx_raw.SerializeAsString();
}

std::string make_tx_hash(const std::string_view tx_raw) {
  auto digest = remit::crypto::sha256(make_bytes_view(tx_raw));
  return remit::encoding::to_upper_hex(digest);
}

transaction_receipt_t make_receipt(
    const cosmos::base::abci::v1beta1::TxResponse& response) {
  return transaction_receipt_t{.code = response.code(),
                               .height = response.height(),
                               .tx_hash = response.txhash(),
                               .codespace = response.codespace(),
                               .raw_log = response.raw_log(),
                               .gas_wanted = response.gas_wanted(),
                               .gas_used = response.gas_used()};
}

}  // namespace remit::chain
