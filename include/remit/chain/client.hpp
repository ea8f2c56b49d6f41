#pragma once

#include <memory>
#include <optional>
#include <remit/schema/coin.hpp>
#include <remit/schema/network.hpp>
#include <remit/schema/transaction_receipt.hpp>
#include <remit/schema/transfer_error_code.hpp>
#include <remit/wallet/signing_wallet.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace remit::chain {

/// Failure detail for a send. `code` separates transport failures
/// (`broadcast_error`) from a submitted transaction that was never seen in a
/// block (`confirmation_timeout`).
struct send_error_t final {
  remit::schema::transfer_error_code code{
      remit::schema::transfer_error_code::broadcast_error};
  std::string message;
};

/// Live handle to one network, owned by the run that opened it.
///
/// Failures are reported by returning std::nullopt and filling `error` with
/// whatever context the node supplied.
class connection {
 public:
  virtual ~connection() = default;

  /// All balances held by `address`.
  virtual std::optional<std::vector<remit::schema::coin_t>> all_balances(
      std::string_view address,
      std::string& error) = 0;

  /// Sign and submit one transfer of `coins` from `wallet` to `destination`.
  ///
  /// A receipt is returned whenever the chain answered, including when it
  /// rejected the transfer (non-zero `code`). Implementations submit at most
  /// once.
  virtual std::optional<remit::schema::transaction_receipt_t> send_coins(
      const remit::wallet::signing_wallet_t& wallet,
      std::string_view destination,
      const std::vector<remit::schema::coin_t>& coins,
      send_error_t& error) = 0;
};

/// Opens connections to a network.
class connector {
 public:
  virtual ~connector() = default;

  virtual std::unique_ptr<connection> connect(
      const remit::schema::network_t& network,
      std::string& error) = 0;
};

}  // namespace remit::chain
