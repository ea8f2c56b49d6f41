#pragma once

#include <remit/chain/client.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace remit::testing {

/// What the fake chain answers. Unset optionals make the matching call fail.
struct fake_chain_script_t final {
  bool connect_succeeds{true};
  std::string connect_error{"connection refused"};
  std::optional<std::vector<remit::schema::coin_t>> balances{
      std::vector<remit::schema::coin_t>{}};
  std::string balance_error{"node unavailable"};
  std::optional<remit::schema::transaction_receipt_t> receipt;
  remit::chain::send_error_t send_error;
  /// Runs inside all_balances, before it answers.
  std::function<void()> on_balance_query;
};

struct fake_chain_calls_t final {
  std::vector<std::string> order;
  std::string balance_address;
  std::string sender;
  std::string destination;
  std::vector<remit::schema::coin_t> coins;

  std::size_t count(const std::string& call) const {
    auto n = std::size_t{0};
    for (const auto& entry : order) {
      if (entry == call) {
        ++n;
      }
    }
    return n;
  }
};

class fake_connection final : public remit::chain::connection {
 public:
  fake_connection(const fake_chain_script_t& script, fake_chain_calls_t& calls)
      : script_{script}, calls_{calls} {}

  std::optional<std::vector<remit::schema::coin_t>> all_balances(
      std::string_view address,
      std::string& error) override {
    calls_.order.emplace_back("all_balances");
    calls_.balance_address = std::string{address};
    if (script_.on_balance_query) {
      script_.on_balance_query();
    }
    if (!script_.balances) {
      error = script_.balance_error;
    }
    return script_.balances;
  }

  std::optional<remit::schema::transaction_receipt_t> send_coins(
      const remit::wallet::signing_wallet_t& wallet,
      std::string_view destination,
      const std::vector<remit::schema::coin_t>& coins,
      remit::chain::send_error_t& error) override {
    calls_.order.emplace_back("send_coins");
    calls_.sender = wallet.address();
    calls_.destination = std::string{destination};
    calls_.coins = coins;
    if (!script_.receipt) {
      error = script_.send_error;
    }
    return script_.receipt;
  }

 private:
  const fake_chain_script_t& script_;
  fake_chain_calls_t& calls_;
};

class fake_connector final : public remit::chain::connector {
 public:
  fake_chain_script_t script;
  fake_chain_calls_t calls;

  std::unique_ptr<remit::chain::connection> connect(
      const remit::schema::network_t& /*network*/,
      std::string& error) override {
    calls.order.emplace_back("connect");
    if (!script.connect_succeeds) {
      error = script.connect_error;
      return nullptr;
    }
    return std::make_unique<fake_connection>(script, calls);
  }
};

}  // namespace remit::testing
