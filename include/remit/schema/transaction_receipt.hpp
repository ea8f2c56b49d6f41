#pragma once

#include <cstdint>
#include <string>

// Schema type: transaction receipt.
// The chain's acknowledgment of a broadcast transfer. `code` 0 means the
// transfer was executed; any other value is a chain-reported failure.
namespace remit::schema {

template <uint16_t Version>
struct transaction_receipt;

template <>
struct transaction_receipt<1> final {
  uint16_t version{1};
  uint32_t code{};
  int64_t height{};
  std::string tx_hash;
  std::string codespace;
  std::string raw_log;
  int64_t gas_wanted{};
  int64_t gas_used{};
};

using transaction_receipt_t = transaction_receipt<1>;

}  // namespace remit::schema
