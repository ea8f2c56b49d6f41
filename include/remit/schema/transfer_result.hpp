#pragma once

#include <cstdint>
#include <optional>
#include <remit/schema/transaction_receipt.hpp>
#include <string>

namespace remit::schema {

template <uint16_t Version>
struct transfer_result;

/// Outcome of one orchestrated transfer.
///
/// `code` is 0 only when the broadcast succeeded and the chain executed the
/// transfer. `receipt` is present whenever the chain produced one, including
/// logical failures; it is absent for every failure that happened before or
/// during transport.
template <>
struct transfer_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string codespace;
  std::string log;
  std::optional<transaction_receipt_t> receipt;
};

using transfer_result_t = transfer_result<1>;

}  // namespace remit::schema
