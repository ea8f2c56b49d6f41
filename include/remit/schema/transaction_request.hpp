#pragma once

#include <remit/schema/coin.hpp>
#include <remit/schema/primitives.hpp>
#include <string>
#include <string_view>

namespace remit::validation {
class validator;
}

// Schema type: transaction request.
// Immutable, validated description of the single transfer a run performs.
namespace remit::schema {

/// A request can only be produced by `remit::validation::validator`, so every
/// instance in the program has passed validation as a whole.
class transaction_request final {
 public:
  const amount_t& amount() const { return amount_; }
  const std::string& denomination() const { return denomination_; }
  const std::string& destination() const { return destination_; }

  /// The single coin this request transfers, in chain-client form.
  coin_t coin() const;

 private:
  friend class remit::validation::validator;

  transaction_request(amount_t amount,
                      std::string denomination,
                      std::string destination);

  amount_t amount_;
  std::string denomination_;
  std::string destination_;
};

using transaction_request_t = transaction_request;

bool operator==(const transaction_request_t& lhs,
                const transaction_request_t& rhs);

}  // namespace remit::schema
