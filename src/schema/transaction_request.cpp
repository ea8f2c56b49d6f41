#include <remit/schema/transaction_request.hpp>

#include <utility>

namespace remit::schema {

transaction_request::transaction_request(amount_t amount,
                                         std::string denomination,
                                         std::string destination)
    : amount_{std::move(amount)},
      denomination_{std::move(denomination)},
      destination_{std::move(destination)} {}

coin_t transaction_request::coin() const {
  return coin_t{.denom = denomination_, .amount = to_string(amount_)};
}

bool operator==(const transaction_request_t& lhs,
                const transaction_request_t& rhs) {
  return lhs.amount() == rhs.amount() &&
         lhs.denomination() == rhs.denomination() &&
         lhs.destination() == rhs.destination();
}

}  // namespace remit::schema
