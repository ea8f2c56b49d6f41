#pragma once
#include <remit/schema/primitives.hpp>
#include <string>

// Schema type: coin.
// A single denomination/amount pair as exchanged with the chain client.
namespace remit::schema {

template <uint16_t Version>
struct coin;

template <>
struct coin<1> final {
  uint16_t version{1};
  std::string denom;
  std::string amount;
};

using coin_t = coin<1>;

inline bool operator==(const coin_t& lhs, const coin_t& rhs) {
  return lhs.denom == rhs.denom && lhs.amount == rhs.amount;
}

}  // namespace remit::schema
