#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <remit/schema/enum_string.hpp>
#include <remit/schema/primitives.hpp>
#include <string>
#include <string_view>

// Schema type: network.
// Target chain description: endpoint, chain id, address prefix and fee
// parameters used by the chain client.
namespace remit::schema {

enum class network_id : uint16_t {
  osmosis_testnet = 0,
  osmosis_mainnet = 1,
  cosmos_hub = 2,
  local = 3,
};

inline constexpr auto kNetworkIdMappings = std::array{
    std::pair<std::string_view, network_id>{"osmosis-testnet",
                                            network_id::osmosis_testnet},
    std::pair<std::string_view, network_id>{"osmosis-mainnet",
                                            network_id::osmosis_mainnet},
    std::pair<std::string_view, network_id>{"cosmos-hub",
                                            network_id::cosmos_hub},
    std::pair<std::string_view, network_id>{"local", network_id::local},
};

template <>
inline std::optional<network_id> try_from_string<network_id>(
    const std::string_view value) {
  return from_string(value, kNetworkIdMappings);
}

inline constexpr std::string_view to_string(const network_id value) {
  return name_of(value, kNetworkIdMappings);
}

template <uint16_t Version>
struct network;

template <>
struct network<1> final {
  uint16_t version{1};
  network_id id{network_id::osmosis_testnet};
  std::string chain_id;
  std::string grpc_endpoint;
  bool use_tls{true};
  std::string address_prefix;
  std::string fee_denom;
  double gas_price{0.025};
  double gas_multiplier{1.3};
  duration_milliseconds_t request_timeout{15000};
  duration_milliseconds_t confirmation_timeout{60000};
  duration_milliseconds_t poll_interval{1000};
  std::string memo;
};

using network_t = network<1>;

/// Built-in parameters for a known network.
network_t make_network(network_id id);

}  // namespace remit::schema
