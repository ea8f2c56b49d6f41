#include <remit/schema/network.hpp>

namespace remit::schema {

network_t make_network(const network_id id) {
  switch (id) {
    case network_id::osmosis_mainnet:
      return network_t{.id = id,
                       .chain_id = "osmosis-1",
                       .grpc_endpoint = "grpc.osmosis.zone:443",
                       .use_tls = true,
                       .address_prefix = "osmo",
                       .fee_denom = "uosmo"};
    case network_id::cosmos_hub:
      return network_t{.id = id,
                       .chain_id = "cosmoshub-4",
                       .grpc_endpoint = "cosmos-grpc.polkachu.com:14990",
                       .use_tls = false,
                       .address_prefix = "cosmos",
                       .fee_denom = "uatom"};
    case network_id::local:
      return network_t{.id = id,
                       .chain_id = "localnet",
                       .grpc_endpoint = "localhost:9090",
                       .use_tls = false,
                       .address_prefix = "osmo",
                       .fee_denom = "uosmo"};
    case network_id::osmosis_testnet:
    default:
      return network_t{.id = network_id::osmosis_testnet,
                       .chain_id = "osmo-test-5",
                       .grpc_endpoint = "grpc.osmotest5.osmosis.zone:443",
                       .use_tls = true,
                       .address_prefix = "osmo",
                       .fee_denom = "uosmo"};
  }
}

}  // namespace remit::schema
