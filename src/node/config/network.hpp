#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sealnode::config {

enum class NetworkType {
  kBitcoin,
  kTestnet,
  kSignet,
  kRegtest,
};

struct NetworkConfig {
  NetworkType type{NetworkType::kBitcoin};
  std::string network_id{"bitcoin"};
  // Address prefix for the host outputs of witness transactions.
  std::string bech32_hrp{"bc"};
  std::uint16_t rpc_port{7070};
  // Appended to the data directory; empty for bitcoin.
  std::string data_subdir;
};

const NetworkConfig& GetNetworkConfig();
void SelectNetwork(NetworkType type);
std::optional<NetworkType> NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace sealnode::config
