#include "config/network.hpp"

#include <mutex>

namespace sealnode::config {

namespace {

NetworkConfig BuildConfig(NetworkType type, std::string id, std::string hrp,
                          std::string data_subdir) {
  NetworkConfig cfg;
  cfg.type = type;
  cfg.network_id = std::move(id);
  cfg.bech32_hrp = std::move(hrp);
  cfg.data_subdir = std::move(data_subdir);
  return cfg;
}

const NetworkConfig& ConfigFor(NetworkType type) {
  static const NetworkConfig bitcoin = BuildConfig(NetworkType::kBitcoin, "bitcoin", "bc", "");
  static const NetworkConfig testnet = BuildConfig(NetworkType::kTestnet, "testnet", "tb", "testnet");
  static const NetworkConfig signet = BuildConfig(NetworkType::kSignet, "signet", "tb", "signet");
  static const NetworkConfig regtest = BuildConfig(NetworkType::kRegtest, "regtest", "bcrt", "regtest");
  switch (type) {
    case NetworkType::kBitcoin:
      return bitcoin;
    case NetworkType::kTestnet:
      return testnet;
    case NetworkType::kSignet:
      return signet;
    case NetworkType::kRegtest:
      return regtest;
  }
  return bitcoin;
}

std::mutex g_network_mutex;
const NetworkConfig* g_network_config = &ConfigFor(NetworkType::kBitcoin);

}  // namespace

const NetworkConfig& GetNetworkConfig() {
  std::lock_guard<std::mutex> lock(g_network_mutex);
  return *g_network_config;
}

void SelectNetwork(NetworkType type) {
  std::lock_guard<std::mutex> lock(g_network_mutex);
  g_network_config = &ConfigFor(type);
}

std::optional<NetworkType> NetworkFromString(std::string_view name) {
  if (name == "bitcoin" || name == "mainnet" || name == "main") return NetworkType::kBitcoin;
  if (name == "testnet" || name == "test") return NetworkType::kTestnet;
  if (name == "signet" || name == "sig") return NetworkType::kSignet;
  if (name == "regtest" || name == "reg") return NetworkType::kRegtest;
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) { return ConfigFor(type).network_id; }

}  // namespace sealnode::config
