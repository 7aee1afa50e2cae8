#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealnode::crypto {

// Bech32m (BIP-350) text encoding of an arbitrary byte payload, used for
// concealed seals ("utxob1...") and contract ids ("rgb1...").
std::string EncodeBech32m(std::string_view hrp, std::span<const std::uint8_t> payload);
std::optional<std::vector<std::uint8_t>> DecodeBech32m(std::string_view text,
                                                       std::string_view expected_hrp);

// Segwit v1+ address for host outputs (witness version prefixed, BIP-350).
std::string EncodeSegwitAddress(std::string_view hrp, std::uint8_t witness_version,
                                std::span<const std::uint8_t> program);

}  // namespace sealnode::crypto
