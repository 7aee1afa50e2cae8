#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace sealnode::script {

inline constexpr std::uint8_t kOp1 = 0x51;
inline constexpr std::uint8_t kOpReturn = 0x6a;
inline constexpr std::uint8_t kOpPushData1 = 0x4c;
inline constexpr std::size_t kMaxOpReturnPayload = 80;

// OP_RETURN <payload>; payload must not exceed 80 bytes.
std::vector<std::uint8_t> BuildOpReturn(std::span<const std::uint8_t> payload);
std::optional<std::vector<std::uint8_t>> ExtractOpReturnPayload(
    std::span<const std::uint8_t> script_pubkey);

// OP_1 <32-byte x-only key>
std::vector<std::uint8_t> BuildTaprootOutput(const std::array<std::uint8_t, 32>& x_only_key);
std::optional<std::array<std::uint8_t, 32>> ExtractTaprootKey(
    std::span<const std::uint8_t> script_pubkey);

}  // namespace sealnode::script
