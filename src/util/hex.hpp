#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealnode::util {

std::string HexEncode(std::span<const std::uint8_t> data);
// Byte-reversed encoding, the display order Bitcoin uses for txids.
std::string HexEncodeReversed(std::span<const std::uint8_t> data);

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);
// Decodes exactly out.size() bytes; anything else is rejected.
bool HexDecodeFixed(std::string_view hex, std::span<std::uint8_t> out);
bool HexDecodeReversed(std::string_view hex, std::span<std::uint8_t> out);

bool IsHex(std::string_view text) noexcept;

}  // namespace sealnode::util
