#include "util/hex.hpp"

#include <algorithm>

namespace sealnode::util {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int NibbleValue(char c) noexcept {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

bool DecodeInto(std::string_view hex, std::uint8_t* out, std::size_t count) {
  for (std::size_t i = 0; i < count; ++i) {
    const int hi = NibbleValue(hex[2 * i]);
    const int lo = NibbleValue(hex[2 * i + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    out[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  return true;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out(data.size() * 2, '0');
  for (std::size_t i = 0; i < data.size(); ++i) {
    out[2 * i] = kHexDigits[data[i] >> 4];
    out[2 * i + 1] = kHexDigits[data[i] & 0x0F];
  }
  return out;
}

std::string HexEncodeReversed(std::span<const std::uint8_t> data) {
  std::vector<std::uint8_t> reversed(data.rbegin(), data.rend());
  return HexEncode(reversed);
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  std::vector<std::uint8_t> bytes(hex.size() / 2);
  if (!DecodeInto(hex, bytes.data(), bytes.size())) {
    return false;
  }
  *out = std::move(bytes);
  return true;
}

bool HexDecodeFixed(std::string_view hex, std::span<std::uint8_t> out) {
  if (hex.size() != out.size() * 2) {
    return false;
  }
  return DecodeInto(hex, out.data(), out.size());
}

bool HexDecodeReversed(std::string_view hex, std::span<std::uint8_t> out) {
  if (!HexDecodeFixed(hex, out)) {
    return false;
  }
  std::reverse(out.begin(), out.end());
  return true;
}

bool IsHex(std::string_view text) noexcept {
  return std::all_of(text.begin(), text.end(), [](char c) { return NibbleValue(c) >= 0; });
}

}  // namespace sealnode::util
