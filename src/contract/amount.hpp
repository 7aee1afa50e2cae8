#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

namespace sealnode::contract {

// Asset amounts are integers of the smallest unit (10^-precision).
using AssetAmount = std::uint64_t;

inline constexpr std::uint8_t kMaxPrecision = 18;

inline bool CheckedAdd(AssetAmount a, AssetAmount b, AssetAmount* out) noexcept {
  if (a > std::numeric_limits<AssetAmount>::max() - b) {
    return false;
  }
  *out = a + b;
  return true;
}

inline bool CheckedSub(AssetAmount a, AssetAmount b, AssetAmount* out) noexcept {
  if (b > a) {
    return false;
  }
  *out = a - b;
  return true;
}

// "1234" with precision 2 -> "12.34". Trailing zeros are kept.
std::string FormatAmount(AssetAmount atomic, std::uint8_t precision);

// Accepts "12", "12.3", "12.34" for precision 2 and returns atomic units.
// Throws Error(kValidation) if more fraction digits than `precision` are given
// or the value does not fit in 64 bits.
AssetAmount ParseDecimalAmount(std::string_view text, std::uint8_t precision);

}  // namespace sealnode::contract
