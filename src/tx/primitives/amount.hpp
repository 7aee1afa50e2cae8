#pragma once

#include <cstdint>

namespace sealnode::primitives {

using Amount = std::uint64_t;  // satoshis

inline constexpr Amount kSatoshisPerBitcoin = 100'000'000ULL;
inline constexpr Amount kMaxMoney = 21'000'000ULL * kSatoshisPerBitcoin;
// Smallest non-dust value for the host outputs that carry change seals.
inline constexpr Amount kDustLimit = 546;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

}  // namespace sealnode::primitives
