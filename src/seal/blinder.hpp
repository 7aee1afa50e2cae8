#pragma once

#include <cstdint>
#include <span>
#include <string_view>

#include "seal/seal.hpp"

namespace sealnode::seal {

struct BlindedSeal {
  RevealedSeal revealed;
  ConcealedSeal concealed;
};

// Draws a fresh 64-bit blinding factor from the system CSPRNG. Two calls for
// the same outpoint yield unrelated concealed seals.
BlindedSeal Blind(const Outpoint& outpoint, CloseMethod method);

BlindedSeal BlindWithFactor(const Outpoint& outpoint, CloseMethod method, std::uint64_t blinding);

// Blinding reproducible by the holder of `secret` and unpredictable to anyone
// else. `purpose` separates independent uses of the same outpoint.
std::uint64_t DeriveBlinding(std::span<const std::uint8_t> secret, const Outpoint& outpoint,
                             CloseMethod method, std::string_view purpose);

}  // namespace sealnode::seal
