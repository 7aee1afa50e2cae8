#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace sealnode::util {

// Fills `out` from the kernel CSPRNG (getrandom, then /dev/urandom).
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Throwing helpers for callers that cannot continue without entropy.
std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);
std::uint64_t SecureRandomUint64();

}  // namespace sealnode::util
