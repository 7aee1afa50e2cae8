#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace sealnode::util {

// Zeroes memory in a way the optimizer cannot elide.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  data.clear();
}

inline void SecureWipe(std::string& data) noexcept {
  SecureWipe(data.data(), data.size());
  data.clear();
}

template <std::size_t N>
inline void SecureWipe(std::array<std::uint8_t, N>& data) noexcept {
  SecureWipe(data.data(), N);
}

}  // namespace sealnode::util
