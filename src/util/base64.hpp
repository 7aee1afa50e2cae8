#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealnode::util {

std::string Base64Encode(std::span<const std::uint8_t> input);
inline std::string Base64Encode(std::string_view input) {
  return Base64Encode(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(input.data()), input.size()));
}

// Accepts padded input only. ASCII whitespace (line-wrapped PSBTs) is skipped.
bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out);
std::optional<std::string> Base64DecodeToString(std::string_view input);

}  // namespace sealnode::util
