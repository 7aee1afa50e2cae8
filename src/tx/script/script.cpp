#include "script/script.hpp"

#include <algorithm>
#include <stdexcept>

namespace sealnode::script {

std::vector<std::uint8_t> BuildOpReturn(std::span<const std::uint8_t> payload) {
  if (payload.size() > kMaxOpReturnPayload) {
    throw std::invalid_argument("OP_RETURN payload too large");
  }
  std::vector<std::uint8_t> script{kOpReturn};
  if (payload.size() >= kOpPushData1) {
    script.push_back(kOpPushData1);
  }
  script.push_back(static_cast<std::uint8_t>(payload.size()));
  script.insert(script.end(), payload.begin(), payload.end());
  return script;
}

std::optional<std::vector<std::uint8_t>> ExtractOpReturnPayload(
    std::span<const std::uint8_t> script_pubkey) {
  if (script_pubkey.size() < 2 || script_pubkey[0] != kOpReturn) {
    return std::nullopt;
  }
  std::size_t pos = 1;
  if (script_pubkey[pos] == kOpPushData1) {
    ++pos;
    if (pos >= script_pubkey.size()) {
      return std::nullopt;
    }
  } else if (script_pubkey[pos] >= kOpPushData1) {
    return std::nullopt;
  }
  const std::size_t len = script_pubkey[pos++];
  if (pos + len != script_pubkey.size()) {
    return std::nullopt;
  }
  return std::vector<std::uint8_t>(script_pubkey.begin() + static_cast<std::ptrdiff_t>(pos),
                                   script_pubkey.end());
}

std::vector<std::uint8_t> BuildTaprootOutput(const std::array<std::uint8_t, 32>& x_only_key) {
  std::vector<std::uint8_t> script{kOp1, 0x20};
  script.insert(script.end(), x_only_key.begin(), x_only_key.end());
  return script;
}

std::optional<std::array<std::uint8_t, 32>> ExtractTaprootKey(
    std::span<const std::uint8_t> script_pubkey) {
  if (script_pubkey.size() != 34 || script_pubkey[0] != kOp1 || script_pubkey[1] != 0x20) {
    return std::nullopt;
  }
  std::array<std::uint8_t, 32> key{};
  std::copy(script_pubkey.begin() + 2, script_pubkey.end(), key.begin());
  return key;
}

}  // namespace sealnode::script
