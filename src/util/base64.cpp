#include "util/base64.hpp"

#include <array>
#include <cctype>

namespace sealnode::util {

namespace {

constexpr std::string_view kAlphabet =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
constexpr int kPad = -2;
constexpr int kInvalid = -1;

constexpr std::array<int, 256> BuildReverseTable() {
  std::array<int, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    table[static_cast<unsigned char>(kAlphabet[i])] = static_cast<int>(i);
  }
  table[static_cast<unsigned char>('=')] = kPad;
  return table;
}

constexpr auto kReverse = BuildReverseTable();

}  // namespace

std::string Base64Encode(std::span<const std::uint8_t> input) {
  std::string out;
  out.reserve(((input.size() + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 3 <= input.size(); i += 3) {
    const std::uint32_t group = (static_cast<std::uint32_t>(input[i]) << 16) |
                                (static_cast<std::uint32_t>(input[i + 1]) << 8) | input[i + 2];
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.push_back(kAlphabet[(group >> 6) & 0x3F]);
    out.push_back(kAlphabet[group & 0x3F]);
  }
  const std::size_t tail = input.size() - i;
  if (tail == 1) {
    const std::uint32_t group = static_cast<std::uint32_t>(input[i]) << 16;
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.append("==");
  } else if (tail == 2) {
    const std::uint32_t group =
        (static_cast<std::uint32_t>(input[i]) << 16) | (static_cast<std::uint32_t>(input[i + 1]) << 8);
    out.push_back(kAlphabet[(group >> 18) & 0x3F]);
    out.push_back(kAlphabet[(group >> 12) & 0x3F]);
    out.push_back(kAlphabet[(group >> 6) & 0x3F]);
    out.push_back('=');
  }
  return out;
}

bool Base64Decode(std::string_view input, std::vector<std::uint8_t>* out) {
  std::vector<int> sextets;
  sextets.reserve(input.size());
  std::size_t padding = 0;
  for (unsigned char c : input) {
    if (std::isspace(c)) {
      continue;
    }
    const int value = kReverse[c];
    if (value == kInvalid) {
      return false;
    }
    if (value == kPad) {
      ++padding;
      continue;
    }
    if (padding > 0) {
      return false;
    }
    sextets.push_back(value);
  }
  if ((sextets.size() + padding) % 4 != 0 || padding > 2) {
    return false;
  }
  std::vector<std::uint8_t> bytes;
  bytes.reserve(sextets.size() * 3 / 4);
  std::uint32_t acc = 0;
  int bits = 0;
  for (int v : sextets) {
    acc = (acc << 6) | static_cast<std::uint32_t>(v);
    bits += 6;
    if (bits >= 8) {
      bits -= 8;
      bytes.push_back(static_cast<std::uint8_t>((acc >> bits) & 0xFF));
    }
  }
  *out = std::move(bytes);
  return true;
}

std::optional<std::string> Base64DecodeToString(std::string_view input) {
  std::vector<std::uint8_t> bytes;
  if (!Base64Decode(input, &bytes)) {
    return std::nullopt;
  }
  return std::string(bytes.begin(), bytes.end());
}

}  // namespace sealnode::util
