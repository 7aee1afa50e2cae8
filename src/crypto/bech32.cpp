#include "crypto/bech32.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <stdexcept>

namespace sealnode::crypto {

namespace {

constexpr std::string_view kCharset = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";
constexpr std::uint32_t kBech32mConstant = 0x2bc830a3;
constexpr std::size_t kChecksumLength = 6;
constexpr std::size_t kMaxLength = 120;

constexpr std::array<int, 128> BuildDecodeMap() {
  std::array<int, 128> map{};
  map.fill(-1);
  for (std::size_t i = 0; i < kCharset.size(); ++i) {
    map[static_cast<unsigned>(kCharset[i])] = static_cast<int>(i);
  }
  return map;
}

constexpr auto kDecodeMap = BuildDecodeMap();

std::uint32_t Polymod(std::span<const std::uint8_t> values) {
  constexpr std::array<std::uint32_t, 5> kGenerator = {0x3b6a57b2, 0x26508e6d, 0x1ea119fa,
                                                       0x3d4233dd, 0x2a1462b3};
  std::uint32_t chk = 1;
  for (std::uint8_t v : values) {
    const std::uint32_t top = chk >> 25;
    chk = ((chk & 0x1ffffff) << 5) ^ v;
    for (std::size_t i = 0; i < kGenerator.size(); ++i) {
      if ((top >> i) & 1) {
        chk ^= kGenerator[i];
      }
    }
  }
  return chk;
}

std::vector<std::uint8_t> ChecksumInput(std::string_view hrp, std::span<const std::uint8_t> data) {
  std::vector<std::uint8_t> values;
  values.reserve(hrp.size() * 2 + 1 + data.size() + kChecksumLength);
  for (char c : hrp) {
    values.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c) >> 5));
  }
  values.push_back(0);
  for (char c : hrp) {
    values.push_back(static_cast<std::uint8_t>(static_cast<unsigned char>(c) & 0x1F));
  }
  values.insert(values.end(), data.begin(), data.end());
  return values;
}

bool ConvertBits(std::span<const std::uint8_t> in, int from_bits, int to_bits, bool pad,
                 std::vector<std::uint8_t>* out) {
  std::uint32_t acc = 0;
  int bits = 0;
  const std::uint32_t max_value = (1u << to_bits) - 1;
  for (std::uint8_t value : in) {
    if (value >> from_bits) {
      return false;
    }
    acc = (acc << from_bits) | value;
    bits += from_bits;
    while (bits >= to_bits) {
      bits -= to_bits;
      out->push_back(static_cast<std::uint8_t>((acc >> bits) & max_value));
    }
  }
  if (pad) {
    if (bits > 0) {
      out->push_back(static_cast<std::uint8_t>((acc << (to_bits - bits)) & max_value));
    }
    return true;
  }
  return bits < from_bits && ((acc << (to_bits - bits)) & max_value) == 0;
}

bool ValidHrp(std::string_view hrp) {
  return !hrp.empty() && hrp.size() <= 83 &&
         std::all_of(hrp.begin(), hrp.end(), [](char c) {
           return c >= 0x21 && c <= 0x7E && !std::isupper(static_cast<unsigned char>(c));
         });
}

std::string EncodeValues(std::string_view hrp, std::span<const std::uint8_t> data) {
  if (!ValidHrp(hrp)) {
    throw std::invalid_argument("invalid bech32m hrp");
  }
  auto values = ChecksumInput(hrp, data);
  values.insert(values.end(), kChecksumLength, 0);
  const std::uint32_t checksum = Polymod(values) ^ kBech32mConstant;
  std::string out(hrp);
  out.push_back('1');
  for (std::uint8_t v : data) {
    out.push_back(kCharset[v]);
  }
  for (std::size_t i = 0; i < kChecksumLength; ++i) {
    out.push_back(kCharset[(checksum >> (5 * (kChecksumLength - 1 - i))) & 0x1F]);
  }
  return out;
}

// Returns the 5-bit data part with the checksum removed.
std::optional<std::vector<std::uint8_t>> DecodeValues(std::string_view text,
                                                      std::string_view expected_hrp) {
  if (text.size() > kMaxLength) {
    return std::nullopt;
  }
  std::string lowered;
  lowered.reserve(text.size());
  bool has_lower = false;
  bool has_upper = false;
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    has_lower = has_lower || std::islower(uc);
    has_upper = has_upper || std::isupper(uc);
    lowered.push_back(static_cast<char>(std::tolower(uc)));
  }
  if (has_lower && has_upper) {
    return std::nullopt;
  }
  const auto sep = lowered.rfind('1');
  if (sep == std::string::npos || sep == 0 || sep + 1 + kChecksumLength > lowered.size()) {
    return std::nullopt;
  }
  const std::string_view hrp(lowered.data(), sep);
  if (!ValidHrp(hrp) || hrp != expected_hrp) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> data;
  data.reserve(lowered.size() - sep - 1);
  for (std::size_t i = sep + 1; i < lowered.size(); ++i) {
    const auto uc = static_cast<unsigned char>(lowered[i]);
    if (uc >= 128 || kDecodeMap[uc] < 0) {
      return std::nullopt;
    }
    data.push_back(static_cast<std::uint8_t>(kDecodeMap[uc]));
  }
  if (Polymod(ChecksumInput(hrp, data)) != kBech32mConstant) {
    return std::nullopt;
  }
  data.resize(data.size() - kChecksumLength);
  return data;
}

}  // namespace

std::string EncodeBech32m(std::string_view hrp, std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> data;
  ConvertBits(payload, 8, 5, /*pad=*/true, &data);
  return EncodeValues(hrp, data);
}

std::optional<std::vector<std::uint8_t>> DecodeBech32m(std::string_view text,
                                                       std::string_view expected_hrp) {
  auto data = DecodeValues(text, expected_hrp);
  if (!data) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> payload;
  if (!ConvertBits(*data, 5, 8, /*pad=*/false, &payload)) {
    return std::nullopt;
  }
  return payload;
}

std::string EncodeSegwitAddress(std::string_view hrp, std::uint8_t witness_version,
                                std::span<const std::uint8_t> program) {
  if (witness_version == 0 || witness_version > 16) {
    throw std::invalid_argument("bech32m addresses require witness v1..v16");
  }
  std::vector<std::uint8_t> data{witness_version};
  ConvertBits(program, 8, 5, /*pad=*/true, &data);
  return EncodeValues(hrp, data);
}

}  // namespace sealnode::crypto
