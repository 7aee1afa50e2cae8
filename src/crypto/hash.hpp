#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sealnode::crypto {

using Hash256 = std::array<std::uint8_t, 32>;

Hash256 Sha256(std::span<const std::uint8_t> data);
Hash256 DoubleSha256(std::span<const std::uint8_t> data);
Hash256 Sha3_256(std::span<const std::uint8_t> data);

// BIP-340 style domain separation: SHA256(SHA256(tag) || SHA256(tag) || data).
Hash256 TaggedHash(std::string_view tag, std::span<const std::uint8_t> data);

// Canonical little-endian encoder for hashing structured records. Strings and
// byte strings are length prefixed so adjacent fields cannot be confused.
class HashWriter {
 public:
  HashWriter& U8(std::uint8_t value);
  HashWriter& U16(std::uint16_t value);
  HashWriter& U32(std::uint32_t value);
  HashWriter& U64(std::uint64_t value);
  HashWriter& Bytes(std::span<const std::uint8_t> data);
  HashWriter& Fixed(std::span<const std::uint8_t> data);
  HashWriter& Str(std::string_view text);

  Hash256 Tagged(std::string_view tag) const { return TaggedHash(tag, buffer_); }
  const std::vector<std::uint8_t>& Buffer() const noexcept { return buffer_; }

 private:
  std::vector<std::uint8_t> buffer_;
};

}  // namespace sealnode::crypto
