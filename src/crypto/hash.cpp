#include "crypto/hash.hpp"

#include <oqs/sha2.h>
#include <oqs/sha3.h>

namespace sealnode::crypto {

Hash256 Sha256(std::span<const std::uint8_t> data) {
  Hash256 out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Hash256 DoubleSha256(std::span<const std::uint8_t> data) {
  const Hash256 first = Sha256(data);
  return Sha256(first);
}

Hash256 Sha3_256(std::span<const std::uint8_t> data) {
  Hash256 out{};
  OQS_SHA3_sha3_256(out.data(), data.data(), data.size());
  return out;
}

Hash256 TaggedHash(std::string_view tag, std::span<const std::uint8_t> data) {
  const Hash256 tag_hash = Sha256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(tag.data()), tag.size()));
  std::vector<std::uint8_t> preimage;
  preimage.reserve(tag_hash.size() * 2 + data.size());
  preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
  preimage.insert(preimage.end(), tag_hash.begin(), tag_hash.end());
  preimage.insert(preimage.end(), data.begin(), data.end());
  return Sha256(preimage);
}

HashWriter& HashWriter::U8(std::uint8_t value) {
  buffer_.push_back(value);
  return *this;
}

HashWriter& HashWriter::U16(std::uint16_t value) {
  buffer_.push_back(static_cast<std::uint8_t>(value & 0xFF));
  buffer_.push_back(static_cast<std::uint8_t>(value >> 8));
  return *this;
}

HashWriter& HashWriter::U32(std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    buffer_.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
  return *this;
}

HashWriter& HashWriter::U64(std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    buffer_.push_back(static_cast<std::uint8_t>((value >> (8 * i)) & 0xFF));
  }
  return *this;
}

HashWriter& HashWriter::Bytes(std::span<const std::uint8_t> data) {
  U32(static_cast<std::uint32_t>(data.size()));
  return Fixed(data);
}

HashWriter& HashWriter::Fixed(std::span<const std::uint8_t> data) {
  buffer_.insert(buffer_.end(), data.begin(), data.end());
  return *this;
}

HashWriter& HashWriter::Str(std::string_view text) {
  return Bytes(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                             text.size()));
}

}  // namespace sealnode::crypto
