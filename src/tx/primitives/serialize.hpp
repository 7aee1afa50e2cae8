#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "primitives/transaction.hpp"

namespace sealnode::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
// CompactSize length prefix followed by the bytes.
void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data);

bool ReadUint32(std::span<const std::uint8_t> data, std::size_t* offset, std::uint32_t* value);
bool ReadUint64(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value);
// Rejects non-canonical CompactSize encodings.
bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value);
bool ReadBytes(std::span<const std::uint8_t> data, std::size_t* offset,
               std::vector<std::uint8_t>* out);

// BIP-144 encoding; the marker/flag pair is only emitted when a witness is
// present and requested.
void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness = true);
bool DeserializeTransaction(std::span<const std::uint8_t> data, std::size_t* offset,
                            CTransaction* tx);

}  // namespace sealnode::primitives::serialize
