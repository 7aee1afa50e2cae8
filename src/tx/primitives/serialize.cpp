#include "primitives/serialize.hpp"

#include <algorithm>

namespace sealnode::primitives::serialize {

namespace {

constexpr std::uint64_t kMaxVectorItems = 1u << 16;
constexpr std::uint64_t kMaxWitnessItems = 64;

bool Require(std::span<const std::uint8_t> data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

bool ReadCount(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t limit,
               std::size_t* count) {
  std::uint64_t value = 0;
  if (!ReadVarInt(data, offset, &value) || value > limit) {
    return false;
  }
  *count = static_cast<std::size_t>(value);
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFF));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data) {
  WriteVarInt(out, data.size());
  out->insert(out->end(), data.begin(), data.end());
}

bool ReadUint32(std::span<const std::uint8_t> data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  std::uint32_t result = 0;
  for (int i = 0; i < 4; ++i) {
    result |= static_cast<std::uint32_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 4;
  return true;
}

bool ReadUint64(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(std::span<const std::uint8_t> data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    *value = v16;
    return v16 >= 0xFD;
  }
  if (prefix == 0xFE) {
    std::uint32_t v32 = 0;
    if (!ReadUint32(data, offset, &v32)) return false;
    *value = v32;
    return v32 > 0xFFFF;
  }
  std::uint64_t v64 = 0;
  if (!ReadUint64(data, offset, &v64)) return false;
  *value = v64;
  return v64 > 0xFFFFFFFFULL;
}

bool ReadBytes(std::span<const std::uint8_t> data, std::size_t* offset,
               std::vector<std::uint8_t>* out) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size) || size > data.size() ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  out->assign(data.begin() + static_cast<std::ptrdiff_t>(*offset),
              data.begin() + static_cast<std::ptrdiff_t>(*offset + size));
  *offset += static_cast<std::size_t>(size);
  return true;
}

void SerializeTransaction(const CTransaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness) {
  const bool with_witness = include_witness && tx.HasWitness();
  WriteUint32(out, tx.version);
  if (with_witness) {
    out->push_back(0x00);  // marker
    out->push_back(0x01);  // flag
  }
  WriteVarInt(out, tx.vin.size());
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    WriteUint32(out, in.prevout.index);
    WriteBytes(out, in.script_sig);
    WriteUint32(out, in.sequence);
  }
  WriteVarInt(out, tx.vout.size());
  for (const auto& txout : tx.vout) {
    WriteUint64(out, txout.value);
    WriteBytes(out, txout.script_pubkey);
  }
  if (with_witness) {
    for (const auto& in : tx.vin) {
      WriteVarInt(out, in.witness.size());
      for (const auto& item : in.witness) {
        WriteBytes(out, item);
      }
    }
  }
  WriteUint32(out, tx.lock_time);
}

bool DeserializeTransaction(std::span<const std::uint8_t> data, std::size_t* offset,
                            CTransaction* tx) {
  CTransaction parsed;
  std::size_t cursor = *offset;
  if (!ReadUint32(data, &cursor, &parsed.version)) return false;
  bool has_witness = false;
  if (Require(data, cursor, 2) && data[cursor] == 0x00) {
    if (data[cursor + 1] != 0x01) return false;
    has_witness = true;
    cursor += 2;
  }
  std::size_t vin_count = 0;
  if (!ReadCount(data, &cursor, kMaxVectorItems, &vin_count)) return false;
  if (has_witness && vin_count == 0) return false;
  parsed.vin.resize(vin_count);
  for (auto& in : parsed.vin) {
    if (!Require(data, cursor, in.prevout.txid.size())) return false;
    std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(cursor), in.prevout.txid.size(),
                in.prevout.txid.begin());
    cursor += in.prevout.txid.size();
    if (!ReadUint32(data, &cursor, &in.prevout.index) ||
        !ReadBytes(data, &cursor, &in.script_sig) || !ReadUint32(data, &cursor, &in.sequence)) {
      return false;
    }
  }
  std::size_t vout_count = 0;
  if (!ReadCount(data, &cursor, kMaxVectorItems, &vout_count)) return false;
  parsed.vout.resize(vout_count);
  for (auto& txout : parsed.vout) {
    if (!ReadUint64(data, &cursor, &txout.value) ||
        !ReadBytes(data, &cursor, &txout.script_pubkey)) {
      return false;
    }
  }
  if (has_witness) {
    for (auto& in : parsed.vin) {
      std::size_t items = 0;
      if (!ReadCount(data, &cursor, kMaxWitnessItems, &items)) return false;
      in.witness.resize(items);
      for (auto& item : in.witness) {
        if (!ReadBytes(data, &cursor, &item)) return false;
      }
    }
  }
  if (!ReadUint32(data, &cursor, &parsed.lock_time)) return false;
  *tx = std::move(parsed);
  *offset = cursor;
  return true;
}

}  // namespace sealnode::primitives::serialize
