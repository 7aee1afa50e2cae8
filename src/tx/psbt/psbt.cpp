#include "psbt/psbt.hpp"

#include <algorithm>

#include "primitives/serialize.hpp"
#include "util/base64.hpp"

namespace sealnode::psbt {

namespace {

namespace ser = primitives::serialize;

constexpr std::uint8_t kMagic[] = {'p', 's', 'b', 't', 0xFF};

struct RawPair {
  Bytes key;
  Bytes value;
};

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

void WritePair(Bytes* out, std::span<const std::uint8_t> key, std::span<const std::uint8_t> value) {
  ser::WriteBytes(out, key);
  ser::WriteBytes(out, value);
}

Bytes ProprietaryKeyBytes(const ProprietaryKey& key) {
  Bytes out{kProprietary};
  ser::WriteBytes(&out, std::span<const std::uint8_t>(
                            reinterpret_cast<const std::uint8_t*>(kProprietaryId.data()),
                            kProprietaryId.size()));
  ser::WriteVarInt(&out, key.subtype);
  out.insert(out.end(), key.key_data.begin(), key.key_data.end());
  return out;
}

void WriteProprietary(Bytes* out, const std::map<ProprietaryKey, Bytes>& map) {
  for (const auto& [key, value] : map) {
    WritePair(out, ProprietaryKeyBytes(key), value);
  }
}

void WriteUnknown(Bytes* out, const std::map<Bytes, Bytes>& map) {
  for (const auto& [key, value] : map) {
    WritePair(out, key, value);
  }
}

// Reads one key/value map up to its 0x00 separator.
bool ReadMap(std::span<const std::uint8_t> data, std::size_t* offset, std::vector<RawPair>* pairs) {
  while (true) {
    Bytes key;
    if (!ser::ReadBytes(data, offset, &key)) {
      return false;
    }
    if (key.empty()) {
      return true;
    }
    Bytes value;
    if (!ser::ReadBytes(data, offset, &value)) {
      return false;
    }
    for (const auto& existing : *pairs) {
      if (existing.key == key) {
        return false;  // duplicate keys are invalid per BIP-174
      }
    }
    pairs->push_back(RawPair{std::move(key), std::move(value)});
  }
}

// Returns true and fills `out` for proprietary keys carrying our identifier.
bool ParseOwnProprietary(const Bytes& key, ProprietaryKey* out) {
  std::size_t offset = 1;
  Bytes identifier;
  if (!ser::ReadBytes(key, &offset, &identifier)) {
    return false;
  }
  if (std::string_view(reinterpret_cast<const char*>(identifier.data()), identifier.size()) !=
      kProprietaryId) {
    return false;
  }
  std::uint64_t subtype = 0;
  if (!ser::ReadVarInt(key, &offset, &subtype)) {
    return false;
  }
  out->subtype = subtype;
  out->key_data.assign(key.begin() + static_cast<std::ptrdiff_t>(offset), key.end());
  return true;
}

bool DecodeWitness(const Bytes& value, std::vector<Bytes>* stack) {
  std::size_t offset = 0;
  std::uint64_t count = 0;
  if (!ser::ReadVarInt(value, &offset, &count) || count > value.size()) {
    return false;
  }
  stack->resize(static_cast<std::size_t>(count));
  for (auto& item : *stack) {
    if (!ser::ReadBytes(value, &offset, &item)) {
      return false;
    }
  }
  return offset == value.size();
}

Bytes EncodeWitness(const std::vector<Bytes>& stack) {
  Bytes out;
  ser::WriteVarInt(&out, stack.size());
  for (const auto& item : stack) {
    ser::WriteBytes(&out, item);
  }
  return out;
}

}  // namespace

Psbt Psbt::FromTransaction(primitives::CTransaction tx) {
  Psbt psbt;
  for (auto& in : tx.vin) {
    in.script_sig.clear();
    in.witness.clear();
  }
  psbt.inputs.resize(tx.vin.size());
  psbt.outputs.resize(tx.vout.size());
  psbt.unsigned_tx = std::move(tx);
  return psbt;
}

Bytes Psbt::Serialize() const {
  Bytes out(std::begin(kMagic), std::end(kMagic));
  Bytes tx_bytes;
  ser::SerializeTransaction(unsigned_tx, &tx_bytes, /*include_witness=*/false);
  WritePair(&out, Bytes{kGlobalUnsignedTx}, tx_bytes);
  WriteProprietary(&out, proprietary);
  WriteUnknown(&out, unknown);
  out.push_back(0x00);

  for (const auto& input : inputs) {
    for (const auto& [pubkey, sig] : input.partial_sigs) {
      Bytes key{kInPartialSig};
      key.insert(key.end(), pubkey.begin(), pubkey.end());
      WritePair(&out, key, sig);
    }
    if (!input.final_script_witness.empty()) {
      WritePair(&out, Bytes{kInFinalScriptWitness}, EncodeWitness(input.final_script_witness));
    }
    WriteProprietary(&out, input.proprietary);
    WriteUnknown(&out, input.unknown);
    out.push_back(0x00);
  }
  for (const auto& output : outputs) {
    WriteProprietary(&out, output.proprietary);
    WriteUnknown(&out, output.unknown);
    out.push_back(0x00);
  }
  return out;
}

std::string Psbt::ToBase64() const { return util::Base64Encode(Serialize()); }

std::optional<Psbt> Psbt::Deserialize(std::span<const std::uint8_t> data, std::string* error) {
  if (data.size() < sizeof(kMagic) || !std::equal(std::begin(kMagic), std::end(kMagic), data.begin())) {
    SetError(error, "missing PSBT magic");
    return std::nullopt;
  }
  std::size_t offset = sizeof(kMagic);
  Psbt psbt;

  std::vector<RawPair> global;
  if (!ReadMap(data, &offset, &global)) {
    SetError(error, "malformed PSBT global map");
    return std::nullopt;
  }
  bool have_tx = false;
  for (auto& pair : global) {
    ProprietaryKey prop;
    if (pair.key.size() == 1 && pair.key[0] == kGlobalUnsignedTx) {
      std::size_t tx_offset = 0;
      if (!ser::DeserializeTransaction(pair.value, &tx_offset, &psbt.unsigned_tx) ||
          tx_offset != pair.value.size() || psbt.unsigned_tx.HasWitness()) {
        SetError(error, "malformed PSBT unsigned transaction");
        return std::nullopt;
      }
      have_tx = true;
    } else if (pair.key[0] == kProprietary && ParseOwnProprietary(pair.key, &prop)) {
      psbt.proprietary.emplace(std::move(prop), std::move(pair.value));
    } else {
      psbt.unknown.emplace(std::move(pair.key), std::move(pair.value));
    }
  }
  if (!have_tx) {
    SetError(error, "PSBT has no unsigned transaction");
    return std::nullopt;
  }
  for (const auto& in : psbt.unsigned_tx.vin) {
    if (!in.script_sig.empty()) {
      SetError(error, "PSBT unsigned transaction has a scriptSig");
      return std::nullopt;
    }
  }

  psbt.inputs.resize(psbt.unsigned_tx.vin.size());
  for (auto& input : psbt.inputs) {
    std::vector<RawPair> pairs;
    if (!ReadMap(data, &offset, &pairs)) {
      SetError(error, "malformed PSBT input map");
      return std::nullopt;
    }
    for (auto& pair : pairs) {
      ProprietaryKey prop;
      if (pair.key[0] == kInPartialSig && pair.key.size() > 1) {
        input.partial_sigs.emplace(Bytes(pair.key.begin() + 1, pair.key.end()),
                                   std::move(pair.value));
      } else if (pair.key.size() == 1 && pair.key[0] == kInFinalScriptWitness) {
        if (!DecodeWitness(pair.value, &input.final_script_witness)) {
          SetError(error, "malformed PSBT final witness");
          return std::nullopt;
        }
      } else if (pair.key[0] == kProprietary && ParseOwnProprietary(pair.key, &prop)) {
        input.proprietary.emplace(std::move(prop), std::move(pair.value));
      } else {
        input.unknown.emplace(std::move(pair.key), std::move(pair.value));
      }
    }
  }

  psbt.outputs.resize(psbt.unsigned_tx.vout.size());
  for (auto& output : psbt.outputs) {
    std::vector<RawPair> pairs;
    if (!ReadMap(data, &offset, &pairs)) {
      SetError(error, "malformed PSBT output map");
      return std::nullopt;
    }
    for (auto& pair : pairs) {
      ProprietaryKey prop;
      if (pair.key[0] == kProprietary && ParseOwnProprietary(pair.key, &prop)) {
        output.proprietary.emplace(std::move(prop), std::move(pair.value));
      } else {
        output.unknown.emplace(std::move(pair.key), std::move(pair.value));
      }
    }
  }
  if (offset != data.size()) {
    SetError(error, "trailing bytes after PSBT");
    return std::nullopt;
  }
  return psbt;
}

std::optional<Psbt> Psbt::FromBase64(std::string_view text, std::string* error) {
  Bytes raw;
  if (!util::Base64Decode(text, &raw)) {
    SetError(error, "PSBT is not valid base64");
    return std::nullopt;
  }
  return Deserialize(raw, error);
}

bool Psbt::IsFinalized() const noexcept {
  for (const auto& input : inputs) {
    if (input.final_script_witness.empty()) {
      return false;
    }
  }
  return !inputs.empty();
}

primitives::CTransaction Psbt::ExtractTransaction() const {
  primitives::CTransaction tx = unsigned_tx;
  for (std::size_t i = 0; i < tx.vin.size() && i < inputs.size(); ++i) {
    tx.vin[i].witness = inputs[i].final_script_witness;
  }
  return tx;
}

const Bytes* FindProprietary(const std::map<ProprietaryKey, Bytes>& map, std::uint64_t subtype,
                             std::span<const std::uint8_t> key_data) {
  const auto it = map.find(ProprietaryKey{subtype, Bytes(key_data.begin(), key_data.end())});
  return it == map.end() ? nullptr : &it->second;
}

void SetProprietary(std::map<ProprietaryKey, Bytes>* map, std::uint64_t subtype, Bytes value,
                    Bytes key_data) {
  (*map)[ProprietaryKey{subtype, std::move(key_data)}] = std::move(value);
}

}  // namespace sealnode::psbt
