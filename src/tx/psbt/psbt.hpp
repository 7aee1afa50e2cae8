#pragma once

#include <compare>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "primitives/transaction.hpp"

namespace sealnode::psbt {

using Bytes = std::vector<std::uint8_t>;

inline constexpr std::uint8_t kGlobalUnsignedTx = 0x00;
inline constexpr std::uint8_t kGlobalVersion = 0xFB;
inline constexpr std::uint8_t kInPartialSig = 0x02;
inline constexpr std::uint8_t kInFinalScriptWitness = 0x08;
inline constexpr std::uint8_t kProprietary = 0xFC;

// Identifier of the proprietary records this daemon writes.
inline constexpr std::string_view kProprietaryId = "SEAL";

struct ProprietaryKey {
  std::uint64_t subtype{0};
  Bytes key_data;
  auto operator<=>(const ProprietaryKey&) const = default;
};

struct PsbtInput {
  std::map<Bytes, Bytes> partial_sigs;  // compressed pubkey -> DER sig || sighash
  std::vector<Bytes> final_script_witness;
  std::map<ProprietaryKey, Bytes> proprietary;
  std::map<Bytes, Bytes> unknown;
};

struct PsbtOutput {
  std::map<ProprietaryKey, Bytes> proprietary;
  std::map<Bytes, Bytes> unknown;
};

// BIP-174 container. Records with other proprietary identifiers or unknown
// types are preserved verbatim.
struct Psbt {
  primitives::CTransaction unsigned_tx;
  std::map<ProprietaryKey, Bytes> proprietary;
  std::map<Bytes, Bytes> unknown;
  std::vector<PsbtInput> inputs;
  std::vector<PsbtOutput> outputs;

  static Psbt FromTransaction(primitives::CTransaction tx);

  Bytes Serialize() const;
  std::string ToBase64() const;
  static std::optional<Psbt> Deserialize(std::span<const std::uint8_t> data,
                                         std::string* error = nullptr);
  static std::optional<Psbt> FromBase64(std::string_view text, std::string* error = nullptr);

  bool IsFinalized() const noexcept;
  // Unsigned tx with each input's final witness attached.
  primitives::CTransaction ExtractTransaction() const;
};

const Bytes* FindProprietary(const std::map<ProprietaryKey, Bytes>& map, std::uint64_t subtype,
                             std::span<const std::uint8_t> key_data = {});
void SetProprietary(std::map<ProprietaryKey, Bytes>* map, std::uint64_t subtype, Bytes value,
                    Bytes key_data = {});

}  // namespace sealnode::psbt
