#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace sealnode::seal {

// Internal (serialization) byte order; text forms are byte-reversed.
using Txid = std::array<std::uint8_t, 32>;

struct Outpoint {
  Txid txid{};
  std::uint32_t vout{0};

  bool operator==(const Outpoint&) const = default;
  auto operator<=>(const Outpoint&) const = default;

  // "<txid>:<vout>"
  std::string ToString() const;
  // Throws Error(kSeal) on malformed input.
  static Outpoint Parse(std::string_view text);
};

enum class CloseMethod : std::uint8_t {
  kTapretFirst = 1,
  kOpretFirst = 2,
};

std::string_view CloseMethodName(CloseMethod method) noexcept;
std::optional<CloseMethod> ParseCloseMethod(std::string_view name) noexcept;

struct ConcealedSeal {
  std::array<std::uint8_t, 32> digest{};

  bool operator==(const ConcealedSeal&) const = default;
  auto operator<=>(const ConcealedSeal&) const = default;

  // Bech32m with hrp "utxob".
  std::string ToString() const;
  static ConcealedSeal Parse(std::string_view text);
};

// A seal with its outpoint and blinding visible. A seal without a txid is a
// witness seal: it points at output `vout` of the transaction that closes
// the seals of the same state transition.
struct RevealedSeal {
  CloseMethod method{CloseMethod::kTapretFirst};
  std::optional<Txid> txid;
  std::uint32_t vout{0};
  std::uint64_t blinding{0};

  bool operator==(const RevealedSeal&) const = default;

  bool IsWitness() const noexcept { return !txid.has_value(); }
  ConcealedSeal Conceal() const;
  // Throws Error(kSeal) for witness seals.
  Outpoint ToOutpoint() const;
  Outpoint Resolve(const Txid& witness_txid) const;

  // "<method>:<txid|~>:<vout>#<blinding>"
  std::string ToString() const;
  static RevealedSeal Parse(std::string_view text);
};

using SealDefinition = std::variant<RevealedSeal, ConcealedSeal>;

ConcealedSeal Conceal(const SealDefinition& seal);
SealDefinition ConcealDefinition(const SealDefinition& seal);

// Boundary form accepted from API callers: "[method:]txid:vout[#blinding]".
// The close method defaults to tapret1st.
struct SealDescriptor {
  CloseMethod method{CloseMethod::kTapretFirst};
  Outpoint outpoint;
  std::optional<std::uint64_t> blinding;
};

SealDescriptor ParseSealDescriptor(std::string_view text);

}  // namespace sealnode::seal
