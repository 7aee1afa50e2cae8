#include "seal/seal.hpp"

#include <algorithm>
#include <charconv>
#include <vector>

#include "core/error.hpp"
#include "crypto/bech32.hpp"
#include "crypto/hash.hpp"
#include "util/hex.hpp"

namespace sealnode::seal {

namespace {

constexpr std::string_view kConcealedHrp = "utxob";
constexpr std::string_view kConcealTag = "sealnode:seal:concealed";
constexpr std::string_view kWitnessMarker = "~";

template <typename T>
bool ParseNumber(std::string_view text, T* out) {
  if (text.empty()) {
    return false;
  }
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, *out);
  return ec == std::errc() && ptr == end;
}

std::vector<std::string_view> Split(std::string_view text, char sep) {
  std::vector<std::string_view> parts;
  std::size_t start = 0;
  while (true) {
    const auto pos = text.find(sep, start);
    if (pos == std::string_view::npos) {
      parts.push_back(text.substr(start));
      return parts;
    }
    parts.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
}

Txid ParseTxid(std::string_view text) {
  Txid txid{};
  if (!util::HexDecodeReversed(text, txid)) {
    ThrowError(ErrorKind::kSeal, "txid must be 64 hex characters");
  }
  return txid;
}

std::uint32_t ParseVout(std::string_view text) {
  std::uint32_t vout = 0;
  if (!ParseNumber(text, &vout)) {
    ThrowError(ErrorKind::kSeal, "invalid output index '" + std::string(text) + "'");
  }
  return vout;
}

}  // namespace

std::string Outpoint::ToString() const {
  return util::HexEncodeReversed(txid) + ":" + std::to_string(vout);
}

Outpoint Outpoint::Parse(std::string_view text) {
  const auto parts = Split(text, ':');
  if (parts.size() != 2) {
    ThrowError(ErrorKind::kSeal, "outpoint must be <txid>:<vout>");
  }
  return Outpoint{ParseTxid(parts[0]), ParseVout(parts[1])};
}

std::string_view CloseMethodName(CloseMethod method) noexcept {
  switch (method) {
    case CloseMethod::kTapretFirst:
      return "tapret1st";
    case CloseMethod::kOpretFirst:
      return "opret1st";
  }
  return "unknown";
}

std::optional<CloseMethod> ParseCloseMethod(std::string_view name) noexcept {
  if (name == "tapret1st" || name == "tapret-first" || name == "tapret") {
    return CloseMethod::kTapretFirst;
  }
  if (name == "opret1st" || name == "opret-first" || name == "opret") {
    return CloseMethod::kOpretFirst;
  }
  return std::nullopt;
}

std::string ConcealedSeal::ToString() const { return crypto::EncodeBech32m(kConcealedHrp, digest); }

ConcealedSeal ConcealedSeal::Parse(std::string_view text) {
  const auto payload = crypto::DecodeBech32m(text, kConcealedHrp);
  if (!payload || payload->size() != 32) {
    ThrowError(ErrorKind::kSeal, "invalid concealed seal '" + std::string(text) + "'");
  }
  ConcealedSeal seal;
  std::copy(payload->begin(), payload->end(), seal.digest.begin());
  return seal;
}

ConcealedSeal RevealedSeal::Conceal() const {
  static const Txid kZero{};
  crypto::HashWriter writer;
  writer.U8(static_cast<std::uint8_t>(method))
      .U8(txid ? 1 : 0)
      .Fixed(txid ? *txid : kZero)
      .U32(vout)
      .U64(blinding);
  return ConcealedSeal{writer.Tagged(kConcealTag)};
}

Outpoint RevealedSeal::ToOutpoint() const {
  if (!txid) {
    ThrowError(ErrorKind::kSeal, "witness seal has no txid until its transaction is known");
  }
  return Outpoint{*txid, vout};
}

Outpoint RevealedSeal::Resolve(const Txid& witness_txid) const {
  return Outpoint{txid ? *txid : witness_txid, vout};
}

std::string RevealedSeal::ToString() const {
  std::string out(CloseMethodName(method));
  out += ":";
  out += txid ? util::HexEncodeReversed(*txid) : std::string(kWitnessMarker);
  out += ":" + std::to_string(vout) + "#" + std::to_string(blinding);
  return out;
}

RevealedSeal RevealedSeal::Parse(std::string_view text) {
  const auto hash_pos = text.find('#');
  if (hash_pos == std::string_view::npos) {
    ThrowError(ErrorKind::kSeal, "revealed seal requires a #blinding suffix");
  }
  const auto parts = Split(text.substr(0, hash_pos), ':');
  if (parts.size() != 3) {
    ThrowError(ErrorKind::kSeal, "revealed seal must be <method>:<txid>:<vout>#<blinding>");
  }
  RevealedSeal seal;
  const auto method = ParseCloseMethod(parts[0]);
  if (!method) {
    ThrowError(ErrorKind::kSeal, "unknown close method '" + std::string(parts[0]) + "'");
  }
  seal.method = *method;
  if (parts[1] != kWitnessMarker) {
    seal.txid = ParseTxid(parts[1]);
  }
  seal.vout = ParseVout(parts[2]);
  if (!ParseNumber(text.substr(hash_pos + 1), &seal.blinding)) {
    ThrowError(ErrorKind::kSeal, "invalid blinding factor");
  }
  return seal;
}

ConcealedSeal Conceal(const SealDefinition& seal) {
  if (const auto* revealed = std::get_if<RevealedSeal>(&seal)) {
    return revealed->Conceal();
  }
  return std::get<ConcealedSeal>(seal);
}

SealDefinition ConcealDefinition(const SealDefinition& seal) { return Conceal(seal); }

SealDescriptor ParseSealDescriptor(std::string_view text) {
  SealDescriptor desc;
  const auto hash_pos = text.find('#');
  if (hash_pos != std::string_view::npos) {
    std::uint64_t blinding = 0;
    if (!ParseNumber(text.substr(hash_pos + 1), &blinding)) {
      ThrowError(ErrorKind::kSeal, "invalid blinding factor");
    }
    desc.blinding = blinding;
    text = text.substr(0, hash_pos);
  }
  const auto parts = Split(text, ':');
  if (parts.size() == 3) {
    const auto method = ParseCloseMethod(parts[0]);
    if (!method) {
      ThrowError(ErrorKind::kSeal, "unknown close method '" + std::string(parts[0]) + "'");
    }
    desc.method = *method;
    desc.outpoint = Outpoint{ParseTxid(parts[1]), ParseVout(parts[2])};
  } else if (parts.size() == 2) {
    desc.outpoint = Outpoint{ParseTxid(parts[0]), ParseVout(parts[1])};
  } else {
    ThrowError(ErrorKind::kSeal, "seal descriptor must be [method:]<txid>:<vout>");
  }
  return desc;
}

}  // namespace sealnode::seal
