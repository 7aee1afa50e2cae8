#include "seal/blinder.hpp"

#include "crypto/hash.hpp"
#include "util/csprng.hpp"

namespace sealnode::seal {

BlindedSeal Blind(const Outpoint& outpoint, CloseMethod method) {
  return BlindWithFactor(outpoint, method, util::SecureRandomUint64());
}

BlindedSeal BlindWithFactor(const Outpoint& outpoint, CloseMethod method, std::uint64_t blinding) {
  BlindedSeal out;
  out.revealed.method = method;
  out.revealed.txid = outpoint.txid;
  out.revealed.vout = outpoint.vout;
  out.revealed.blinding = blinding;
  out.concealed = out.revealed.Conceal();
  return out;
}

std::uint64_t DeriveBlinding(std::span<const std::uint8_t> secret, const Outpoint& outpoint,
                             CloseMethod method, std::string_view purpose) {
  crypto::HashWriter writer;
  writer.Bytes(secret).Str(purpose).U8(static_cast<std::uint8_t>(method)).Fixed(outpoint.txid).U32(
      outpoint.vout);
  const auto digest = writer.Tagged("sealnode:seal:blinding");
  std::uint64_t value = 0;
  for (int i = 0; i < 8; ++i) {
    value = (value << 8) | digest[i];
  }
  return value;
}

}  // namespace sealnode::seal
