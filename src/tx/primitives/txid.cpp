#include "primitives/txid.hpp"

#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace sealnode::primitives {

Hash256 ComputeTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  return crypto::DoubleSha256(buffer);
}

Hash256 ComputeWTxId(const CTransaction& tx) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/true);
  return crypto::DoubleSha256(buffer);
}

Hash256 ComputeSignatureHash(const CTransaction& tx, std::size_t input_index,
                             std::uint32_t sighash_type) {
  std::vector<std::uint8_t> buffer;
  serialize::SerializeTransaction(tx, &buffer, /*include_witness=*/false);
  serialize::WriteUint32(&buffer, static_cast<std::uint32_t>(input_index));
  serialize::WriteUint32(&buffer, sighash_type);
  return crypto::DoubleSha256(buffer);
}

}  // namespace sealnode::primitives
