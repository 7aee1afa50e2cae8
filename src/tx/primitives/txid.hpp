#pragma once

#include <cstddef>

#include "primitives/transaction.hpp"

namespace sealnode::primitives {

inline constexpr std::uint32_t kSighashAll = 0x01;

// Double SHA-256 of the non-witness encoding; unaffected by signing.
Hash256 ComputeTxId(const CTransaction& tx);
Hash256 ComputeWTxId(const CTransaction& tx);

// Digest each input signs: DoubleSha256(non-witness tx || input index ||
// sighash type). It commits to every input and output.
Hash256 ComputeSignatureHash(const CTransaction& tx, std::size_t input_index,
                             std::uint32_t sighash_type = kSighashAll);

}  // namespace sealnode::primitives
