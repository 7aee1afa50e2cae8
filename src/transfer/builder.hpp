#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "contract/amount.hpp"
#include "crypto/ec_key.hpp"
#include "ledger/identity_store.hpp"
#include "psbt/psbt.hpp"
#include "transfer/psbt_fields.hpp"

namespace sealnode::transfer {

// Indices of the covering subset of `values` for `target`: fewest elements
// first, then the smallest sum. Exhaustive up to 16 candidates; beyond that a
// largest-first pick with swap refinement keeps the fewest elements but may
// miss the smallest sum. std::nullopt when even the full set falls short.
std::optional<std::vector<std::size_t>> SelectCovering(
    const std::vector<contract::AssetAmount>& values, contract::AssetAmount target);

struct UnsignedTransfer {
  psbt::Psbt psbt;
  TransferFields fields;
  OpId transition_id{};
  contract::AssetAmount amount{0};
  contract::AssetAmount change{0};
};

// Builds the witness transaction and state transition paying `invoice_text`
// from the payer's unspent allocations. Reads a snapshot; nothing is
// reserved until the transfer is executed.
UnsignedTransfer CreateTransfer(const ledger::IdentityStore& store, const crypto::PublicKey& payer,
                                std::string_view invoice_text, std::int64_t now);

}  // namespace sealnode::transfer
