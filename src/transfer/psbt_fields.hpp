#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "crypto/ec_key.hpp"
#include "invoice/invoice.hpp"
#include "psbt/psbt.hpp"
#include "seal/seal.hpp"
#include "transfer/transition.hpp"

namespace sealnode::transfer {

// Proprietary PSBT subtypes (identifier "SEAL").
inline constexpr std::uint64_t kPsbtTransition = 0x00;
inline constexpr std::uint64_t kPsbtInvoice = 0x01;
inline constexpr std::uint64_t kPsbtContract = 0x02;
inline constexpr std::uint64_t kPsbtInputSeal = 0x10;
inline constexpr std::uint64_t kPsbtInputOpout = 0x11;
inline constexpr std::uint64_t kPsbtInputOwner = 0x12;
inline constexpr std::uint64_t kPsbtOutputChange = 0x20;

inline constexpr std::uint32_t kCommitmentVout = 0;
inline constexpr std::uint32_t kChangeVout = 1;

struct ClosedInput {
  seal::RevealedSeal seal;
  Opout opout;
  crypto::PublicKey owner;
};

struct ChangeOutput {
  seal::RevealedSeal seal;
  contract::AssetAmount amount{0};
};

// Transfer data carried inside a PSBT between the build and pay stages.
struct TransferFields {
  StateTransition transition;  // concealed form
  std::string invoice;
  std::vector<ClosedInput> inputs;
  std::optional<ChangeOutput> change;
};

void EmbedTransferFields(const TransferFields& fields, psbt::Psbt* psbt);
// Throws Error(kValidation) when records are missing or malformed.
TransferFields ExtractTransferFields(const psbt::Psbt& psbt);

}  // namespace sealnode::transfer
