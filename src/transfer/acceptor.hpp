#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "ledger/identity_store.hpp"
#include "seal/seal.hpp"
#include "transfer/consignment.hpp"

namespace sealnode::transfer {

enum class AcceptStatus {
  kAccepted,
  kAlreadyAccepted,
  kRejected,
};

std::string_view AcceptStatusName(AcceptStatus status) noexcept;

struct AcceptResult {
  AcceptStatus status{AcceptStatus::kRejected};
  std::string reason;  // set when rejected
  OpId transition_id{};
  contract::ContractId contract_id{};
  contract::AssetAmount amount{0};
  std::optional<seal::Outpoint> outpoint;
};

// Replays the consignment from genesis and, if every step holds, takes
// ownership of the assignment whose seal is `disclosed` (or, without one, of
// the assignment matching a pending invoice). Rejections never touch the
// ledger.
AcceptResult Accept(ledger::IdentityStore& store, const std::string& identity,
                    const Consignment& consignment,
                    const std::optional<seal::RevealedSeal>& disclosed, std::int64_t now);

// Replay only. Returns the reason on failure.
std::optional<std::string> VerifyHistory(const contract::Contract& genesis,
                                         const std::vector<TransitionRecord>& history);

}  // namespace sealnode::transfer
