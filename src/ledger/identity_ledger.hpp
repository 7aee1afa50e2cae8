#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "contract/contract.hpp"
#include "nlohmann/json.hpp"
#include "seal/seal.hpp"
#include "transfer/transition.hpp"

namespace sealnode::ledger {

// An assignment owned by this identity.
struct Allocation {
  contract::ContractId contract_id{};
  transfer::Opout opout;
  // Seal as it was assigned (witness seals keep their witness form).
  seal::RevealedSeal seal;
  seal::Outpoint outpoint;
  contract::AssetAmount amount{0};
  bool spent{false};
};

struct PendingInvoice {
  std::string invoice;
  contract::ContractId contract_id{};
  std::string iface;
  contract::AssetAmount amount{0};
  seal::RevealedSeal seal;
  std::optional<std::int64_t> expiry;
  std::int64_t created_at{0};
};

// Sent and signed, awaiting the counterparty.
struct PendingTransfer {
  std::string txid;
  contract::ContractId contract_id{};
  transfer::OpId transition_id{};
  std::string invoice;
  contract::AssetAmount amount{0};
  contract::AssetAmount change{0};
  std::int64_t created_at{0};
};

struct AcceptedTransfer {
  transfer::OpId transition_id{};
  contract::ContractId contract_id{};
  std::string txid;
  seal::Outpoint outpoint;
  contract::AssetAmount amount{0};
  std::int64_t accepted_at{0};
};

// All state of one identity. Instances are plain values: IdentityStore hands
// out copies and publishes whole replacements.
struct IdentityLedger {
  std::map<contract::ContractId, contract::Contract> contracts;
  std::map<contract::ContractId, std::vector<transfer::TransitionRecord>> history;
  std::vector<Allocation> allocations;
  std::map<seal::ConcealedSeal, PendingInvoice> invoices;
  std::set<seal::ConcealedSeal> consumed_invoices;
  // Received seal -> transition that assigned it.
  std::map<seal::ConcealedSeal, transfer::OpId> received_seals;
  std::map<std::string, PendingTransfer> pending_transfers;
  std::map<transfer::OpId, AcceptedTransfer> accepted;

  const contract::Contract* FindContract(const contract::ContractId& id) const;
  // Sum of unspent allocations; saturates instead of wrapping.
  contract::AssetAmount Balance(const contract::ContractId& id) const;
  Allocation* FindAllocation(const transfer::Opout& opout);
  const Allocation* FindAllocation(const transfer::Opout& opout) const;
};

nlohmann::json LedgerToJson(const IdentityLedger& ledger);
// Throws Error(kStorage) on malformed documents.
IdentityLedger LedgerFromJson(const nlohmann::json& json);

}  // namespace sealnode::ledger
