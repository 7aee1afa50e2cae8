#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/ec_key.hpp"
#include "ledger/identity_store.hpp"
#include "psbt/psbt.hpp"
#include "transfer/consignment.hpp"

namespace sealnode::transfer {

struct SignedTransfer {
  std::string txid;
  psbt::Psbt psbt;
  Consignment consignment;
  OpId transition_id{};
};

// Signs an unsigned transfer and commits it. Under the payer's write lock the
// PSBT is checked against the ledger again, every input is signed, and only
// then are the closed seals marked spent, the invoice consumed, the change
// allocation and history recorded. Any failure leaves the ledger unchanged.
SignedTransfer Execute(ledger::IdentityStore& store, const crypto::PrivateKey& payer,
                       const psbt::Psbt& unsigned_psbt, std::int64_t now);

// Forgets a pending transfer. Its seals stay spent. Throws Error(kNotFound).
void Abandon(ledger::IdentityStore& store, const std::string& identity, std::string_view txid);

struct TransferListing {
  std::vector<ledger::PendingTransfer> sent;
  std::vector<ledger::AcceptedTransfer> received;
};

TransferListing ListTransfers(const ledger::IdentityStore& store, const std::string& identity);

}  // namespace sealnode::transfer
