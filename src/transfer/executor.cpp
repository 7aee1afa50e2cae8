#include "transfer/executor.hpp"

#include <algorithm>
#include <set>
#include <utility>

#include "core/error.hpp"
#include "invoice/invoice.hpp"
#include "primitives/hash.hpp"
#include "primitives/txid.hpp"
#include "script/script.hpp"
#include "transfer/psbt_fields.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace sealnode::transfer {

namespace {

[[noreturn]] void Mismatch(const std::string& what) {
  ThrowError(ErrorKind::kValidation, "psbt does not match its transfer: " + what);
}

// Returns the sum of the closed allocations.
contract::AssetAmount CheckAgainstLedger(const ledger::IdentityLedger& ledger,
                                         const TransferFields& fields,
                                         const invoice::Invoice& inv,
                                         const primitives::CTransaction& tx) {
  const auto& transition = fields.transition;
  if (transition.contract_id != inv.contract_id) {
    Mismatch("contract differs from the invoice");
  }
  if (transition.inputs.empty() || transition.inputs.size() != fields.inputs.size() ||
      tx.vin.size() != fields.inputs.size()) {
    Mismatch("input count");
  }

  contract::AssetAmount in_sum = 0;
  std::set<Opout> seen_opouts;
  std::set<std::pair<primitives::Hash256, std::uint32_t>> seen_prevouts;
  for (std::size_t i = 0; i < fields.inputs.size(); ++i) {
    const auto& closed = fields.inputs[i];
    if (closed.opout != transition.inputs[i]) {
      Mismatch("input " + std::to_string(i) + " opout");
    }
    const auto& prevout = tx.vin[i].prevout;
    if (!seen_opouts.insert(closed.opout).second ||
        !seen_prevouts.emplace(prevout.txid, prevout.index).second) {
      ThrowError(ErrorKind::kSeal, "input " + std::to_string(i) + " closes a seal twice");
    }
    const auto* allocation = ledger.FindAllocation(closed.opout);
    if (allocation == nullptr || allocation->contract_id != transition.contract_id) {
      ThrowError(ErrorKind::kSeal, "input " + std::to_string(i) + " is not an owned seal");
    }
    if (allocation->spent) {
      ThrowError(ErrorKind::kSeal, "input " + std::to_string(i) + " seal is already closed");
    }
    if (allocation->seal != closed.seal) {
      Mismatch("input " + std::to_string(i) + " seal");
    }
    if (prevout.txid != allocation->outpoint.txid || prevout.index != allocation->outpoint.vout) {
      Mismatch("input " + std::to_string(i) + " outpoint");
    }
    if (!contract::CheckedAdd(in_sum, allocation->amount, &in_sum)) {
      Mismatch("input amounts overflow");
    }
  }

  const std::size_t expected_assignments = fields.change ? 2 : 1;
  if (transition.assignments.size() != expected_assignments) {
    Mismatch("assignment count");
  }
  const auto& payment = transition.assignments[0];
  if (seal::Conceal(payment.seal) != inv.beneficiary || payment.amount != inv.amount) {
    Mismatch("payment assignment differs from the invoice");
  }
  contract::AssetAmount out_sum = payment.amount;
  if (fields.change) {
    const auto& change = transition.assignments[1];
    if (!fields.change->seal.IsWitness() || fields.change->seal.vout != kChangeVout ||
        seal::Conceal(change.seal) != fields.change->seal.Conceal() ||
        change.amount != fields.change->amount || tx.vout.size() <= kChangeVout) {
      Mismatch("change assignment");
    }
    if (!contract::CheckedAdd(out_sum, change.amount, &out_sum)) {
      Mismatch("output amounts overflow");
    }
  }
  if (in_sum != out_sum) {
    Mismatch("amounts are not conserved");
  }

  if (tx.vout.empty()) {
    Mismatch("missing commitment output");
  }
  const auto commitment = script::ExtractOpReturnPayload(tx.vout[kCommitmentVout].script_pubkey);
  const auto id = transition.Id();
  if (!commitment || commitment->size() != id.size() ||
      !std::equal(id.begin(), id.end(), commitment->begin())) {
    Mismatch("commitment output does not carry the transition id");
  }
  return in_sum;
}

}  // namespace

SignedTransfer Execute(ledger::IdentityStore& store, const crypto::PrivateKey& payer,
                       const psbt::Psbt& unsigned_psbt, std::int64_t now) {
  if (unsigned_psbt.IsFinalized()) {
    ThrowError(ErrorKind::kValidation, "psbt is already signed");
  }
  const auto fields = ExtractTransferFields(unsigned_psbt);
  const auto inv = invoice::ParseInvoice(fields.invoice);
  const auto payer_pub = payer.Public();
  const auto identity = payer_pub.ToHex();
  for (std::size_t i = 0; i < fields.inputs.size(); ++i) {
    if (!(fields.inputs[i].owner == payer_pub)) {
      ThrowError(ErrorKind::kSigning, "no key for input " + std::to_string(i));
    }
  }

  SignedTransfer result;
  result.transition_id = fields.transition.Id();
  store.Transact(identity, [&](ledger::IdentityLedger& ledger) {
    if (ledger.consumed_invoices.count(inv.beneficiary) != 0) {
      ThrowError(ErrorKind::kInvoiceAlreadyUsed, "invoice has already been paid");
    }
    if (inv.IsExpired(now)) {
      ThrowError(ErrorKind::kInvoiceExpired, "invoice expired");
    }
    const auto* contract = ledger.FindContract(inv.contract_id);
    if (contract == nullptr) {
      ThrowError(ErrorKind::kNotFound, "unknown contract");
    }
    const auto& tx = unsigned_psbt.unsigned_tx;
    CheckAgainstLedger(ledger, fields, inv, tx);

    psbt::Psbt signed_psbt = unsigned_psbt;
    const auto& pub = payer_pub.Compressed();
    const psbt::Bytes pub_bytes(pub.begin(), pub.end());
    for (std::size_t i = 0; i < tx.vin.size(); ++i) {
      auto sig = payer.Sign(primitives::ComputeSignatureHash(tx, i));
      sig.push_back(static_cast<std::uint8_t>(primitives::kSighashAll));
      signed_psbt.inputs[i].partial_sigs[pub_bytes] = sig;
      signed_psbt.inputs[i].final_script_witness = {sig, pub_bytes};
    }
    const auto witness_tx = signed_psbt.ExtractTransaction();
    const auto txid = primitives::ComputeTxId(witness_tx);

    TransitionRecord record;
    record.transition = fields.transition.Concealed();
    record.witness = witness_tx;
    for (const auto& closed : fields.inputs) {
      record.closed_seals.push_back(closed.seal);
    }

    // Commit.
    for (const auto& closed : fields.inputs) {
      ledger.FindAllocation(closed.opout)->spent = true;
    }
    ledger.consumed_invoices.insert(inv.beneficiary);
    if (fields.change) {
      ledger::Allocation change;
      change.contract_id = inv.contract_id;
      change.opout = Opout{result.transition_id, 1};
      change.seal = fields.change->seal;
      change.outpoint = fields.change->seal.Resolve(txid);
      change.amount = fields.change->amount;
      ledger.allocations.push_back(change);
    }
    auto& history = ledger.history[inv.contract_id];
    history.push_back(record);

    ledger::PendingTransfer pending;
    pending.txid = util::HexEncodeReversed(txid);
    pending.contract_id = inv.contract_id;
    pending.transition_id = result.transition_id;
    pending.invoice = fields.invoice;
    pending.amount = inv.amount;
    pending.change = fields.change ? fields.change->amount : 0;
    pending.created_at = now;
    ledger.pending_transfers[pending.txid] = pending;

    result.txid = pending.txid;
    result.psbt = std::move(signed_psbt);
    result.consignment.genesis = *contract;
    result.consignment.history = history;
    return true;
  });
  util::LogInfo("pay: " + result.txid + " transition " + util::HexEncode(result.transition_id));
  return result;
}

void Abandon(ledger::IdentityStore& store, const std::string& identity, std::string_view txid) {
  store.Transact(identity, [&](ledger::IdentityLedger& ledger) {
    if (ledger.pending_transfers.erase(std::string(txid)) == 0) {
      ThrowError(ErrorKind::kNotFound, "no pending transfer " + std::string(txid));
    }
    return true;
  });
  util::LogInfo("abandon: " + std::string(txid));
}

TransferListing ListTransfers(const ledger::IdentityStore& store, const std::string& identity) {
  const auto ledger = store.Read(identity);
  TransferListing out;
  for (const auto& [txid, pending] : ledger.pending_transfers) out.sent.push_back(pending);
  for (const auto& [id, accepted] : ledger.accepted) out.received.push_back(accepted);
  return out;
}

}  // namespace sealnode::transfer
