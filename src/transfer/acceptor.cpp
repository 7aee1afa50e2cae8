#include "transfer/acceptor.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "contract/issuer.hpp"
#include "core/error.hpp"
#include "crypto/ec_key.hpp"
#include "primitives/txid.hpp"
#include "script/script.hpp"
#include "transfer/psbt_fields.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace sealnode::transfer {

namespace {

struct OpoutState {
  seal::ConcealedSeal seal;
  contract::AssetAmount amount{0};
  // Set for assignments created by a transition; resolves witness seals.
  std::optional<seal::Txid> witness_txid;
  bool spent{false};
};

std::string Index(std::size_t i) { return std::to_string(i); }

std::optional<std::string> CheckSignature(const primitives::CTransaction& tx, std::size_t index) {
  const auto& witness = tx.vin[index].witness;
  if (witness.size() != 2 || witness[0].empty()) {
    return "input " + Index(index) + " is not signed";
  }
  const auto& sig = witness[0];
  if (sig.back() != primitives::kSighashAll) {
    return "input " + Index(index) + " uses an unsupported sighash type";
  }
  const auto key = crypto::PublicKey::FromBytes(witness[1]);
  const auto digest = primitives::ComputeSignatureHash(tx, index);
  if (!crypto::VerifySignature(key, digest,
                               std::span<const std::uint8_t>(sig.data(), sig.size() - 1))) {
    return "input " + Index(index) + " signature is invalid";
  }
  return std::nullopt;
}

std::optional<std::string> ApplyRecord(const contract::ContractId& contract_id,
                                       const TransitionRecord& record,
                                       std::map<Opout, OpoutState>* state) {
  const auto& transition = record.transition;
  const auto& tx = record.witness;
  if (transition.contract_id != contract_id) {
    return "transition belongs to another contract";
  }
  const auto id = transition.Id();
  if (state->count(Opout{id, 0}) != 0) {
    return "transition " + util::HexEncode(id) + " appears twice";
  }
  if (transition.inputs.empty()) {
    return "transition closes no seals";
  }
  if (transition.assignments.empty()) {
    return "transition assigns nothing";
  }
  if (record.closed_seals.size() != transition.inputs.size() ||
      tx.vin.size() != transition.inputs.size()) {
    return "witness transaction does not spend exactly the closed seals";
  }

  std::set<Opout> seen;
  contract::AssetAmount in_sum = 0;
  for (std::size_t i = 0; i < transition.inputs.size(); ++i) {
    const auto& opout = transition.inputs[i];
    if (!seen.insert(opout).second) {
      return "input " + Index(i) + " is listed twice";
    }
    auto it = state->find(opout);
    if (it == state->end()) {
      return "input " + Index(i) + " refers to an unknown assignment";
    }
    if (it->second.spent) {
      return "input " + Index(i) + " is already spent";
    }
    const auto& closed = record.closed_seals[i];
    if (closed.Conceal() != it->second.seal) {
      return "closed seal " + Index(i) + " does not match its assignment";
    }
    seal::Outpoint outpoint;
    if (closed.IsWitness()) {
      if (!it->second.witness_txid) {
        return "closed seal " + Index(i) + " has no witness transaction";
      }
      outpoint = closed.Resolve(*it->second.witness_txid);
    } else {
      outpoint = closed.ToOutpoint();
    }
    const auto& prevout = tx.vin[i].prevout;
    if (prevout.txid != outpoint.txid || prevout.index != outpoint.vout) {
      return "witness input " + Index(i) + " does not spend the closed seal";
    }
    if (!contract::CheckedAdd(in_sum, it->second.amount, &in_sum)) {
      return "input amounts overflow";
    }
  }

  contract::AssetAmount out_sum = 0;
  for (const auto& assignment : transition.assignments) {
    if (assignment.amount == 0) {
      return "zero-value assignment";
    }
    if (!contract::CheckedAdd(out_sum, assignment.amount, &out_sum)) {
      return "output amounts overflow";
    }
  }
  if (in_sum != out_sum) {
    return "amounts are not conserved (" + std::to_string(in_sum) + " in, " +
           std::to_string(out_sum) + " out)";
  }

  if (tx.vout.empty()) {
    return "witness transaction has no outputs";
  }
  const auto commitment = script::ExtractOpReturnPayload(tx.vout[kCommitmentVout].script_pubkey);
  if (!commitment || commitment->size() != id.size() ||
      !std::equal(id.begin(), id.end(), commitment->begin())) {
    return "witness transaction does not commit to the transition";
  }
  for (std::size_t i = 0; i < tx.vin.size(); ++i) {
    if (auto reason = CheckSignature(tx, i)) {
      return reason;
    }
  }

  for (const auto& opout : transition.inputs) {
    (*state)[opout].spent = true;
  }
  const auto txid = primitives::ComputeTxId(tx);
  for (std::size_t k = 0; k < transition.assignments.size(); ++k) {
    OpoutState created;
    created.seal = seal::Conceal(transition.assignments[k].seal);
    created.amount = transition.assignments[k].amount;
    created.witness_txid = txid;
    state->emplace(Opout{id, static_cast<std::uint16_t>(k)}, created);
  }
  return std::nullopt;
}

// Known records first, then the consignment's new ones, in their order.
std::vector<TransitionRecord> MergeHistory(const std::vector<TransitionRecord>& known,
                                           const std::vector<TransitionRecord>& incoming) {
  std::set<OpId> ids;
  std::vector<TransitionRecord> merged = known;
  for (const auto& record : known) ids.insert(record.transition.Id());
  for (const auto& record : incoming) {
    if (ids.insert(record.transition.Id()).second) {
      merged.push_back(record);
    }
  }
  return merged;
}

}  // namespace

std::string_view AcceptStatusName(AcceptStatus status) noexcept {
  switch (status) {
    case AcceptStatus::kAccepted:
      return "accepted";
    case AcceptStatus::kAlreadyAccepted:
      return "already_accepted";
    case AcceptStatus::kRejected:
      return "rejected";
  }
  return "rejected";
}

std::optional<std::string> VerifyHistory(const contract::Contract& genesis,
                                         const std::vector<TransitionRecord>& history) {
  const auto contract_id = genesis.Id();
  std::map<Opout, OpoutState> state;
  OpoutState root;
  root.seal = genesis.genesis_seal.Conceal();
  root.amount = genesis.supply;
  state.emplace(Opout{contract_id, 0}, root);
  try {
    for (std::size_t i = 0; i < history.size(); ++i) {
      if (auto reason = ApplyRecord(contract_id, history[i], &state)) {
        return "record " + Index(i) + ": " + *reason;
      }
    }
  } catch (const Error& ex) {
    return std::string(ex.what());
  }
  return std::nullopt;
}

AcceptResult Accept(ledger::IdentityStore& store, const std::string& identity,
                    const Consignment& consignment,
                    const std::optional<seal::RevealedSeal>& disclosed, std::int64_t now) {
  AcceptResult result;
  auto reject = [&](const std::string& reason) {
    result.status = AcceptStatus::kRejected;
    result.reason = reason;
    return false;
  };

  const auto& genesis = consignment.genesis;
  result.contract_id = genesis.Id();
  if (consignment.history.empty()) {
    reject("consignment carries no transition");
    return result;
  }
  const auto& tip = consignment.Tip();
  result.transition_id = tip.transition.Id();
  try {
    contract::ValidateContract(genesis);
  } catch (const Error& ex) {
    reject(std::string("invalid genesis: ") + ex.what());
    return result;
  }

  store.Transact(identity, [&](ledger::IdentityLedger& ledger) {
    auto& history = ledger.history[result.contract_id];
    auto merged = MergeHistory(history, consignment.history);
    if (auto reason = VerifyHistory(genesis, merged)) {
      return reject(*reason);
    }

    const auto& assignments = tip.transition.assignments;
    std::optional<std::size_t> index;
    std::optional<seal::RevealedSeal> revealed = disclosed;
    if (disclosed) {
      const auto concealed = disclosed->Conceal();
      for (std::size_t k = 0; k < assignments.size(); ++k) {
        if (seal::Conceal(assignments[k].seal) == concealed) index = k;
      }
      if (!index) {
        return reject("disclosed seal does not match any assignment of the transfer");
      }
    } else {
      // The invoice is consumed by the first acceptance; a repeat is matched
      // through the seal it recorded.
      for (std::size_t k = 0; k < assignments.size() && !index; ++k) {
        auto it = ledger.received_seals.find(seal::Conceal(assignments[k].seal));
        if (it != ledger.received_seals.end() && it->second == result.transition_id &&
            ledger.accepted.count(result.transition_id) != 0) {
          result.status = AcceptStatus::kAlreadyAccepted;
          result.amount = assignments[k].amount;
          result.outpoint = ledger.accepted.at(result.transition_id).outpoint;
          return false;
        }
      }
      for (std::size_t k = 0; k < assignments.size() && !index; ++k) {
        auto it = ledger.invoices.find(seal::Conceal(assignments[k].seal));
        if (it != ledger.invoices.end()) {
          index = k;
          revealed = it->second.seal;
        }
      }
      if (!index) {
        return reject("no pending invoice matches the transfer");
      }
    }
    const auto concealed = seal::Conceal(assignments[*index].seal);
    const auto amount = assignments[*index].amount;

    auto pending = ledger.invoices.find(concealed);
    if (pending != ledger.invoices.end()) {
      if (pending->second.contract_id != result.contract_id) {
        return reject("transfer is for a different contract than the invoice");
      }
      if (pending->second.amount != amount) {
        return reject("transfer pays " + std::to_string(amount) + ", invoice requests " +
                      std::to_string(pending->second.amount));
      }
    }

    result.amount = amount;
    if (ledger.accepted.count(result.transition_id) != 0) {
      result.status = AcceptStatus::kAlreadyAccepted;
      result.outpoint = ledger.accepted.at(result.transition_id).outpoint;
      return false;
    }
    // The payer already holds its own change; disclosing that seal must not
    // credit it a second time.
    if (ledger.FindAllocation(Opout{result.transition_id, static_cast<std::uint16_t>(*index)}) !=
        nullptr) {
      return reject("assignment is already owned by this identity");
    }
    auto received = ledger.received_seals.find(concealed);
    if (received != ledger.received_seals.end() && received->second != result.transition_id) {
      return reject("seal was already assigned by another transfer");
    }

    const auto witness_txid = primitives::ComputeTxId(tip.witness);
    const auto outpoint =
        revealed->IsWitness() ? revealed->Resolve(witness_txid) : revealed->ToOutpoint();

    ledger.contracts.emplace(result.contract_id, genesis);
    history = std::move(merged);

    ledger::Allocation allocation;
    allocation.contract_id = result.contract_id;
    allocation.opout = Opout{result.transition_id, static_cast<std::uint16_t>(*index)};
    allocation.seal = *revealed;
    allocation.outpoint = outpoint;
    allocation.amount = amount;
    ledger.allocations.push_back(allocation);

    ledger.received_seals[concealed] = result.transition_id;
    ledger::AcceptedTransfer accepted;
    accepted.transition_id = result.transition_id;
    accepted.contract_id = result.contract_id;
    accepted.txid = util::HexEncodeReversed(witness_txid);
    accepted.outpoint = outpoint;
    accepted.amount = amount;
    accepted.accepted_at = now;
    ledger.accepted.emplace(result.transition_id, accepted);
    ledger.invoices.erase(concealed);

    result.status = AcceptStatus::kAccepted;
    result.outpoint = outpoint;
    return true;
  });

  if (result.status == AcceptStatus::kRejected) {
    util::LogInfo("accept: rejected " + util::HexEncode(result.transition_id) + ": " +
                  result.reason);
  } else {
    util::LogInfo("accept: " + std::string(AcceptStatusName(result.status)) + " " +
                  util::HexEncode(result.transition_id));
  }
  return result;
}

}  // namespace sealnode::transfer
