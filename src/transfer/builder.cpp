#include "transfer/builder.hpp"

#include <algorithm>
#include <bit>
#include <limits>
#include <numeric>

#include "core/error.hpp"
#include "invoice/invoice.hpp"
#include "script/script.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"

namespace sealnode::transfer {

namespace {

constexpr std::size_t kExhaustiveLimit = 16;

std::optional<std::vector<std::size_t>> SelectExhaustive(
    const std::vector<contract::AssetAmount>& values, contract::AssetAmount target) {
  const std::uint32_t limit = 1u << values.size();
  std::optional<std::uint32_t> best_mask;
  int best_count = 0;
  contract::AssetAmount best_sum = 0;
  for (std::uint32_t mask = 1; mask < limit; ++mask) {
    const int count = std::popcount(mask);
    if (best_mask && count > best_count) continue;
    contract::AssetAmount sum = 0;
    bool overflow = false;
    for (std::size_t i = 0; i < values.size(); ++i) {
      if ((mask >> i) & 1u) {
        if (!contract::CheckedAdd(sum, values[i], &sum)) {
          overflow = true;
          break;
        }
      }
    }
    if (overflow || sum < target) continue;
    if (!best_mask || count < best_count || (count == best_count && sum < best_sum)) {
      best_mask = mask;
      best_count = count;
      best_sum = sum;
    }
  }
  if (!best_mask) return std::nullopt;
  std::vector<std::size_t> out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if ((*best_mask >> i) & 1u) out.push_back(i);
  }
  return out;
}

// Largest first yields the fewest elements. The total is then lowered by
// swapping picks for the smallest unused value that keeps the target covered
// until no swap helps; a local search, so the sum is not always minimal.
std::optional<std::vector<std::size_t>> SelectGreedy(
    const std::vector<contract::AssetAmount>& values, contract::AssetAmount target) {
  constexpr auto kSaturated = std::numeric_limits<contract::AssetAmount>::max();
  std::vector<std::size_t> order(values.size());
  std::iota(order.begin(), order.end(), 0);
  std::stable_sort(order.begin(), order.end(),
                   [&](std::size_t a, std::size_t b) { return values[a] > values[b]; });
  std::vector<std::size_t> out;
  contract::AssetAmount sum = 0;
  bool covered = false;
  for (const auto index : order) {
    out.push_back(index);
    if (!contract::CheckedAdd(sum, values[index], &sum)) sum = kSaturated;
    if (sum >= target) {
      covered = true;
      break;
    }
  }
  if (!covered) return std::nullopt;

  auto saturating_sum = [&]() {
    contract::AssetAmount total = 0;
    for (const auto index : out) {
      if (!contract::CheckedAdd(total, values[index], &total)) return kSaturated;
    }
    return total;
  };
  std::vector<bool> used(values.size(), false);
  for (const auto index : out) used[index] = true;
  bool improved = true;
  while (improved) {
    improved = false;
    for (auto& pick : out) {
      const contract::AssetAmount rest = sum - values[pick];
      const contract::AssetAmount need = target > rest ? target - rest : 0;
      std::optional<std::size_t> best;
      for (std::size_t i = 0; i < values.size(); ++i) {
        if (used[i] || values[i] < need || values[i] >= values[pick]) continue;
        if (!best || values[i] < values[*best]) best = i;
      }
      if (best) {
        used[pick] = false;
        used[*best] = true;
        pick = *best;
        sum = saturating_sum();
        improved = true;
      }
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

std::optional<std::vector<std::size_t>> SelectCovering(
    const std::vector<contract::AssetAmount>& values, contract::AssetAmount target) {
  if (values.empty()) return std::nullopt;
  if (values.size() <= kExhaustiveLimit) {
    return SelectExhaustive(values, target);
  }
  return SelectGreedy(values, target);
}

UnsignedTransfer CreateTransfer(const ledger::IdentityStore& store, const crypto::PublicKey& payer,
                                std::string_view invoice_text, std::int64_t now) {
  const auto inv = invoice::ParseInvoice(invoice_text);
  if (inv.IsExpired(now)) {
    ThrowError(ErrorKind::kInvoiceExpired, "invoice expired");
  }
  const auto ledger = store.Read(payer.ToHex());
  if (ledger.consumed_invoices.count(inv.beneficiary) != 0) {
    ThrowError(ErrorKind::kInvoiceAlreadyUsed, "invoice has already been paid");
  }
  const auto* contract = ledger.FindContract(inv.contract_id);
  if (contract == nullptr) {
    ThrowError(ErrorKind::kNotFound, "unknown contract " + contract::ContractIdToString(inv.contract_id));
  }
  if (contract->iface != inv.iface) {
    ThrowError(ErrorKind::kValidation, "invoice interface does not match the contract");
  }

  std::vector<const ledger::Allocation*> candidates;
  std::vector<contract::AssetAmount> values;
  for (const auto& allocation : ledger.allocations) {
    if (allocation.contract_id == inv.contract_id && !allocation.spent && allocation.amount > 0) {
      candidates.push_back(&allocation);
      values.push_back(allocation.amount);
    }
  }
  const auto selection = SelectCovering(values, inv.amount);
  if (!selection) {
    ThrowError(ErrorKind::kInsufficientFunds,
               "owned balance does not cover " + contract::FormatAmount(inv.amount, contract->precision));
  }

  UnsignedTransfer out;
  out.amount = inv.amount;
  contract::AssetAmount covered = 0;
  primitives::CTransaction tx;
  for (const auto index : *selection) {
    const auto* allocation = candidates[index];
    if (!contract::CheckedAdd(covered, allocation->amount, &covered)) {
      ThrowError(ErrorKind::kValidation, "selected amounts overflow");
    }
    out.fields.transition.inputs.push_back(allocation->opout);
    out.fields.inputs.push_back(ClosedInput{allocation->seal, allocation->opout, payer});
    primitives::CTxIn in;
    in.prevout.txid = allocation->outpoint.txid;
    in.prevout.index = allocation->outpoint.vout;
    tx.vin.push_back(std::move(in));
  }
  out.change = covered - inv.amount;

  out.fields.transition.contract_id = inv.contract_id;
  out.fields.transition.assignments.push_back(Assignment{inv.beneficiary, inv.amount});
  if (out.change > 0) {
    seal::RevealedSeal change_seal;
    change_seal.method = candidates[selection->front()]->seal.method;
    change_seal.vout = kChangeVout;
    change_seal.blinding = util::SecureRandomUint64();
    out.fields.change = ChangeOutput{change_seal, out.change};
    out.fields.transition.assignments.push_back(Assignment{change_seal, out.change});
  }
  out.fields.invoice = std::string(invoice_text);
  out.transition_id = out.fields.transition.Id();

  tx.vout.push_back(primitives::CTxOut{0, script::BuildOpReturn(out.transition_id)});
  if (out.change > 0) {
    tx.vout.push_back(
        primitives::CTxOut{primitives::kDustLimit, script::BuildTaprootOutput(payer.XOnly())});
  }

  out.psbt = psbt::Psbt::FromTransaction(std::move(tx));
  EmbedTransferFields(out.fields, &out.psbt);
  util::LogDebug("psbt: " + std::to_string(selection->size()) + " input(s), change " +
                 std::to_string(out.change));
  return out;
}

}  // namespace sealnode::transfer
