#include "ledger/identity_ledger.hpp"

#include <algorithm>
#include <limits>

#include "core/error.hpp"
#include "util/hex.hpp"

namespace sealnode::ledger {

namespace {

using nlohmann::json;

transfer::OpId ParseOpId(const std::string& hex) {
  transfer::OpId id{};
  if (!util::HexDecodeFixed(hex, id)) {
    ThrowError(ErrorKind::kStorage, "ledger: invalid operation id");
  }
  return id;
}

json AllocationToJson(const Allocation& a) {
  return {
      {"contract_id", contract::ContractIdToString(a.contract_id)},
      {"opout", transfer::OpoutToJson(a.opout)},
      {"seal", a.seal.ToString()},
      {"outpoint", a.outpoint.ToString()},
      {"amount", a.amount},
      {"spent", a.spent},
  };
}

Allocation AllocationFromJson(const json& j) {
  Allocation a;
  a.contract_id = contract::ParseContractId(j.at("contract_id").get<std::string>());
  a.opout = transfer::OpoutFromJson(j.at("opout"));
  a.seal = seal::RevealedSeal::Parse(j.at("seal").get<std::string>());
  a.outpoint = seal::Outpoint::Parse(j.at("outpoint").get<std::string>());
  a.amount = j.at("amount").get<contract::AssetAmount>();
  a.spent = j.at("spent").get<bool>();
  return a;
}

json InvoiceToJson(const PendingInvoice& inv) {
  json j = {
      {"invoice", inv.invoice},
      {"contract_id", contract::ContractIdToString(inv.contract_id)},
      {"iface", inv.iface},
      {"amount", inv.amount},
      {"seal", inv.seal.ToString()},
      {"created_at", inv.created_at},
  };
  if (inv.expiry) j["expiry"] = *inv.expiry;
  return j;
}

PendingInvoice InvoiceFromJson(const json& j) {
  PendingInvoice inv;
  inv.invoice = j.at("invoice").get<std::string>();
  inv.contract_id = contract::ParseContractId(j.at("contract_id").get<std::string>());
  inv.iface = j.at("iface").get<std::string>();
  inv.amount = j.at("amount").get<contract::AssetAmount>();
  inv.seal = seal::RevealedSeal::Parse(j.at("seal").get<std::string>());
  if (j.contains("expiry")) inv.expiry = j.at("expiry").get<std::int64_t>();
  inv.created_at = j.value("created_at", std::int64_t{0});
  return inv;
}

json PendingTransferToJson(const PendingTransfer& p) {
  return {
      {"txid", p.txid},
      {"contract_id", contract::ContractIdToString(p.contract_id)},
      {"transition_id", util::HexEncode(p.transition_id)},
      {"invoice", p.invoice},
      {"amount", p.amount},
      {"change", p.change},
      {"created_at", p.created_at},
  };
}

PendingTransfer PendingTransferFromJson(const json& j) {
  PendingTransfer p;
  p.txid = j.at("txid").get<std::string>();
  p.contract_id = contract::ParseContractId(j.at("contract_id").get<std::string>());
  p.transition_id = ParseOpId(j.at("transition_id").get<std::string>());
  p.invoice = j.at("invoice").get<std::string>();
  p.amount = j.at("amount").get<contract::AssetAmount>();
  p.change = j.at("change").get<contract::AssetAmount>();
  p.created_at = j.value("created_at", std::int64_t{0});
  return p;
}

json AcceptedToJson(const AcceptedTransfer& a) {
  return {
      {"transition_id", util::HexEncode(a.transition_id)},
      {"contract_id", contract::ContractIdToString(a.contract_id)},
      {"txid", a.txid},
      {"outpoint", a.outpoint.ToString()},
      {"amount", a.amount},
      {"accepted_at", a.accepted_at},
  };
}

AcceptedTransfer AcceptedFromJson(const json& j) {
  AcceptedTransfer a;
  a.transition_id = ParseOpId(j.at("transition_id").get<std::string>());
  a.contract_id = contract::ParseContractId(j.at("contract_id").get<std::string>());
  a.txid = j.at("txid").get<std::string>();
  a.outpoint = seal::Outpoint::Parse(j.at("outpoint").get<std::string>());
  a.amount = j.at("amount").get<contract::AssetAmount>();
  a.accepted_at = j.value("accepted_at", std::int64_t{0});
  return a;
}

}  // namespace

const contract::Contract* IdentityLedger::FindContract(const contract::ContractId& id) const {
  auto it = contracts.find(id);
  return it == contracts.end() ? nullptr : &it->second;
}

contract::AssetAmount IdentityLedger::Balance(const contract::ContractId& id) const {
  contract::AssetAmount total = 0;
  for (const auto& a : allocations) {
    if (a.contract_id != id || a.spent) continue;
    if (!contract::CheckedAdd(total, a.amount, &total)) {
      return std::numeric_limits<contract::AssetAmount>::max();
    }
  }
  return total;
}

Allocation* IdentityLedger::FindAllocation(const transfer::Opout& opout) {
  auto it = std::find_if(allocations.begin(), allocations.end(),
                         [&](const Allocation& a) { return a.opout == opout; });
  return it == allocations.end() ? nullptr : &*it;
}

const Allocation* IdentityLedger::FindAllocation(const transfer::Opout& opout) const {
  auto it = std::find_if(allocations.begin(), allocations.end(),
                         [&](const Allocation& a) { return a.opout == opout; });
  return it == allocations.end() ? nullptr : &*it;
}

json LedgerToJson(const IdentityLedger& ledger) {
  json contracts = json::array();
  for (const auto& [id, c] : ledger.contracts) contracts.push_back(contract::ContractToJson(c));

  json history = json::object();
  for (const auto& [id, records] : ledger.history) {
    json list = json::array();
    for (const auto& r : records) list.push_back(transfer::RecordToJson(r));
    history[contract::ContractIdToString(id)] = std::move(list);
  }

  json allocations = json::array();
  for (const auto& a : ledger.allocations) allocations.push_back(AllocationToJson(a));

  json invoices = json::array();
  for (const auto& [concealed, inv] : ledger.invoices) invoices.push_back(InvoiceToJson(inv));

  json consumed = json::array();
  for (const auto& s : ledger.consumed_invoices) consumed.push_back(s.ToString());

  json received = json::object();
  for (const auto& [s, op] : ledger.received_seals) received[s.ToString()] = util::HexEncode(op);

  json pending = json::array();
  for (const auto& [txid, p] : ledger.pending_transfers) pending.push_back(PendingTransferToJson(p));

  json accepted = json::array();
  for (const auto& [id, a] : ledger.accepted) accepted.push_back(AcceptedToJson(a));

  return {
      {"version", 1},
      {"contracts", std::move(contracts)},
      {"history", std::move(history)},
      {"allocations", std::move(allocations)},
      {"invoices", std::move(invoices)},
      {"consumed_invoices", std::move(consumed)},
      {"received_seals", std::move(received)},
      {"pending_transfers", std::move(pending)},
      {"accepted", std::move(accepted)},
  };
}

IdentityLedger LedgerFromJson(const json& j) {
  try {
    if (j.value("version", 0) != 1) {
      ThrowError(ErrorKind::kStorage, "ledger: unsupported version");
    }
    IdentityLedger ledger;
    for (const auto& c : j.at("contracts")) {
      auto parsed = contract::ContractFromJson(c);
      ledger.contracts.emplace(parsed.Id(), std::move(parsed));
    }
    for (const auto& [key, list] : j.at("history").items()) {
      auto& records = ledger.history[contract::ParseContractId(key)];
      for (const auto& r : list) records.push_back(transfer::RecordFromJson(r));
    }
    for (const auto& a : j.at("allocations")) ledger.allocations.push_back(AllocationFromJson(a));
    for (const auto& i : j.at("invoices")) {
      auto inv = InvoiceFromJson(i);
      ledger.invoices.emplace(inv.seal.Conceal(), std::move(inv));
    }
    for (const auto& s : j.at("consumed_invoices")) {
      ledger.consumed_invoices.insert(seal::ConcealedSeal::Parse(s.get<std::string>()));
    }
    for (const auto& [key, op] : j.at("received_seals").items()) {
      ledger.received_seals.emplace(seal::ConcealedSeal::Parse(key),
                                    ParseOpId(op.get<std::string>()));
    }
    for (const auto& p : j.at("pending_transfers")) {
      auto parsed = PendingTransferFromJson(p);
      ledger.pending_transfers.emplace(parsed.txid, std::move(parsed));
    }
    for (const auto& a : j.at("accepted")) {
      auto parsed = AcceptedFromJson(a);
      ledger.accepted.emplace(parsed.transition_id, std::move(parsed));
    }
    return ledger;
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kStorage, std::string("ledger: malformed document: ") + ex.what());
  } catch (const Error& ex) {
    if (ex.kind == ErrorKind::kStorage) throw;
    ThrowError(ErrorKind::kStorage, std::string("ledger: ") + ex.what());
  }
}

}  // namespace sealnode::ledger
