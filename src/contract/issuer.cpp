#include "contract/issuer.hpp"

#include <algorithm>
#include <cctype>

#include "contract/catalog.hpp"
#include "core/error.hpp"
#include "seal/blinder.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace sealnode::contract {

namespace {

constexpr std::size_t kMaxTickerLength = 8;
constexpr std::size_t kMaxNameLength = 40;
constexpr std::size_t kMaxDescriptionLength = 256;

std::string NormalizeTicker(std::string ticker) {
  std::transform(ticker.begin(), ticker.end(), ticker.begin(),
                 [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
  return ticker;
}

bool IsPrintable(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char c) { return c >= 0x20 && c != 0x7f; });
}

}  // namespace

void ValidateContract(const Contract& contract) {
  const auto& ticker = contract.ticker;
  if (ticker.empty() || ticker.size() > kMaxTickerLength) {
    ThrowError(ErrorKind::kValidation, "ticker must be 1 to 8 characters");
  }
  for (unsigned char c : ticker) {
    if (!(std::isupper(c) || std::isdigit(c))) {
      ThrowError(ErrorKind::kValidation, "ticker may only contain A-Z and 0-9");
    }
  }
  if (contract.name.empty() || contract.name.size() > kMaxNameLength) {
    ThrowError(ErrorKind::kValidation, "name must be 1 to 40 characters");
  }
  if (!IsPrintable(contract.name) || !IsPrintable(contract.description)) {
    ThrowError(ErrorKind::kValidation, "name and description must not contain control characters");
  }
  if (contract.description.size() > kMaxDescriptionLength) {
    ThrowError(ErrorKind::kValidation, "description exceeds 256 characters");
  }
  if (contract.precision > kMaxPrecision) {
    ThrowError(ErrorKind::kValidation, "precision must be between 0 and 18");
  }
  if (contract.supply == 0) {
    ThrowError(ErrorKind::kValidation, "supply must be greater than zero");
  }
  if (FindInterface(contract.iface) == nullptr) {
    ThrowError(ErrorKind::kValidation, "unknown interface '" + contract.iface + "'");
  }
  const auto* schema = SchemaForInterface(contract.iface);
  if (schema == nullptr || schema->name != contract.schema) {
    ThrowError(ErrorKind::kValidation, "schema does not implement interface " + contract.iface);
  }
  if (contract.genesis_seal.IsWitness()) {
    ThrowError(ErrorKind::kSeal, "genesis seal must name a transaction output");
  }
}

IssueResult Issue(ledger::IdentityStore& store, const crypto::PrivateKey& issuer,
                  const IssueRequest& request) {
  if (request.precision < 0 || request.precision > kMaxPrecision) {
    ThrowError(ErrorKind::kValidation, "precision must be between 0 and 18");
  }
  const auto descriptor = seal::ParseSealDescriptor(request.seal);

  Contract contract;
  contract.ticker = NormalizeTicker(request.ticker);
  contract.name = request.name;
  contract.description = request.description;
  contract.precision = static_cast<std::uint8_t>(request.precision);
  contract.supply = request.supply;
  contract.iface = request.iface;
  if (const auto* schema = SchemaForInterface(request.iface)) {
    contract.schema = schema->name;
  }
  const auto blinding = descriptor.blinding.value_or(
      seal::DeriveBlinding(issuer.Secret(), descriptor.outpoint, descriptor.method, "genesis"));
  contract.genesis_seal =
      seal::BlindWithFactor(descriptor.outpoint, descriptor.method, blinding).revealed;
  contract.issuer = issuer.Public().ToHex();
  contract.created_at = util::UnixNow();
  ValidateContract(contract);

  IssueResult result;
  result.id = contract.Id();
  result.contract = contract;
  store.Transact(contract.issuer, [&](ledger::IdentityLedger& ledger) {
    if (const auto* existing = ledger.FindContract(result.id)) {
      result.contract = *existing;
      return false;
    }
    ledger.contracts.emplace(result.id, contract);
    ledger::Allocation allocation;
    allocation.contract_id = result.id;
    allocation.opout = transfer::Opout{result.id, 0};
    allocation.seal = contract.genesis_seal;
    allocation.outpoint = contract.genesis_seal.ToOutpoint();
    allocation.amount = contract.supply;
    ledger.allocations.push_back(allocation);
    result.created = true;
    return true;
  });
  if (result.created) {
    util::LogInfo("issue: " + ContractIdToString(result.id) + " " + contract.ticker +
                  " supply=" + FormatAmount(contract.supply, contract.precision));
  }
  return result;
}

bool ImportContract(ledger::IdentityStore& store, const std::string& identity,
                    const Contract& contract) {
  ValidateContract(contract);
  const auto id = contract.Id();
  const bool added = store.Transact(identity, [&](ledger::IdentityLedger& ledger) {
    if (ledger.FindContract(id) != nullptr) {
      return false;
    }
    ledger.contracts.emplace(id, contract);
    return true;
  });
  if (added) {
    util::LogInfo("import: " + ContractIdToString(id) + " " + contract.ticker);
  }
  return added;
}

Contract ExportGenesis(const ledger::IdentityStore& store, const std::string& identity,
                       const ContractId& id) {
  const auto ledger = store.Read(identity);
  const auto* contract = ledger.FindContract(id);
  if (contract == nullptr) {
    ThrowError(ErrorKind::kNotFound, "unknown contract " + ContractIdToString(id));
  }
  return *contract;
}

std::vector<ContractSummary> ListContracts(const ledger::IdentityStore& store,
                                           const std::string& identity) {
  const auto ledger = store.Read(identity);
  std::vector<ContractSummary> out;
  out.reserve(ledger.contracts.size());
  for (const auto& [id, contract] : ledger.contracts) {
    out.push_back(ContractSummary{contract, id, ledger.Balance(id)});
  }
  std::sort(out.begin(), out.end(), [](const ContractSummary& a, const ContractSummary& b) {
    if (a.contract.ticker != b.contract.ticker) return a.contract.ticker < b.contract.ticker;
    return a.id < b.id;
  });
  return out;
}

}  // namespace sealnode::contract
