#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "contract/catalog.hpp"
#include "contract/issuer.hpp"
#include "core/error.hpp"
#include "crypto/ec_key.hpp"
#include "ledger/identity_store.hpp"

using namespace sealnode;

namespace {

const char* kSeal = "tapret1st:4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b:0";

contract::IssueRequest BaseRequest() {
  contract::IssueRequest request;
  request.ticker = "usdt";
  request.name = "Tether";
  request.description = "test asset";
  request.precision = 2;
  request.supply = 1000;
  request.seal = kSeal;
  return request;
}

bool ExpectIssueError(const char* label, ledger::IdentityStore& store,
                      const crypto::PrivateKey& key, const contract::IssueRequest& request,
                      ErrorKind expected) {
  try {
    (void)contract::Issue(store, key, request);
  } catch (const Error& ex) {
    if (ex.kind == expected) {
      return true;
    }
    std::cerr << label << ": expected " << ErrorKindName(expected) << ", got "
              << ErrorKindName(ex.kind) << " (" << ex.what() << ")\n";
    return false;
  }
  std::cerr << label << ": issue succeeded\n";
  return false;
}

}  // namespace

int main() {
  ledger::IdentityStore store;
  const auto issuer = crypto::PrivateKey::FromHex(
      "1111111111111111111111111111111111111111111111111111111111111111");
  const auto identity = issuer.Public().ToHex();

  const auto first = contract::Issue(store, issuer, BaseRequest());
  if (!first.created || first.contract.ticker != "USDT" || first.contract.schema != "NIA") {
    std::cerr << "initial issue produced unexpected contract\n";
    return 1;
  }
  if (contract::ContractIdToString(first.id).rfind("rgb1", 0) != 0) {
    std::cerr << "contract id lacks rgb prefix\n";
    return 1;
  }
  if (contract::ParseContractId(contract::ContractIdToString(first.id)) != first.id) {
    std::cerr << "contract id text did not parse back\n";
    return 1;
  }

  // Retrying the same request is idempotent.
  const auto retry = contract::Issue(store, issuer, BaseRequest());
  if (retry.created || retry.id != first.id) {
    std::cerr << "retried issue was not idempotent\n";
    return 1;
  }

  {
    const auto ledger = store.Read(identity);
    if (ledger.contracts.size() != 1 || ledger.allocations.size() != 1) {
      std::cerr << "issue registered duplicate state\n";
      return 1;
    }
    const auto& allocation = ledger.allocations.front();
    if (allocation.amount != 1000 || allocation.opout.op != first.id ||
        allocation.opout.index != 0 || allocation.spent) {
      std::cerr << "genesis allocation is wrong\n";
      return 1;
    }
    if (ledger.Balance(first.id) != 1000) {
      std::cerr << "balance after issue is not the supply\n";
      return 1;
    }
  }

  // Any differing parameter yields a different contract.
  {
    auto request = BaseRequest();
    request.supply = 1001;
    if (contract::Issue(store, issuer, request).id == first.id) {
      std::cerr << "supply does not affect contract id\n";
      return 1;
    }
    request = BaseRequest();
    request.name = "Tether Gold";
    if (contract::Issue(store, issuer, request).id == first.id) {
      std::cerr << "name does not affect contract id\n";
      return 1;
    }
    request = BaseRequest();
    request.seal = std::string(kSeal) + "#5";
    if (contract::Issue(store, issuer, request).id == first.id) {
      std::cerr << "blinding does not affect contract id\n";
      return 1;
    }
  }

  // Another issuer with identical parameters owns a different contract.
  {
    const auto other = crypto::PrivateKey::FromHex(
        "2222222222222222222222222222222222222222222222222222222222222222");
    if (contract::Issue(store, other, BaseRequest()).id == first.id) {
      std::cerr << "issuer does not affect contract id\n";
      return 1;
    }
  }

  // Validation.
  {
    auto request = BaseRequest();
    request.ticker = "";
    if (!ExpectIssueError("empty ticker", store, issuer, request, ErrorKind::kValidation)) return 1;
    request.ticker = "TOOLONGTK";
    if (!ExpectIssueError("long ticker", store, issuer, request, ErrorKind::kValidation)) return 1;
    request.ticker = "US-D";
    if (!ExpectIssueError("ticker charset", store, issuer, request, ErrorKind::kValidation)) return 1;
    request = BaseRequest();
    request.precision = 19;
    if (!ExpectIssueError("precision", store, issuer, request, ErrorKind::kValidation)) return 1;
    request.precision = -1;
    if (!ExpectIssueError("negative precision", store, issuer, request, ErrorKind::kValidation)) return 1;
    request = BaseRequest();
    request.supply = 0;
    if (!ExpectIssueError("zero supply", store, issuer, request, ErrorKind::kValidation)) return 1;
    request = BaseRequest();
    request.iface = "RGB21";
    if (!ExpectIssueError("unknown iface", store, issuer, request, ErrorKind::kValidation)) return 1;
    request = BaseRequest();
    request.name = std::string(41, 'n');
    if (!ExpectIssueError("long name", store, issuer, request, ErrorKind::kValidation)) return 1;
    request = BaseRequest();
    request.seal = "not-a-seal";
    if (!ExpectIssueError("bad seal", store, issuer, request, ErrorKind::kSeal)) return 1;
  }

  // Export and import.
  {
    const auto genesis = contract::ExportGenesis(store, identity, first.id);
    if (genesis.Id() != first.id) {
      std::cerr << "exported genesis does not hash to its id\n";
      return 1;
    }
    const auto json = contract::ContractToJson(genesis);
    if (contract::ContractFromJson(json) != genesis) {
      std::cerr << "genesis JSON did not parse back\n";
      return 1;
    }
    // Out-of-range fields are refused rather than narrowed.
    const std::vector<std::pair<std::string, nlohmann::json>> out_of_range{
        {"precision", 274}, {"precision", -1}, {"supply", -5}, {"supply", 2.5}};
    for (const auto& [field, value] : out_of_range) {
      auto bad = json;
      bad.erase("contract_id");
      bad[field] = value;
      try {
        (void)contract::ContractFromJson(bad);
        std::cerr << "genesis with " << field << "=" << value.dump() << " parsed\n";
        return 1;
      } catch (const Error& ex) {
        if (ex.kind != ErrorKind::kValidation) {
          std::cerr << "genesis " << field << ": wrong error kind\n";
          return 1;
        }
      }
    }
    const std::string receiver = "02466d7fcae563e5cb09a0d1870bb580344804617879a14949cf22285f1bae3f27";
    if (!contract::ImportContract(store, receiver, genesis) ||
        contract::ImportContract(store, receiver, genesis)) {
      std::cerr << "import was not idempotent\n";
      return 1;
    }
    if (store.Read(receiver).Balance(first.id) != 0) {
      std::cerr << "import created an allocation\n";
      return 1;
    }
    try {
      (void)contract::ExportGenesis(store, "03" + std::string(64, 'a'), first.id);
      std::cerr << "export for unrelated identity succeeded\n";
      return 1;
    } catch (const Error& ex) {
      if (ex.kind != ErrorKind::kNotFound) {
        std::cerr << "export: wrong error kind\n";
        return 1;
      }
    }
  }

  // Listing is sorted by ticker.
  {
    auto request = BaseRequest();
    request.ticker = "AAA";
    (void)contract::Issue(store, issuer, request);
    const auto listed = contract::ListContracts(store, identity);
    if (listed.empty() || listed.front().contract.ticker != "AAA") {
      std::cerr << "contracts not sorted by ticker\n";
      return 1;
    }
  }

  if (contract::FindInterface("RGB20") == nullptr || contract::Schemas().empty()) {
    std::cerr << "catalog is empty\n";
    return 1;
  }

  std::cout << "issuer tests passed\n";
  return 0;
}
