#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "contract/contract.hpp"
#include "crypto/ec_key.hpp"
#include "ledger/identity_store.hpp"

namespace sealnode::contract {

struct IssueRequest {
  std::string ticker;
  std::string name;
  std::string description;
  std::int64_t precision{0};
  AssetAmount supply{0};
  std::string seal;  // "[method:]txid:vout[#blinding]"
  std::string iface{"RGB20"};
};

struct IssueResult {
  Contract contract;
  ContractId id{};
  bool created{false};
};

// Throws Error(kValidation) unless every genesis field is in range and the
// interface is served by a known schema.
void ValidateContract(const Contract& contract);

// Registers a new contract for the key holder and assigns the full supply to
// the genesis seal. Without an explicit blinding in the descriptor, the
// blinding is derived from the issuer's key so a retried issue yields the same
// contract id; the retry returns the registered contract with created=false.
IssueResult Issue(ledger::IdentityStore& store, const crypto::PrivateKey& issuer,
                  const IssueRequest& request);

// Registers a contract received out of band so the identity can invoice it.
// No allocation is created. Returns false if it was already known.
bool ImportContract(ledger::IdentityStore& store, const std::string& identity,
                    const Contract& contract);

// Throws Error(kNotFound).
Contract ExportGenesis(const ledger::IdentityStore& store, const std::string& identity,
                       const ContractId& id);

struct ContractSummary {
  Contract contract;
  ContractId id{};
  AssetAmount balance{0};
};

// Ordered by ticker, then by contract id.
std::vector<ContractSummary> ListContracts(const ledger::IdentityStore& store,
                                           const std::string& identity);

}  // namespace sealnode::contract
