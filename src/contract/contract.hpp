#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

#include "contract/amount.hpp"
#include "nlohmann/json.hpp"
#include "seal/seal.hpp"

namespace sealnode::contract {

using ContractId = std::array<std::uint8_t, 32>;

// Bech32m with hrp "rgb".
std::string ContractIdToString(const ContractId& id);
// Throws Error(kValidation).
ContractId ParseContractId(std::string_view text);

// Genesis of a fungible asset. Fields are immutable once issued.
struct Contract {
  std::string ticker;
  std::string name;
  std::string description;
  std::uint8_t precision{0};
  AssetAmount supply{0};
  seal::RevealedSeal genesis_seal;
  std::string iface;
  std::string schema;
  std::string issuer;  // compressed public key hex
  std::int64_t created_at{0};

  // Commits to every field above except `created_at`, with the genesis seal
  // in concealed form.
  ContractId Id() const;

  bool operator==(const Contract&) const = default;
};

nlohmann::json ContractToJson(const Contract& contract);
// Throws Error(kValidation) on missing or ill-typed fields.
Contract ContractFromJson(const nlohmann::json& json);

}  // namespace sealnode::contract
