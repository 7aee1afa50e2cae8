#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <vector>

#include "contract/amount.hpp"
#include "contract/contract.hpp"
#include "nlohmann/json.hpp"
#include "primitives/transaction.hpp"
#include "seal/seal.hpp"

namespace sealnode::transfer {

using OpId = std::array<std::uint8_t, 32>;

// Reference to one assignment of an operation. The genesis operation id is
// the contract id and owns a single assignment at index 0.
struct Opout {
  OpId op{};
  std::uint16_t index{0};

  bool operator==(const Opout&) const = default;
  auto operator<=>(const Opout&) const = default;
};

struct Assignment {
  seal::SealDefinition seal;
  contract::AssetAmount amount{0};

  bool operator==(const Assignment&) const = default;
};

struct StateTransition {
  contract::ContractId contract_id{};
  std::vector<Opout> inputs;
  std::vector<Assignment> assignments;

  // Hash over the concealed form: revealing or concealing seals does not
  // change the id.
  OpId Id() const;
  StateTransition Concealed() const;

  bool operator==(const StateTransition&) const = default;
};

// One step of contract history as carried in a consignment.
struct TransitionRecord {
  StateTransition transition;
  primitives::CTransaction witness;
  // Revealed form of the seals closed by `witness`, in input order.
  std::vector<seal::RevealedSeal> closed_seals;
};

nlohmann::json OpoutToJson(const Opout& opout);
Opout OpoutFromJson(const nlohmann::json& json);

nlohmann::json TransitionToJson(const StateTransition& transition);
StateTransition TransitionFromJson(const nlohmann::json& json);

nlohmann::json RecordToJson(const TransitionRecord& record);
TransitionRecord RecordFromJson(const nlohmann::json& json);

// Hex of the consensus encoding (witness included).
std::string TransactionToHex(const primitives::CTransaction& tx);
primitives::CTransaction TransactionFromHex(std::string_view hex);

}  // namespace sealnode::transfer
