#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "contract/contract.hpp"
#include "nlohmann/json.hpp"
#include "transfer/transition.hpp"

namespace sealnode::transfer {

// Everything a receiver needs to validate a transfer without chain access:
// the contract genesis and each transition since, in application order. The
// last record is the transfer being delivered.
struct Consignment {
  contract::Contract genesis;
  std::vector<TransitionRecord> history;

  const TransitionRecord& Tip() const { return history.back(); }

  nlohmann::json ToJson() const;
  static Consignment FromJson(const nlohmann::json& json);

  // Base64 of the compact JSON document.
  std::string Armor() const;
  // Throws Error(kValidation).
  static Consignment Dearmor(std::string_view text);
};

}  // namespace sealnode::transfer
