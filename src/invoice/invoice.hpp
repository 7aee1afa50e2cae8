#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "contract/contract.hpp"
#include "seal/seal.hpp"

namespace sealnode::invoice {

// rgb:<contract id>/<iface>/<amount>+<concealed seal>[?expiry=<unix seconds>]
struct Invoice {
  contract::ContractId contract_id{};
  std::string iface;
  contract::AssetAmount amount{0};
  seal::ConcealedSeal beneficiary;
  std::optional<std::int64_t> expiry;

  std::string ToString() const;
  bool IsExpired(std::int64_t now) const noexcept { return expiry && *expiry < now; }

  bool operator==(const Invoice&) const = default;
};

// Throws Error(kValidation).
Invoice ParseInvoice(std::string_view text);

}  // namespace sealnode::invoice
