#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "contract/amount.hpp"
#include "invoice/invoice.hpp"
#include "ledger/identity_store.hpp"
#include "seal/seal.hpp"

namespace sealnode::invoice {

// Either atomic units, or a decimal string in whole asset units
// ("2.5" with precision 2 is 250 atomic units).
using AmountInput = std::variant<contract::AssetAmount, std::string>;

struct InvoiceRequest {
  std::string contract_id;
  std::string iface{"RGB20"};
  AmountInput amount{contract::AssetAmount{0}};
  std::string seal;  // "[method:]txid:vout"
  std::optional<std::int64_t> expiry;
};

struct InvoiceResult {
  Invoice invoice;
  std::string text;
  seal::ConcealedSeal concealed;
};

contract::AssetAmount ResolveAmount(const AmountInput& input, const contract::Contract& contract);

// Blinds the requested outpoint and stores the revealed seal with the pending
// invoice; only the concealed form leaves the node.
InvoiceResult CreateInvoice(ledger::IdentityStore& store, const std::string& identity,
                            const InvoiceRequest& request);

}  // namespace sealnode::invoice
