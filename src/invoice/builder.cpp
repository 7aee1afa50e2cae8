#include "invoice/builder.hpp"

#include "core/error.hpp"
#include "seal/blinder.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace sealnode::invoice {

contract::AssetAmount ResolveAmount(const AmountInput& input, const contract::Contract& contract) {
  const contract::AssetAmount amount =
      std::holds_alternative<contract::AssetAmount>(input)
          ? std::get<contract::AssetAmount>(input)
          : contract::ParseDecimalAmount(std::get<std::string>(input), contract.precision);
  if (amount == 0) {
    ThrowError(ErrorKind::kValidation, "amount must not be zero");
  }
  if (amount > contract.supply) {
    ThrowError(ErrorKind::kValidation, "amount exceeds contract supply");
  }
  return amount;
}

InvoiceResult CreateInvoice(ledger::IdentityStore& store, const std::string& identity,
                            const InvoiceRequest& request) {
  const auto contract_id = contract::ParseContractId(request.contract_id);
  const auto descriptor = seal::ParseSealDescriptor(request.seal);
  const auto now = util::UnixNow();
  if (request.expiry && *request.expiry <= now) {
    ThrowError(ErrorKind::kValidation, "expiry is in the past");
  }

  InvoiceResult result;
  store.Transact(identity, [&](ledger::IdentityLedger& ledger) {
    const auto* contract = ledger.FindContract(contract_id);
    if (contract == nullptr) {
      ThrowError(ErrorKind::kNotFound, "unknown contract " + request.contract_id);
    }
    if (contract->iface != request.iface) {
      ThrowError(ErrorKind::kValidation,
                 "contract does not implement interface '" + request.iface + "'");
    }
    const auto amount = ResolveAmount(request.amount, *contract);
    const auto blinded = seal::Blind(descriptor.outpoint, descriptor.method);

    result.invoice.contract_id = contract_id;
    result.invoice.iface = request.iface;
    result.invoice.amount = amount;
    result.invoice.beneficiary = blinded.concealed;
    result.invoice.expiry = request.expiry;
    result.text = result.invoice.ToString();
    result.concealed = blinded.concealed;

    ledger::PendingInvoice pending;
    pending.invoice = result.text;
    pending.contract_id = contract_id;
    pending.iface = request.iface;
    pending.amount = amount;
    pending.seal = blinded.revealed;
    pending.expiry = request.expiry;
    pending.created_at = now;
    ledger.invoices.emplace(blinded.concealed, std::move(pending));
    return true;
  });
  util::LogInfo("invoice: " + result.concealed.ToString() + " for " +
                std::to_string(result.invoice.amount));
  return result;
}

}  // namespace sealnode::invoice
