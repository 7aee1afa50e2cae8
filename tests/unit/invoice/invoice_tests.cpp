#include <iostream>
#include <string>

#include "contract/amount.hpp"
#include "contract/issuer.hpp"
#include "core/error.hpp"
#include "crypto/ec_key.hpp"
#include "invoice/builder.hpp"
#include "invoice/invoice.hpp"
#include "ledger/identity_store.hpp"
#include "util/time.hpp"

using namespace sealnode;

namespace {

const char* kTxid = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

template <typename Fn>
bool ExpectError(const char* label, ErrorKind expected, Fn&& fn) {
  try {
    fn();
  } catch (const Error& ex) {
    if (ex.kind == expected) {
      return true;
    }
    std::cerr << label << ": expected " << ErrorKindName(expected) << ", got "
              << ErrorKindName(ex.kind) << " (" << ex.what() << ")\n";
    return false;
  }
  std::cerr << label << ": no error raised\n";
  return false;
}

}  // namespace

int main() {
  // Decimal amounts.
  if (contract::ParseDecimalAmount("2.5", 2) != 250 || contract::ParseDecimalAmount("12", 2) != 1200 ||
      contract::ParseDecimalAmount("0.01", 2) != 1 || contract::ParseDecimalAmount("7", 0) != 7) {
    std::cerr << "decimal amount parsing mismatch\n";
    return 1;
  }
  if (contract::FormatAmount(1234, 2) != "12.34" || contract::FormatAmount(5, 3) != "0.005" ||
      contract::FormatAmount(42, 0) != "42") {
    std::cerr << "amount formatting mismatch\n";
    return 1;
  }
  if (!ExpectError("too many decimals", ErrorKind::kValidation,
                   [] { (void)contract::ParseDecimalAmount("1.234", 2); })) return 1;
  if (!ExpectError("overflow", ErrorKind::kValidation,
                   [] { (void)contract::ParseDecimalAmount("18446744073709551616", 0); })) return 1;
  if (!ExpectError("garbage", ErrorKind::kValidation,
                   [] { (void)contract::ParseDecimalAmount("1.2.3", 2); })) return 1;
  if (!ExpectError("negative", ErrorKind::kValidation,
                   [] { (void)contract::ParseDecimalAmount("-1", 2); })) return 1;
  {
    contract::AssetAmount out = 0;
    if (contract::CheckedAdd(~contract::AssetAmount{0}, 1, &out) || contract::CheckedSub(1, 2, &out)) {
      std::cerr << "checked arithmetic wrapped\n";
      return 1;
    }
  }

  ledger::IdentityStore store;
  const auto issuer = crypto::PrivateKey::FromHex(
      "1111111111111111111111111111111111111111111111111111111111111111");
  const auto identity = issuer.Public().ToHex();
  contract::IssueRequest issue;
  issue.ticker = "USDT";
  issue.name = "Tether";
  issue.precision = 2;
  issue.supply = 1000;
  issue.seal = std::string(kTxid) + ":0";
  const auto issued = contract::Issue(store, issuer, issue);
  const auto contract_id = contract::ContractIdToString(issued.id);

  invoice::InvoiceRequest request;
  request.contract_id = contract_id;
  request.amount = std::string("2.5");
  request.seal = std::string(kTxid) + ":2";
  request.expiry = util::UnixNow() + 3600;
  const auto created = invoice::CreateInvoice(store, identity, request);
  if (created.invoice.amount != 250) {
    std::cerr << "decimal invoice amount not converted: " << created.invoice.amount << "\n";
    return 1;
  }
  if (created.text.find(std::string(kTxid)) != std::string::npos) {
    std::cerr << "invoice leaks the beneficiary outpoint\n";
    return 1;
  }

  // Parse what was issued.
  {
    const auto parsed = invoice::ParseInvoice(created.text);
    if (parsed != created.invoice) {
      std::cerr << "invoice text did not parse back\n";
      return 1;
    }
    if (parsed.ToString() != created.text) {
      std::cerr << "invoice text is not canonical\n";
      return 1;
    }
    if (parsed.IsExpired(util::UnixNow()) || !parsed.IsExpired(*request.expiry + 1)) {
      std::cerr << "expiry check is wrong\n";
      return 1;
    }
  }

  // The pending invoice keeps the revealed seal for acceptance.
  {
    const auto ledger = store.Read(identity);
    const auto it = ledger.invoices.find(created.concealed);
    if (it == ledger.invoices.end() || it->second.seal.Conceal() != created.concealed ||
        it->second.amount != 250) {
      std::cerr << "pending invoice not recorded\n";
      return 1;
    }
  }

  // Two invoices for the same outpoint conceal differently.
  {
    auto atomic = request;
    atomic.amount = contract::AssetAmount{250};
    const auto second = invoice::CreateInvoice(store, identity, atomic);
    if (second.concealed == created.concealed) {
      std::cerr << "invoice seals are linkable\n";
      return 1;
    }
  }

  if (!ExpectError("zero amount", ErrorKind::kValidation, [&] {
        auto bad = request;
        bad.amount = contract::AssetAmount{0};
        (void)invoice::CreateInvoice(store, identity, bad);
      })) return 1;
  if (!ExpectError("above supply", ErrorKind::kValidation, [&] {
        auto bad = request;
        bad.amount = contract::AssetAmount{1001};
        (void)invoice::CreateInvoice(store, identity, bad);
      })) return 1;
  if (!ExpectError("past expiry", ErrorKind::kValidation, [&] {
        auto bad = request;
        bad.expiry = util::UnixNow() - 10;
        (void)invoice::CreateInvoice(store, identity, bad);
      })) return 1;
  if (!ExpectError("unknown contract", ErrorKind::kNotFound, [&] {
        (void)invoice::CreateInvoice(store, "03" + std::string(64, 'b'), request);
      })) return 1;
  if (!ExpectError("wrong interface", ErrorKind::kValidation, [&] {
        auto bad = request;
        bad.iface = "RGB21";
        (void)invoice::CreateInvoice(store, identity, bad);
      })) return 1;

  if (!ExpectError("missing scheme", ErrorKind::kValidation,
                   [] { (void)invoice::ParseInvoice("btc:foo"); })) return 1;
  if (!ExpectError("missing seal", ErrorKind::kValidation, [&] {
        (void)invoice::ParseInvoice("rgb:" + contract_id + "/RGB20/100");
      })) return 1;
  if (!ExpectError("zero amount text", ErrorKind::kValidation, [&] {
        (void)invoice::ParseInvoice("rgb:" + contract_id + "/RGB20/0+" +
                                    created.concealed.ToString());
      })) return 1;
  if (!ExpectError("bad query", ErrorKind::kValidation, [&] {
        (void)invoice::ParseInvoice("rgb:" + contract_id + "/RGB20/5+" +
                                    created.concealed.ToString() + "?foo=1");
      })) return 1;

  std::cout << "invoice tests passed\n";
  return 0;
}
