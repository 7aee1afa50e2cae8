#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "contract/issuer.hpp"
#include "core/error.hpp"
#include "crypto/ec_key.hpp"
#include "invoice/builder.hpp"
#include "invoice/invoice.hpp"
#include "ledger/identity_store.hpp"
#include "script/script.hpp"
#include "transfer/acceptor.hpp"
#include "transfer/builder.hpp"
#include "transfer/consignment.hpp"
#include "transfer/executor.hpp"
#include "transfer/psbt_fields.hpp"
#include "util/base64.hpp"
#include "util/time.hpp"

using namespace sealnode;

namespace {

const char* kFundingTxid = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";
const char* kBobTxid = "0e3e2357e806b6cdb1f70b54c3a3a17b6714ee1f0e68bebb44a74b1efd512098";
const char* kAliceTxid = "9b0fc92260312ce44e74ef369f5c66bbb85848f2eddd5a7a1cde251e54ccfdd5";

template <typename Fn>
bool ExpectError(const char* label, ErrorKind expected, Fn&& fn) {
  try {
    fn();
  } catch (const Error& ex) {
    if (ex.kind == expected) return true;
    std::cerr << label << ": expected " << ErrorKindName(expected) << ", got "
              << ErrorKindName(ex.kind) << " (" << ex.what() << ")\n";
    return false;
  }
  std::cerr << label << ": no error raised\n";
  return false;
}

struct Party {
  crypto::PrivateKey key;
  std::string id;
};

Party MakeParty(const char* secret_hex) {
  auto key = crypto::PrivateKey::FromHex(secret_hex);
  auto id = key.Public().ToHex();
  return Party{key, id};
}

contract::ContractId IssueTo(ledger::IdentityStore& store, const Party& issuer, std::uint8_t precision,
                             contract::AssetAmount supply) {
  contract::IssueRequest issue;
  issue.ticker = "TST";
  issue.name = "Test asset";
  issue.precision = precision;
  issue.supply = supply;
  issue.seal = std::string(kFundingTxid) + ":0";
  return contract::Issue(store, issuer.key, issue).id;
}

invoice::InvoiceResult InvoiceFor(ledger::IdentityStore& store, const Party& payee,
                                   const contract::ContractId& id, invoice::AmountInput amount,
                                   std::uint32_t vout) {
  invoice::InvoiceRequest request;
  request.contract_id = contract::ContractIdToString(id);
  request.amount = std::move(amount);
  request.seal = std::string(kBobTxid) + ":" + std::to_string(vout);
  return invoice::CreateInvoice(store, payee.id, request);
}

// Rewrites `base` to pay `invoice_text` while closing its first seal twice.
psbt::Psbt RepeatFirstInput(const transfer::UnsignedTransfer& base, const std::string& invoice_text,
                            contract::AssetAmount amount, contract::AssetAmount change) {
  auto fields = base.fields;
  fields.invoice = invoice_text;
  fields.transition.inputs.push_back(fields.transition.inputs.front());
  fields.inputs.push_back(fields.inputs.front());
  fields.transition.assignments[0] =
      transfer::Assignment{invoice::ParseInvoice(invoice_text).beneficiary, amount};
  fields.transition.assignments[1].amount = change;
  fields.change->amount = change;
  auto tx = base.psbt.unsigned_tx;
  tx.vin.push_back(tx.vin.front());
  tx.vout[transfer::kCommitmentVout].script_pubkey = script::BuildOpReturn(fields.transition.Id());
  auto psbt = psbt::Psbt::FromTransaction(std::move(tx));
  transfer::EmbedTransferFields(fields, &psbt);
  return psbt;
}

bool RunScenario() {
  ledger::IdentityStore store;
  const auto alice = MakeParty("1111111111111111111111111111111111111111111111111111111111111111");
  const auto bob = MakeParty("2222222222222222222222222222222222222222222222222222222222222222");
  const auto mallory = MakeParty("3333333333333333333333333333333333333333333333333333333333333333");
  const std::int64_t now = util::UnixNow();

  // Issue 10.00 USDT to a seal on Alice's funding output.
  contract::IssueRequest issue;
  issue.ticker = "USDT";
  issue.name = "Tether";
  issue.precision = 2;
  issue.supply = 1000;
  issue.seal = std::string(kFundingTxid) + ":0";
  const auto issued = contract::Issue(store, alice.key, issue);
  const auto contract_id = contract::ContractIdToString(issued.id);

  // Bob learns the contract out of band and invoices 2.50.
  contract::ImportContract(store, bob.id, contract::ExportGenesis(store, alice.id, issued.id));
  invoice::InvoiceRequest request;
  request.contract_id = contract_id;
  request.amount = std::string("2.50");
  request.seal = std::string(kBobTxid) + ":1";
  request.expiry = now + 3600;
  const auto bob_invoice = invoice::CreateInvoice(store, bob.id, request);
  const auto bob_seal = store.Read(bob.id).invoices.at(bob_invoice.concealed).seal;

  // Alice builds and signs.
  const auto unsigned_transfer = transfer::CreateTransfer(store, alice.key.Public(), bob_invoice.text, now);
  if (unsigned_transfer.amount != 250 || unsigned_transfer.change != 750) {
    std::cerr << "unexpected split " << unsigned_transfer.amount << "/" << unsigned_transfer.change << "\n";
    return false;
  }
  if (!ExpectError("foreign signer", ErrorKind::kSigning, [&] {
        (void)transfer::Execute(store, mallory.key, unsigned_transfer.psbt, now);
      })) {
    return false;
  }
  if (store.Read(alice.id).Balance(issued.id) != 1000) {
    std::cerr << "failed signing changed the payer ledger\n";
    return false;
  }

  const auto signed_transfer = transfer::Execute(store, alice.key, unsigned_transfer.psbt, now);
  if (!signed_transfer.psbt.IsFinalized() || signed_transfer.txid.size() != 64) {
    std::cerr << "executed transfer is not finalized\n";
    return false;
  }
  if (store.Read(alice.id).Balance(issued.id) != 750) {
    std::cerr << "payer balance after pay: " << store.Read(alice.id).Balance(issued.id) << "\n";
    return false;
  }

  // Paying the same invoice again is refused at both stages.
  if (!ExpectError("double build", ErrorKind::kInvoiceAlreadyUsed, [&] {
        (void)transfer::CreateTransfer(store, alice.key.Public(), bob_invoice.text, now);
      })) {
    return false;
  }
  if (!ExpectError("double execute", ErrorKind::kInvoiceAlreadyUsed, [&] {
        (void)transfer::Execute(store, alice.key, unsigned_transfer.psbt, now);
      })) {
    return false;
  }
  if (!ExpectError("signed psbt", ErrorKind::kValidation, [&] {
        (void)transfer::Execute(store, alice.key, signed_transfer.psbt, now);
      })) {
    return false;
  }

  const auto armored = signed_transfer.consignment.Armor();
  const auto consignment = transfer::Consignment::Dearmor(armored);

  // The payer disclosing its own change seal gains nothing.
  {
    const auto result = transfer::Accept(store, alice.id, consignment,
                                         unsigned_transfer.fields.change->seal, now);
    if (result.status != transfer::AcceptStatus::kRejected) {
      std::cerr << "payer accepted its own change\n";
      return false;
    }
    const auto ledger = store.Read(alice.id);
    if (ledger.Balance(issued.id) != 750 || ledger.allocations.size() != 2) {
      std::cerr << "self-accept changed the payer ledger: " << ledger.Balance(issued.id) << "\n";
      return false;
    }
  }

  // A consignment whose tip was altered is rejected without side effects.
  {
    auto tampered = consignment;
    tampered.history.back().transition.assignments[0].amount = 300;
    const auto result = transfer::Accept(store, bob.id, tampered, std::nullopt, now);
    if (result.status != transfer::AcceptStatus::kRejected || result.reason.empty()) {
      std::cerr << "inflated consignment accepted\n";
      return false;
    }
    const auto ledger = store.Read(bob.id);
    if (!ledger.allocations.empty() || ledger.invoices.count(bob_invoice.concealed) == 0) {
      std::cerr << "rejected consignment changed the receiver ledger\n";
      return false;
    }
  }

  const auto accepted = transfer::Accept(store, bob.id, consignment, std::nullopt, now);
  if (accepted.status != transfer::AcceptStatus::kAccepted || accepted.amount != 250) {
    std::cerr << "genuine consignment not accepted: " << accepted.reason << "\n";
    return false;
  }
  if (!accepted.outpoint || accepted.outpoint->ToString() != std::string(kBobTxid) + ":1") {
    std::cerr << "accepted allocation is on the wrong outpoint\n";
    return false;
  }
  if (store.Read(bob.id).Balance(issued.id) != 250) {
    std::cerr << "receiver balance after accept is wrong\n";
    return false;
  }

  // Re-accepting is idempotent, with or without the disclosed seal.
  {
    const auto again = transfer::Accept(store, bob.id, consignment, std::nullopt, now);
    const auto disclosed = transfer::Accept(store, bob.id, consignment, bob_seal, now);
    if (again.status != transfer::AcceptStatus::kAlreadyAccepted ||
        disclosed.status != transfer::AcceptStatus::kAlreadyAccepted) {
      std::cerr << "re-accept was not idempotent\n";
      return false;
    }
    if (store.Read(bob.id).Balance(issued.id) != 250) {
      std::cerr << "re-accept credited twice\n";
      return false;
    }
  }

  // A disclosed seal that does not conceal to the assignment is refused even
  // after the transfer was accepted.
  {
    auto wrong = bob_seal;
    wrong.blinding += 1;
    const auto result = transfer::Accept(store, bob.id, consignment, wrong, now);
    if (result.status != transfer::AcceptStatus::kRejected) {
      std::cerr << "tampered seal accepted\n";
      return false;
    }
  }

  // Bob spends part of what he received back to Alice; her replay covers both
  // transitions.
  invoice::InvoiceRequest back;
  back.contract_id = contract_id;
  back.amount = contract::AssetAmount{100};
  back.seal = std::string(kAliceTxid) + ":0";
  const auto alice_invoice = invoice::CreateInvoice(store, alice.id, back);
  const auto bob_unsigned = transfer::CreateTransfer(store, bob.key.Public(), alice_invoice.text, now);
  const auto bob_signed = transfer::Execute(store, bob.key, bob_unsigned.psbt, now);
  if (bob_signed.consignment.history.size() != 2) {
    std::cerr << "second consignment lacks prior history\n";
    return false;
  }
  const auto back_result = transfer::Accept(store, alice.id, bob_signed.consignment, std::nullopt, now);
  if (back_result.status != transfer::AcceptStatus::kAccepted) {
    std::cerr << "return transfer rejected: " << back_result.reason << "\n";
    return false;
  }
  if (store.Read(alice.id).Balance(issued.id) != 850 || store.Read(bob.id).Balance(issued.id) != 150) {
    std::cerr << "balances after return transfer are wrong\n";
    return false;
  }

  // Failure kinds at the build stage.
  {
    invoice::InvoiceRequest large;
    large.contract_id = contract_id;
    large.amount = contract::AssetAmount{500};
    large.seal = std::string(kAliceTxid) + ":3";
    const auto big_invoice = invoice::CreateInvoice(store, alice.id, large);
    if (!ExpectError("insufficient", ErrorKind::kInsufficientFunds, [&] {
          (void)transfer::CreateTransfer(store, bob.key.Public(), big_invoice.text, now);
        })) {
      return false;
    }

    invoice::InvoiceRequest expiring = large;
    expiring.amount = contract::AssetAmount{10};
    expiring.expiry = now + 60;
    const auto short_invoice = invoice::CreateInvoice(store, alice.id, expiring);
    if (!ExpectError("expired", ErrorKind::kInvoiceExpired, [&] {
          (void)transfer::CreateTransfer(store, bob.key.Public(), short_invoice.text, now + 120);
        })) {
      return false;
    }
    if (!ExpectError("unknown contract", ErrorKind::kNotFound, [&] {
          (void)transfer::CreateTransfer(store, mallory.key.Public(), short_invoice.text, now);
        })) {
      return false;
    }
  }

  // Listings and abandon.
  {
    const auto alice_listing = transfer::ListTransfers(store, alice.id);
    if (alice_listing.sent.size() != 1 || alice_listing.received.size() != 1) {
      std::cerr << "alice listing is wrong\n";
      return false;
    }
    transfer::Abandon(store, alice.id, signed_transfer.txid);
    if (!transfer::ListTransfers(store, alice.id).sent.empty()) {
      std::cerr << "abandon did not remove the pending transfer\n";
      return false;
    }
    if (!ExpectError("abandon twice", ErrorKind::kNotFound,
                     [&] { transfer::Abandon(store, alice.id, signed_transfer.txid); })) {
      return false;
    }
  }
  return true;
}

bool RunRepeatedInput() {
  ledger::IdentityStore store;
  const auto alice = MakeParty("1111111111111111111111111111111111111111111111111111111111111111");
  const auto bob = MakeParty("2222222222222222222222222222222222222222222222222222222222222222");
  const std::int64_t now = util::UnixNow();
  const auto id = IssueTo(store, alice, 0, 1000);
  contract::ImportContract(store, bob.id, contract::ExportGenesis(store, alice.id, id));

  const auto small = InvoiceFor(store, bob, id, contract::AssetAmount{100}, 1);
  const auto large = InvoiceFor(store, bob, id, contract::AssetAmount{1500}, 2);
  const auto base = transfer::CreateTransfer(store, alice.key.Public(), small.text, now);
  const auto forged = RepeatFirstInput(base, large.text, 1500, 500);
  if (!ExpectError("repeated input", ErrorKind::kSeal,
                   [&] { (void)transfer::Execute(store, alice.key, forged, now); })) {
    return false;
  }
  const auto ledger = store.Read(alice.id);
  if (ledger.Balance(id) != 1000 || ledger.consumed_invoices.count(large.concealed) != 0 ||
      !ledger.pending_transfers.empty()) {
    std::cerr << "repeated input changed the payer ledger\n";
    return false;
  }
  return true;
}

bool RunMalformedConsignment() {
  const std::string body = R"({"version":"1","genesis":{},"history":[]})";
  return ExpectError("string version", ErrorKind::kValidation,
                     [&] { (void)transfer::Consignment::Dearmor(util::Base64Encode(body)); }) &&
         ExpectError("bad genesis", ErrorKind::kValidation, [&] {
           (void)transfer::Consignment::Dearmor(
               util::Base64Encode(R"({"version":1,"genesis":{"precision":"2"},"history":[{}]})"));
         });
}

// Conservation at both ends of the precision range.
bool RunPrecisionExtremes() {
  const auto alice = MakeParty("1111111111111111111111111111111111111111111111111111111111111111");
  const auto bob = MakeParty("2222222222222222222222222222222222222222222222222222222222222222");
  const std::int64_t now = util::UnixNow();
  struct Case {
    std::uint8_t precision;
    contract::AssetAmount supply;
    std::string amount;
    contract::AssetAmount atomic;
  };
  const contract::AssetAmount top = std::numeric_limits<contract::AssetAmount>::max() - 1;
  const std::vector<Case> cases{
      {0, 5, "3", 3},
      {18, top, "18.000000000000000001", 18000000000000000001ULL},
  };
  for (const auto& c : cases) {
    ledger::IdentityStore store;
    const auto id = IssueTo(store, alice, c.precision, c.supply);
    contract::ImportContract(store, bob.id, contract::ExportGenesis(store, alice.id, id));
    const auto inv = InvoiceFor(store, bob, id, c.amount, 1);
    const auto built = transfer::CreateTransfer(store, alice.key.Public(), inv.text, now);
    if (built.amount != c.atomic || built.change != c.supply - c.atomic) {
      std::cerr << "precision " << int(c.precision) << ": split " << built.amount << "/"
                << built.change << "\n";
      return false;
    }
    const auto paid = transfer::Execute(store, alice.key, built.psbt, now);
    const auto accepted = transfer::Accept(store, bob.id, paid.consignment, std::nullopt, now);
    if (accepted.status != transfer::AcceptStatus::kAccepted) {
      std::cerr << "precision " << int(c.precision) << ": " << accepted.reason << "\n";
      return false;
    }
    const auto alice_balance = store.Read(alice.id).Balance(id);
    const auto bob_balance = store.Read(bob.id).Balance(id);
    if (bob_balance != c.atomic || alice_balance != c.supply - c.atomic) {
      std::cerr << "precision " << int(c.precision) << ": amounts not conserved\n";
      return false;
    }
  }
  return true;
}

// Two payments built from the same snapshot race for one seal.
bool RunConcurrentExecute() {
  ledger::IdentityStore store;
  const auto alice = MakeParty("1111111111111111111111111111111111111111111111111111111111111111");
  const auto bob = MakeParty("2222222222222222222222222222222222222222222222222222222222222222");
  const std::int64_t now = util::UnixNow();
  const auto id = IssueTo(store, alice, 2, 100);
  contract::ImportContract(store, bob.id, contract::ExportGenesis(store, alice.id, id));
  const auto first = InvoiceFor(store, bob, id, contract::AssetAmount{40}, 1);
  const auto second = InvoiceFor(store, bob, id, contract::AssetAmount{30}, 2);
  const auto psbt_a = transfer::CreateTransfer(store, alice.key.Public(), first.text, now).psbt;
  const auto psbt_b = transfer::CreateTransfer(store, alice.key.Public(), second.text, now).psbt;

  std::atomic<int> succeeded{0};
  std::atomic<int> seal_errors{0};
  std::atomic<int> other_errors{0};
  auto pay = [&](const psbt::Psbt& psbt) {
    try {
      (void)transfer::Execute(store, alice.key, psbt, now);
      ++succeeded;
    } catch (const Error& ex) {
      if (ex.kind == ErrorKind::kSeal) {
        ++seal_errors;
      } else {
        ++other_errors;
      }
    }
  };
  std::thread a(pay, std::cref(psbt_a));
  std::thread b(pay, std::cref(psbt_b));
  a.join();
  b.join();
  if (succeeded != 1 || seal_errors != 1 || other_errors != 0) {
    std::cerr << "concurrent execute: " << succeeded << " succeeded, " << seal_errors
              << " seal errors\n";
    return false;
  }
  const auto ledger = store.Read(alice.id);
  if (ledger.pending_transfers.size() != 1 || ledger.consumed_invoices.size() != 1) {
    std::cerr << "concurrent execute committed twice\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunScenario()) {
    return EXIT_FAILURE;
  }
  if (!RunRepeatedInput() || !RunMalformedConsignment() || !RunPrecisionExtremes() ||
      !RunConcurrentExecute()) {
    return EXIT_FAILURE;
  }
  std::cout << "transfer flow tests passed\n";
  return EXIT_SUCCESS;
}
