#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "contract/issuer.hpp"
#include "core/error.hpp"
#include "crypto/ec_key.hpp"
#include "invoice/builder.hpp"
#include "ledger/identity_store.hpp"
#include "psbt/psbt.hpp"
#include "script/script.hpp"
#include "transfer/builder.hpp"
#include "transfer/psbt_fields.hpp"
#include "util/base64.hpp"
#include "util/time.hpp"

using namespace sealnode;

namespace {

const char* kTxid = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

}  // namespace

int main() {
  // Bare container: proprietary and unknown records survive a round trip.
  {
    primitives::CTransaction tx;
    tx.vin.resize(1);
    tx.vin[0].prevout.index = 3;
    tx.vout.push_back(primitives::CTxOut{0, script::BuildOpReturn(std::vector<std::uint8_t>(32, 7))});
    auto psbt = psbt::Psbt::FromTransaction(tx);
    if (psbt.inputs.size() != 1 || psbt.outputs.size() != 1) {
      std::cerr << "per-input/output maps not sized from the transaction\n";
      return 1;
    }
    psbt::SetProprietary(&psbt.proprietary, 0x42, {1, 2, 3});
    psbt::SetProprietary(&psbt.inputs[0].proprietary, 0x43, {4}, {9, 9});
    psbt.unknown[{0x77}] = {0xAB};

    const auto text = psbt.ToBase64();
    if (text.rfind("cHNidP8", 0) != 0) {
      std::cerr << "PSBT base64 lacks the magic prefix\n";
      return 1;
    }
    std::string error;
    const auto parsed = psbt::Psbt::FromBase64(text, &error);
    if (!parsed) {
      std::cerr << "PSBT did not parse back: " << error << "\n";
      return 1;
    }
    const auto* global = psbt::FindProprietary(parsed->proprietary, 0x42);
    const std::vector<std::uint8_t> key_data = {9, 9};
    const auto* input = psbt::FindProprietary(parsed->inputs[0].proprietary, 0x43, key_data);
    if (!global || *global != std::vector<std::uint8_t>{1, 2, 3} || !input ||
        *input != std::vector<std::uint8_t>{4}) {
      std::cerr << "proprietary records lost\n";
      return 1;
    }
    if (parsed->unknown.size() != 1 || parsed->unknown.begin()->second != std::vector<std::uint8_t>{0xAB}) {
      std::cerr << "unknown global record lost\n";
      return 1;
    }
    if (parsed->unsigned_tx.vin[0].prevout.index != 3 || parsed->IsFinalized()) {
      std::cerr << "unsigned transaction changed\n";
      return 1;
    }
    if (parsed->Serialize() != psbt.Serialize()) {
      std::cerr << "PSBT encoding is not stable\n";
      return 1;
    }
  }

  // Malformed inputs are rejected with a reason.
  {
    std::string error;
    if (psbt::Psbt::FromBase64("not base64!", &error) || error.empty()) {
      std::cerr << "invalid base64 accepted\n";
      return 1;
    }
    error.clear();
    if (psbt::Psbt::FromBase64(util::Base64Encode(std::string_view("psbt\xff")), &error) ||
        error.empty()) {
      std::cerr << "PSBT without a transaction accepted\n";
      return 1;
    }
    error.clear();
    if (psbt::Psbt::FromBase64(util::Base64Encode(std::string_view("nope")), &error) ||
        error.empty()) {
      std::cerr << "PSBT without magic accepted\n";
      return 1;
    }
  }

  // A built transfer carries everything the pay step needs.
  {
    ledger::IdentityStore store;
    const auto payer = crypto::PrivateKey::FromHex(
        "1111111111111111111111111111111111111111111111111111111111111111");
    contract::IssueRequest issue;
    issue.ticker = "USDT";
    issue.name = "Tether";
    issue.precision = 2;
    issue.supply = 1000;
    issue.seal = std::string(kTxid) + ":0";
    const auto issued = contract::Issue(store, payer, issue);

    const std::string receiver = "02466d7fcae563e5cb09a0d1870bb580344804617879a14949cf22285f1bae3f27";
    contract::ImportContract(store, receiver, issued.contract);
    invoice::InvoiceRequest request;
    request.contract_id = contract::ContractIdToString(issued.id);
    request.amount = contract::AssetAmount{250};
    request.seal = std::string(kTxid) + ":5";
    const auto inv = invoice::CreateInvoice(store, receiver, request);

    const auto built = transfer::CreateTransfer(store, payer.Public(), inv.text, util::UnixNow());
    if (built.change != 750 || built.amount != 250) {
      std::cerr << "unexpected change split\n";
      return 1;
    }
    const auto& tx = built.psbt.unsigned_tx;
    if (tx.vin.size() != 1 || tx.vout.size() != 2) {
      std::cerr << "witness transaction layout is wrong\n";
      return 1;
    }
    const auto commitment = script::ExtractOpReturnPayload(tx.vout[transfer::kCommitmentVout].script_pubkey);
    if (!commitment || *commitment != std::vector<std::uint8_t>(built.transition_id.begin(),
                                                                built.transition_id.end())) {
      std::cerr << "OP_RETURN does not commit to the transition\n";
      return 1;
    }
    if (tx.vout[transfer::kChangeVout].value != primitives::kDustLimit) {
      std::cerr << "change output is not dust-sized\n";
      return 1;
    }

    std::string error;
    const auto reparsed = psbt::Psbt::FromBase64(built.psbt.ToBase64(), &error);
    if (!reparsed) {
      std::cerr << "built PSBT did not parse: " << error << "\n";
      return 1;
    }
    const auto fields = transfer::ExtractTransferFields(*reparsed);
    if (fields.transition.Id() != built.transition_id || fields.invoice != inv.text ||
        fields.inputs.size() != 1 || !fields.change || fields.change->amount != 750 ||
        fields.inputs[0].owner != payer.Public()) {
      std::cerr << "transfer fields did not survive the PSBT\n";
      return 1;
    }

    try {
      (void)transfer::ExtractTransferFields(psbt::Psbt::FromTransaction(tx));
      std::cerr << "PSBT without transfer records accepted\n";
      return 1;
    } catch (const Error& ex) {
      if (ex.kind != ErrorKind::kValidation) {
        std::cerr << "missing transfer records: wrong error kind\n";
        return 1;
      }
    }
  }

  std::cout << "psbt tests passed\n";
  return 0;
}
