#include <cstdint>
#include <iostream>
#include <set>
#include <string>

#include "core/error.hpp"
#include "seal/blinder.hpp"
#include "seal/seal.hpp"

using namespace sealnode;

namespace {

const char* kTxid = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";

bool ExpectSealError(const char* label, const std::string& text) {
  try {
    (void)seal::RevealedSeal::Parse(text);
  } catch (const Error& ex) {
    if (ex.kind == ErrorKind::kSeal) {
      return true;
    }
    std::cerr << label << ": wrong error kind " << ErrorKindName(ex.kind) << "\n";
    return false;
  }
  std::cerr << label << ": accepted malformed seal '" << text << "'\n";
  return false;
}

}  // namespace

int main() {
  const auto outpoint = seal::Outpoint::Parse(std::string(kTxid) + ":1");
  if (outpoint.ToString() != std::string(kTxid) + ":1") {
    std::cerr << "outpoint text form not preserved: " << outpoint.ToString() << "\n";
    return 1;
  }

  // Fresh blinding every time: the same outpoint never conceals the same way.
  {
    std::set<std::string> seen;
    for (int i = 0; i < 32; ++i) {
      const auto blinded = seal::Blind(outpoint, seal::CloseMethod::kTapretFirst);
      if (blinded.revealed.Conceal() != blinded.concealed) {
        std::cerr << "concealed form does not match revealed seal\n";
        return 1;
      }
      seen.insert(blinded.concealed.ToString());
    }
    if (seen.size() != 32) {
      std::cerr << "blinding repeated a concealed seal\n";
      return 1;
    }
  }

  // Concealment is deterministic for a fixed factor and sensitive to every field.
  {
    const auto a = seal::BlindWithFactor(outpoint, seal::CloseMethod::kTapretFirst, 42);
    const auto b = seal::BlindWithFactor(outpoint, seal::CloseMethod::kTapretFirst, 42);
    const auto other_method = seal::BlindWithFactor(outpoint, seal::CloseMethod::kOpretFirst, 42);
    const auto other_factor = seal::BlindWithFactor(outpoint, seal::CloseMethod::kTapretFirst, 43);
    if (a.concealed != b.concealed) {
      std::cerr << "same factor produced different concealed seals\n";
      return 1;
    }
    if (a.concealed == other_method.concealed || a.concealed == other_factor.concealed) {
      std::cerr << "concealed seal ignores method or blinding\n";
      return 1;
    }
    const auto text = a.concealed.ToString();
    if (text.rfind("utxob1", 0) != 0) {
      std::cerr << "concealed seal lacks utxob prefix: " << text << "\n";
      return 1;
    }
    if (seal::ConcealedSeal::Parse(text) != a.concealed) {
      std::cerr << "concealed seal text did not parse back\n";
      return 1;
    }
    if (seal::RevealedSeal::Parse(a.revealed.ToString()) != a.revealed) {
      std::cerr << "revealed seal text did not parse back\n";
      return 1;
    }
  }

  // Derived blinding is reproducible and separated by purpose and secret.
  {
    const std::uint8_t secret_a[32] = {1};
    const std::uint8_t secret_b[32] = {2};
    const auto first = seal::DeriveBlinding(secret_a, outpoint, seal::CloseMethod::kTapretFirst, "genesis");
    const auto again = seal::DeriveBlinding(secret_a, outpoint, seal::CloseMethod::kTapretFirst, "genesis");
    const auto change = seal::DeriveBlinding(secret_a, outpoint, seal::CloseMethod::kTapretFirst, "change");
    const auto other = seal::DeriveBlinding(secret_b, outpoint, seal::CloseMethod::kTapretFirst, "genesis");
    if (first != again || first == change || first == other) {
      std::cerr << "derived blinding is not purpose/secret separated\n";
      return 1;
    }
  }

  // Witness seals resolve against the closing transaction only.
  {
    seal::RevealedSeal witness;
    witness.vout = 1;
    witness.blinding = 7;
    if (!witness.IsWitness()) {
      std::cerr << "seal without txid not treated as witness seal\n";
      return 1;
    }
    try {
      (void)witness.ToOutpoint();
      std::cerr << "witness seal produced an outpoint without a txid\n";
      return 1;
    } catch (const Error& ex) {
      if (ex.kind != ErrorKind::kSeal) {
        std::cerr << "witness ToOutpoint: wrong error kind\n";
        return 1;
      }
    }
    const auto resolved = witness.Resolve(outpoint.txid);
    if (resolved.txid != outpoint.txid || resolved.vout != 1) {
      std::cerr << "witness seal resolved to the wrong outpoint\n";
      return 1;
    }
    if (seal::RevealedSeal::Parse(witness.ToString()) != witness) {
      std::cerr << "witness seal text did not parse back\n";
      return 1;
    }
  }

  // Boundary descriptor defaults to tapret1st and keeps an explicit blinding.
  {
    const auto plain = seal::ParseSealDescriptor(std::string(kTxid) + ":0");
    if (plain.method != seal::CloseMethod::kTapretFirst || plain.blinding) {
      std::cerr << "plain descriptor parsed incorrectly\n";
      return 1;
    }
    const auto full = seal::ParseSealDescriptor("opret1st:" + std::string(kTxid) + ":3#99");
    if (full.method != seal::CloseMethod::kOpretFirst || full.outpoint.vout != 3 ||
        !full.blinding || *full.blinding != 99) {
      std::cerr << "full descriptor parsed incorrectly\n";
      return 1;
    }
  }

  if (!ExpectSealError("missing blinding", "tapret1st:" + std::string(kTxid) + ":0")) return 1;
  if (!ExpectSealError("bad method", "nomethod:" + std::string(kTxid) + ":0#1")) return 1;
  if (!ExpectSealError("short txid", "tapret1st:abcd:0#1")) return 1;
  if (!ExpectSealError("bad vout", "tapret1st:" + std::string(kTxid) + ":x#1")) return 1;

  std::cout << "seal blinding tests passed\n";
  return 0;
}
