#include "transfer/psbt_fields.hpp"

#include <algorithm>

#include "core/error.hpp"

namespace sealnode::transfer {

namespace {

psbt::Bytes ToBytes(std::string_view text) { return psbt::Bytes(text.begin(), text.end()); }

std::string ToText(const psbt::Bytes& bytes) { return std::string(bytes.begin(), bytes.end()); }

const psbt::Bytes& Require(const std::map<psbt::ProprietaryKey, psbt::Bytes>& map,
                           std::uint64_t subtype, const char* what) {
  const auto* value = psbt::FindProprietary(map, subtype);
  if (value == nullptr) {
    ThrowError(ErrorKind::kValidation, std::string("psbt is missing ") + what);
  }
  return *value;
}

psbt::Bytes EncodeOpout(const Opout& opout) {
  psbt::Bytes out(opout.op.begin(), opout.op.end());
  out.push_back(static_cast<std::uint8_t>(opout.index & 0xff));
  out.push_back(static_cast<std::uint8_t>(opout.index >> 8));
  return out;
}

Opout DecodeOpout(const psbt::Bytes& bytes) {
  if (bytes.size() != 34) {
    ThrowError(ErrorKind::kValidation, "psbt input carries a malformed opout");
  }
  Opout opout;
  std::copy(bytes.begin(), bytes.begin() + 32, opout.op.begin());
  opout.index = static_cast<std::uint16_t>(bytes[32] | (bytes[33] << 8));
  return opout;
}

}  // namespace

void EmbedTransferFields(const TransferFields& fields, psbt::Psbt* psbt) {
  psbt::SetProprietary(&psbt->proprietary, kPsbtTransition,
                       ToBytes(TransitionToJson(fields.transition.Concealed()).dump()));
  psbt::SetProprietary(&psbt->proprietary, kPsbtInvoice, ToBytes(fields.invoice));
  psbt::SetProprietary(
      &psbt->proprietary, kPsbtContract,
      psbt::Bytes(fields.transition.contract_id.begin(), fields.transition.contract_id.end()));

  for (std::size_t i = 0; i < fields.inputs.size() && i < psbt->inputs.size(); ++i) {
    auto& in = psbt->inputs[i];
    const auto& closed = fields.inputs[i];
    psbt::SetProprietary(&in.proprietary, kPsbtInputSeal, ToBytes(closed.seal.ToString()));
    psbt::SetProprietary(&in.proprietary, kPsbtInputOpout, EncodeOpout(closed.opout));
    const auto& owner = closed.owner.Compressed();
    psbt::SetProprietary(&in.proprietary, kPsbtInputOwner, psbt::Bytes(owner.begin(), owner.end()));
  }
  if (fields.change && psbt->outputs.size() > kChangeVout) {
    const nlohmann::json change = {{"seal", fields.change->seal.ToString()},
                                   {"amount", fields.change->amount}};
    psbt::SetProprietary(&psbt->outputs[kChangeVout].proprietary, kPsbtOutputChange,
                         ToBytes(change.dump()));
  }
}

TransferFields ExtractTransferFields(const psbt::Psbt& psbt) {
  TransferFields fields;
  const auto transition_json =
      nlohmann::json::parse(ToText(Require(psbt.proprietary, kPsbtTransition, "state transition")),
                            nullptr, false);
  if (transition_json.is_discarded()) {
    ThrowError(ErrorKind::kValidation, "psbt state transition is not JSON");
  }
  fields.transition = TransitionFromJson(transition_json);
  fields.invoice = ToText(Require(psbt.proprietary, kPsbtInvoice, "invoice"));

  const auto& contract = Require(psbt.proprietary, kPsbtContract, "contract id");
  if (contract.size() != 32 ||
      !std::equal(contract.begin(), contract.end(), fields.transition.contract_id.begin())) {
    ThrowError(ErrorKind::kValidation, "psbt contract id does not match its transition");
  }

  for (const auto& in : psbt.inputs) {
    ClosedInput closed{
        seal::RevealedSeal::Parse(ToText(Require(in.proprietary, kPsbtInputSeal, "input seal"))),
        DecodeOpout(Require(in.proprietary, kPsbtInputOpout, "input opout")),
        crypto::PublicKey::FromBytes(Require(in.proprietary, kPsbtInputOwner, "input owner")),
    };
    fields.inputs.push_back(std::move(closed));
  }

  if (psbt.outputs.size() > kChangeVout) {
    if (const auto* raw = psbt::FindProprietary(psbt.outputs[kChangeVout].proprietary,
                                                kPsbtOutputChange)) {
      const auto change = nlohmann::json::parse(ToText(*raw), nullptr, false);
      if (change.is_discarded() || !change.contains("seal") || !change.contains("amount")) {
        ThrowError(ErrorKind::kValidation, "psbt change record is malformed");
      }
      try {
        fields.change = ChangeOutput{seal::RevealedSeal::Parse(change.at("seal").get<std::string>()),
                                     change.at("amount").get<contract::AssetAmount>()};
      } catch (const nlohmann::json::exception& ex) {
        ThrowError(ErrorKind::kValidation, std::string("psbt change record: ") + ex.what());
      }
    }
  }
  return fields;
}

}  // namespace sealnode::transfer
