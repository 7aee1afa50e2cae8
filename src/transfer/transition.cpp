#include "transfer/transition.hpp"

#include <type_traits>

#include "core/error.hpp"
#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "util/hex.hpp"

namespace sealnode::transfer {

namespace {

nlohmann::json SealToJson(const seal::SealDefinition& def) {
  return std::visit(
      [](const auto& s) -> nlohmann::json {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, seal::RevealedSeal>) {
          return {{"revealed", s.ToString()}};
        } else {
          return {{"concealed", s.ToString()}};
        }
      },
      def);
}

seal::SealDefinition SealFromJson(const nlohmann::json& json) {
  if (json.contains("revealed")) {
    return seal::RevealedSeal::Parse(json.at("revealed").get<std::string>());
  }
  return seal::ConcealedSeal::Parse(json.at("concealed").get<std::string>());
}

OpId ParseOpId(const std::string& hex) {
  OpId id{};
  if (!util::HexDecodeFixed(hex, id)) {
    ThrowError(ErrorKind::kValidation, "invalid operation id");
  }
  return id;
}

}  // namespace

OpId StateTransition::Id() const {
  crypto::HashWriter writer;
  writer.Fixed(contract_id);
  writer.U32(static_cast<std::uint32_t>(inputs.size()));
  for (const auto& in : inputs) {
    writer.Fixed(in.op).U16(in.index);
  }
  writer.U32(static_cast<std::uint32_t>(assignments.size()));
  for (const auto& assignment : assignments) {
    writer.Fixed(seal::Conceal(assignment.seal).digest).U64(assignment.amount);
  }
  return writer.Tagged("sealnode:transition");
}

StateTransition StateTransition::Concealed() const {
  StateTransition out = *this;
  for (auto& assignment : out.assignments) {
    assignment.seal = seal::ConcealDefinition(assignment.seal);
  }
  return out;
}

nlohmann::json OpoutToJson(const Opout& opout) {
  return {{"op", util::HexEncode(opout.op)}, {"index", opout.index}};
}

Opout OpoutFromJson(const nlohmann::json& json) {
  Opout out;
  out.op = ParseOpId(json.at("op").get<std::string>());
  out.index = json.at("index").get<std::uint16_t>();
  return out;
}

nlohmann::json TransitionToJson(const StateTransition& transition) {
  nlohmann::json inputs = nlohmann::json::array();
  for (const auto& in : transition.inputs) inputs.push_back(OpoutToJson(in));
  nlohmann::json assignments = nlohmann::json::array();
  for (const auto& assignment : transition.assignments) {
    auto entry = SealToJson(assignment.seal);
    entry["amount"] = assignment.amount;
    assignments.push_back(std::move(entry));
  }
  return {
      {"contract_id", contract::ContractIdToString(transition.contract_id)},
      {"inputs", std::move(inputs)},
      {"assignments", std::move(assignments)},
  };
}

StateTransition TransitionFromJson(const nlohmann::json& json) {
  try {
    StateTransition transition;
    transition.contract_id = contract::ParseContractId(json.at("contract_id").get<std::string>());
    for (const auto& in : json.at("inputs")) {
      transition.inputs.push_back(OpoutFromJson(in));
    }
    for (const auto& entry : json.at("assignments")) {
      transition.assignments.push_back(
          Assignment{SealFromJson(entry), entry.at("amount").get<contract::AssetAmount>()});
    }
    return transition;
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kValidation, std::string("malformed state transition: ") + ex.what());
  }
}

nlohmann::json RecordToJson(const TransitionRecord& record) {
  nlohmann::json closed = nlohmann::json::array();
  for (const auto& s : record.closed_seals) closed.push_back(s.ToString());
  return {
      {"transition", TransitionToJson(record.transition)},
      {"witness", TransactionToHex(record.witness)},
      {"closed_seals", std::move(closed)},
  };
}

TransitionRecord RecordFromJson(const nlohmann::json& json) {
  try {
    TransitionRecord record;
    record.transition = TransitionFromJson(json.at("transition"));
    record.witness = TransactionFromHex(json.at("witness").get<std::string>());
    for (const auto& s : json.at("closed_seals")) {
      record.closed_seals.push_back(seal::RevealedSeal::Parse(s.get<std::string>()));
    }
    return record;
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kValidation, std::string("malformed transition record: ") + ex.what());
  }
}

std::string TransactionToHex(const primitives::CTransaction& tx) {
  std::vector<std::uint8_t> bytes;
  primitives::serialize::SerializeTransaction(tx, &bytes);
  return util::HexEncode(bytes);
}

primitives::CTransaction TransactionFromHex(std::string_view hex) {
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(hex, &bytes)) {
    ThrowError(ErrorKind::kValidation, "witness transaction is not hex");
  }
  primitives::CTransaction tx;
  std::size_t offset = 0;
  if (!primitives::serialize::DeserializeTransaction(bytes, &offset, &tx) ||
      offset != bytes.size()) {
    ThrowError(ErrorKind::kValidation, "malformed witness transaction");
  }
  return tx;
}

}  // namespace sealnode::transfer
