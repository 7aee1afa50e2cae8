#include "transfer/consignment.hpp"

#include "core/error.hpp"
#include "util/base64.hpp"

namespace sealnode::transfer {

nlohmann::json Consignment::ToJson() const {
  nlohmann::json records = nlohmann::json::array();
  for (const auto& record : history) {
    records.push_back(RecordToJson(record));
  }
  return {
      {"version", 1},
      {"genesis", contract::ContractToJson(genesis)},
      {"history", std::move(records)},
  };
}

Consignment Consignment::FromJson(const nlohmann::json& json) {
  try {
    if (!json.is_object() || !json.contains("version") || !json.at("version").is_number_integer() ||
        json.at("version").get<std::int64_t>() != 1) {
      ThrowError(ErrorKind::kValidation, "unsupported consignment version");
    }
    if (!json.contains("genesis") || !json.contains("history") || !json.at("history").is_array()) {
      ThrowError(ErrorKind::kValidation, "consignment lacks genesis or history");
    }
    Consignment consignment;
    consignment.genesis = contract::ContractFromJson(json.at("genesis"));
    for (const auto& record : json.at("history")) {
      consignment.history.push_back(RecordFromJson(record));
    }
    if (consignment.history.empty()) {
      ThrowError(ErrorKind::kValidation, "consignment carries no transition");
    }
    return consignment;
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kValidation, std::string("malformed consignment: ") + ex.what());
  }
}

std::string Consignment::Armor() const { return util::Base64Encode(ToJson().dump()); }

Consignment Consignment::Dearmor(std::string_view text) {
  const auto decoded = util::Base64DecodeToString(text);
  if (!decoded) {
    ThrowError(ErrorKind::kValidation, "consignment is not base64");
  }
  auto json = nlohmann::json::parse(*decoded, nullptr, false);
  if (json.is_discarded()) {
    ThrowError(ErrorKind::kValidation, "consignment is not JSON");
  }
  return FromJson(json);
}

}  // namespace sealnode::transfer
