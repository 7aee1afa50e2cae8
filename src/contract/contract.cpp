#include "contract/contract.hpp"

#include <algorithm>

#include "core/error.hpp"
#include "crypto/bech32.hpp"
#include "crypto/hash.hpp"

namespace sealnode::contract {

namespace {

constexpr std::string_view kContractHrp = "rgb";

}  // namespace

std::string ContractIdToString(const ContractId& id) { return crypto::EncodeBech32m(kContractHrp, id); }

ContractId ParseContractId(std::string_view text) {
  const auto payload = crypto::DecodeBech32m(text, kContractHrp);
  if (!payload || payload->size() != 32) {
    ThrowError(ErrorKind::kValidation, "invalid contract id '" + std::string(text) + "'");
  }
  ContractId id{};
  std::copy(payload->begin(), payload->end(), id.begin());
  return id;
}

ContractId Contract::Id() const {
  crypto::HashWriter writer;
  writer.Str(schema)
      .Str(iface)
      .Str(ticker)
      .Str(name)
      .Str(description)
      .U8(precision)
      .U64(supply)
      .Fixed(genesis_seal.Conceal().digest)
      .Str(issuer);
  return writer.Tagged("sealnode:contract:genesis");
}

nlohmann::json ContractToJson(const Contract& contract) {
  return nlohmann::json{
      {"contract_id", ContractIdToString(contract.Id())},
      {"ticker", contract.ticker},
      {"name", contract.name},
      {"description", contract.description},
      {"precision", contract.precision},
      {"supply", contract.supply},
      {"genesis_seal", contract.genesis_seal.ToString()},
      {"iface", contract.iface},
      {"schema", contract.schema},
      {"issuer", contract.issuer},
      {"created_at", contract.created_at},
  };
}

Contract ContractFromJson(const nlohmann::json& json) {
  try {
    Contract contract;
    contract.ticker = json.at("ticker").get<std::string>();
    contract.name = json.at("name").get<std::string>();
    contract.description = json.value("description", std::string());
    const auto precision = json.at("precision").get<std::int64_t>();
    if (!json.at("precision").is_number_integer() || precision < 0 || precision > kMaxPrecision) {
      ThrowError(ErrorKind::kValidation, "precision must be between 0 and 18");
    }
    contract.precision = static_cast<std::uint8_t>(precision);
    if (!json.at("supply").is_number_unsigned()) {
      ThrowError(ErrorKind::kValidation, "supply must be a non-negative integer");
    }
    contract.supply = json.at("supply").get<AssetAmount>();
    contract.genesis_seal = seal::RevealedSeal::Parse(json.at("genesis_seal").get<std::string>());
    contract.iface = json.at("iface").get<std::string>();
    contract.schema = json.at("schema").get<std::string>();
    contract.issuer = json.at("issuer").get<std::string>();
    contract.created_at = json.value("created_at", std::int64_t{0});
    if (json.contains("contract_id") &&
        json.at("contract_id").get<std::string>() != ContractIdToString(contract.Id())) {
      ThrowError(ErrorKind::kValidation, "contract id does not match genesis fields");
    }
    return contract;
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kValidation, std::string("malformed contract genesis: ") + ex.what());
  }
}

}  // namespace sealnode::contract
