#include "contract/catalog.hpp"

#include "crypto/hash.hpp"
#include "util/hex.hpp"

namespace sealnode::contract {

const std::vector<InterfaceInfo>& Interfaces() {
  static const std::vector<InterfaceInfo> kInterfaces = {
      InterfaceInfo{
          "RGB20",
          {"spec", "data", "issuedSupply"},
          {"assetOwner"},
          {"transfer"},
      },
  };
  return kInterfaces;
}

const std::vector<SchemaInfo>& Schemas() {
  static const std::vector<SchemaInfo> kSchemas = {
      SchemaInfo{"NIA", "Non-inflatable fungible asset", {"RGB20"}},
  };
  return kSchemas;
}

const InterfaceInfo* FindInterface(std::string_view name) {
  for (const auto& iface : Interfaces()) {
    if (iface.name == name) {
      return &iface;
    }
  }
  return nullptr;
}

const SchemaInfo* SchemaForInterface(std::string_view iface) {
  for (const auto& schema : Schemas()) {
    for (const auto& name : schema.interfaces) {
      if (name == iface) {
        return &schema;
      }
    }
  }
  return nullptr;
}

std::string InterfaceId(const InterfaceInfo& iface) {
  crypto::HashWriter writer;
  writer.Str(iface.name);
  for (const auto& field : iface.global_state) writer.Str(field);
  for (const auto& field : iface.assignments) writer.Str(field);
  for (const auto& field : iface.transitions) writer.Str(field);
  return util::HexEncode(writer.Tagged("sealnode:interface"));
}

std::string SchemaId(const SchemaInfo& schema) {
  crypto::HashWriter writer;
  writer.Str(schema.name).Str(schema.description);
  for (const auto& iface : schema.interfaces) writer.Str(iface);
  return util::HexEncode(writer.Tagged("sealnode:schema"));
}

nlohmann::json InterfacesToJson() {
  auto out = nlohmann::json::array();
  for (const auto& iface : Interfaces()) {
    out.push_back({
        {"name", iface.name},
        {"id", InterfaceId(iface)},
        {"global_state", iface.global_state},
        {"assignments", iface.assignments},
        {"transitions", iface.transitions},
    });
  }
  return out;
}

nlohmann::json SchemasToJson() {
  auto out = nlohmann::json::array();
  for (const auto& schema : Schemas()) {
    out.push_back({
        {"name", schema.name},
        {"id", SchemaId(schema)},
        {"description", schema.description},
        {"interfaces", schema.interfaces},
    });
  }
  return out;
}

}  // namespace sealnode::contract
