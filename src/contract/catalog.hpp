#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "nlohmann/json.hpp"

namespace sealnode::contract {

struct InterfaceInfo {
  std::string name;
  std::vector<std::string> global_state;
  std::vector<std::string> assignments;
  std::vector<std::string> transitions;
};

struct SchemaInfo {
  std::string name;
  std::string description;
  std::vector<std::string> interfaces;
};

// Built-in registry. Entries are sorted by name.
const std::vector<InterfaceInfo>& Interfaces();
const std::vector<SchemaInfo>& Schemas();

const InterfaceInfo* FindInterface(std::string_view name);
// The schema implementing `iface`, or nullptr.
const SchemaInfo* SchemaForInterface(std::string_view iface);

// Content-derived identifier shown to clients (hex of a tagged hash).
std::string InterfaceId(const InterfaceInfo& iface);
std::string SchemaId(const SchemaInfo& schema);

nlohmann::json InterfacesToJson();
nlohmann::json SchemasToJson();

}  // namespace sealnode::contract
