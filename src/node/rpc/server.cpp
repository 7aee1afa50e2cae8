#include "rpc/server.hpp"

#include <charconv>
#include <stdexcept>

#include "config/network.hpp"
#include "contract/catalog.hpp"
#include "contract/issuer.hpp"
#include "crypto/bech32.hpp"
#include "crypto/ec_key.hpp"
#include "crypto/hash.hpp"
#include "invoice/builder.hpp"
#include "transfer/acceptor.hpp"
#include "transfer/builder.hpp"
#include "transfer/executor.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace sealnode::rpc {

namespace {

using nlohmann::json;

// Transport-level failures that have no core error kind.
struct HttpError : public std::runtime_error {
  int status;
  std::string kind;
  HttpError(int s, std::string k, const std::string& msg)
      : std::runtime_error(msg), status(s), kind(std::move(k)) {}
};

[[noreturn]] void ThrowHttpError(int status, std::string kind, const std::string& msg) {
  throw HttpError(status, std::move(kind), msg);
}

HttpResponse JsonResponse(int status, const json& body) {
  return HttpResponse{status, "application/json", body.dump()};
}

HttpResponse ErrorResponse(int status, std::string_view kind, std::string_view message) {
  return JsonResponse(status, json{{"error", {{"kind", std::string(kind)}, {"message", std::string(message)}}}});
}

std::vector<std::string_view> SplitPath(std::string_view path) {
  std::vector<std::string_view> parts;
  while (!path.empty()) {
    if (path.front() == '/') {
      path.remove_prefix(1);
      continue;
    }
    const auto slash = path.find('/');
    parts.push_back(path.substr(0, slash));
    if (slash == std::string_view::npos) break;
    path.remove_prefix(slash);
  }
  return parts;
}

json ParseBody(const HttpRequest& request) {
  auto body = json::parse(request.body, nullptr, false);
  if (body.is_discarded() || !body.is_object()) {
    ThrowError(ErrorKind::kValidation, "request body must be a JSON object");
  }
  return body;
}

std::string RequireString(const json& body, const char* field) {
  if (!body.contains(field) || !body.at(field).is_string()) {
    ThrowError(ErrorKind::kValidation, std::string("missing string field '") + field + "'");
  }
  return body.at(field).get<std::string>();
}

std::string OptionalString(const json& body, const char* field, std::string fallback) {
  if (!body.contains(field) || body.at(field).is_null()) return fallback;
  if (!body.at(field).is_string()) {
    ThrowError(ErrorKind::kValidation, std::string("field '") + field + "' must be a string");
  }
  return body.at(field).get<std::string>();
}

// Unsigned integer given as a JSON number or a string of digits.
std::uint64_t RequireUnsigned(const json& body, const char* field) {
  if (body.contains(field)) {
    const auto& value = body.at(field);
    if (value.is_number_unsigned()) {
      return value.get<std::uint64_t>();
    }
    if (value.is_string()) {
      const auto text = value.get<std::string>();
      std::uint64_t out = 0;
      const auto* end = text.data() + text.size();
      auto [ptr, ec] = std::from_chars(text.data(), end, out);
      if (!text.empty() && ec == std::errc() && ptr == end) {
        return out;
      }
    }
  }
  ThrowError(ErrorKind::kValidation, std::string("field '") + field +
                                         "' must be a non-negative integer");
}

std::optional<std::int64_t> OptionalTimestamp(const json& body, const char* field) {
  if (!body.contains(field) || body.at(field).is_null()) return std::nullopt;
  if (!body.at(field).is_number_integer()) {
    ThrowError(ErrorKind::kValidation, std::string("field '") + field + "' must be an integer");
  }
  return body.at(field).get<std::int64_t>();
}

json SummaryToJson(const contract::ContractSummary& summary) {
  auto out = contract::ContractToJson(summary.contract);
  out["balance"] = summary.balance;
  out["balance_formatted"] = contract::FormatAmount(summary.balance, summary.contract.precision);
  return out;
}

std::string SharedSecretHex(const crypto::PrivateKey& key, std::string_view public_key) {
  const auto secret = crypto::DeriveSharedSecret(key, crypto::PublicKey::FromHex(public_key));
  return util::HexEncode(secret);
}

}  // namespace

int StatusForError(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kValidation:
    case ErrorKind::kInvalidKey:
      return 400;
    case ErrorKind::kSigning:
      return 403;
    case ErrorKind::kNotFound:
      return 404;
    case ErrorKind::kInvoiceAlreadyUsed:
      return 409;
    case ErrorKind::kInvoiceExpired:
      return 410;
    case ErrorKind::kInsufficientFunds:
    case ErrorKind::kSeal:
    case ErrorKind::kRejectedTransfer:
      return 422;
    case ErrorKind::kStorage:
      return 500;
  }
  return 500;
}

RpcServer::RpcServer(ledger::IdentityStore& store, storage::BlobStore& blobs,
                     const identity::CredentialProvider* server_identity)
    : store_(store), blobs_(blobs), server_identity_(server_identity) {}

HttpResponse RpcServer::Handle(const HttpRequest& request) {
  const auto parts = SplitPath(request.path);
  const bool get = request.method == "GET";
  const bool post = request.method == "POST";
  try {
    if (parts.size() == 1) {
      const auto route = parts[0];
      if (post && route == "issue") return JsonResponse(200, HandleIssue(request));
      if (post && route == "invoice") return JsonResponse(200, HandleInvoice(request));
      if (post && route == "psbt") return JsonResponse(200, HandlePsbt(request));
      if (post && route == "pay") return JsonResponse(200, HandlePay(request));
      if (post && route == "accept") return HandleAccept(request);
      if (post && route == "import") return JsonResponse(200, HandleImport(request));
      if (post && route == "abandon") return JsonResponse(200, HandleAbandon(request));
      if (post && route == "derive") return JsonResponse(200, HandleDerive(request));
      if (get && route == "transfers") return JsonResponse(200, HandleListTransfers(request));
      if (get && route == "contracts") return JsonResponse(200, HandleListContracts(request));
      if (get && route == "interfaces") {
        return JsonResponse(200, json{{"interfaces", contract::InterfacesToJson()}});
      }
      if (get && route == "schemas") {
        return JsonResponse(200, json{{"schemas", contract::SchemasToJson()}});
      }
      if (get && route == "health") return JsonResponse(200, HandleHealth());
    } else if (parts.size() == 2 && get && parts[0] == "key") {
      return JsonResponse(200, HandleServerKey(parts[1]));
    } else if (parts.size() == 3 && get && parts[0] == "contracts" && parts[2] == "genesis") {
      return JsonResponse(200, HandleExportGenesis(request, parts[1]));
    } else if (parts.size() == 3 && parts[0] == "carbonado") {
      if (post) return JsonResponse(200, HandleBlobPut(request, parts[1], parts[2]));
      if (get) return HandleBlobGet(parts[1], parts[2]);
    }
    return ErrorResponse(404, "not_found", "no route for " + request.method + " " + request.path);
  } catch (const Error& ex) {
    const int status = StatusForError(ex.kind);
    if (status >= 500) {
      util::LogError("rpc", request.method + " " + request.path + ": " + ex.what());
      return ErrorResponse(status, ErrorKindName(ex.kind), "storage failure");
    }
    util::LogDebug("rpc: " + request.method + " " + request.path + " -> " +
                   std::string(ErrorKindName(ex.kind)));
    return ErrorResponse(status, ErrorKindName(ex.kind), ex.what());
  } catch (const HttpError& ex) {
    return ErrorResponse(ex.status, ex.kind, ex.what());
  }
}

identity::Credentials RpcServer::Authenticate(const HttpRequest& request) const {
  const auto header = request.Header("authorization");
  constexpr std::string_view kBearer = "Bearer ";
  if (header.size() <= kBearer.size() || header.compare(0, kBearer.size(), kBearer) != 0) {
    ThrowHttpError(401, "unauthenticated", "missing bearer key");
  }
  try {
    return identity::RequestCredentials(std::string_view(header).substr(kBearer.size())).Acquire();
  } catch (const Error&) {
    // The token is key material; never echo it.
    ThrowError(ErrorKind::kInvalidKey, "bearer token is not a valid private key");
  }
}

json RpcServer::HandleIssue(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  contract::IssueRequest issue;
  issue.ticker = RequireString(body, "ticker");
  issue.name = RequireString(body, "name");
  issue.description = OptionalString(body, "description", "");
  if (!body.contains("precision") || !body.at("precision").is_number_integer()) {
    ThrowError(ErrorKind::kValidation, "field 'precision' must be an integer");
  }
  issue.precision = body.at("precision").get<std::int64_t>();
  issue.supply = RequireUnsigned(body, "supply");
  issue.seal = RequireString(body, "seal");
  issue.iface = OptionalString(body, "iface", "RGB20");

  const auto result = contract::Issue(store_, creds.key, issue);
  return {
      {"contract_id", contract::ContractIdToString(result.id)},
      {"created", result.created},
      {"contract", contract::ContractToJson(result.contract)},
  };
}

json RpcServer::HandleInvoice(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  invoice::InvoiceRequest req;
  req.contract_id = RequireString(body, "contract_id");
  req.iface = OptionalString(body, "iface", "RGB20");
  req.seal = RequireString(body, "seal");
  req.expiry = OptionalTimestamp(body, "expiry");
  if (body.contains("amount") && body.at("amount").is_string()) {
    req.amount = body.at("amount").get<std::string>();
  } else {
    req.amount = RequireUnsigned(body, "amount");
  }
  const auto result = invoice::CreateInvoice(store_, creds.public_key, req);
  json out = {
      {"invoice", result.text},
      {"concealed_seal", result.concealed.ToString()},
      {"amount", result.invoice.amount},
  };
  if (result.invoice.expiry) out["expiry"] = *result.invoice.expiry;
  return out;
}

json RpcServer::HandlePsbt(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  const auto payer = creds.key.Public();
  const auto unsigned_transfer =
      transfer::CreateTransfer(store_, payer, RequireString(body, "invoice"), util::UnixNow());
  json out = {
      {"psbt", unsigned_transfer.psbt.ToBase64()},
      {"transition_id", util::HexEncode(unsigned_transfer.transition_id)},
      {"amount", unsigned_transfer.amount},
      {"change", unsigned_transfer.change},
      {"inputs", unsigned_transfer.fields.inputs.size()},
  };
  if (unsigned_transfer.change > 0) {
    const auto xonly = payer.XOnly();
    out["change_address"] =
        crypto::EncodeSegwitAddress(config::GetNetworkConfig().bech32_hrp, 1, xonly);
  }
  return out;
}

json RpcServer::HandlePay(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  std::string error;
  const auto psbt = psbt::Psbt::FromBase64(RequireString(body, "psbt"), &error);
  if (!psbt) {
    ThrowError(ErrorKind::kValidation, "invalid psbt: " + error);
  }
  const auto signed_transfer = transfer::Execute(store_, creds.key, *psbt, util::UnixNow());
  return {
      {"txid", signed_transfer.txid},
      {"psbt", signed_transfer.psbt.ToBase64()},
      {"consignment", signed_transfer.consignment.Armor()},
      {"transition_id", util::HexEncode(signed_transfer.transition_id)},
  };
}

HttpResponse RpcServer::HandleAccept(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  const auto consignment = transfer::Consignment::Dearmor(RequireString(body, "consignment"));
  std::optional<seal::RevealedSeal> disclosed;
  if (body.contains("seal") && !body.at("seal").is_null()) {
    disclosed = seal::RevealedSeal::Parse(RequireString(body, "seal"));
  }
  const auto result =
      transfer::Accept(store_, creds.public_key, consignment, disclosed, util::UnixNow());
  if (result.status == transfer::AcceptStatus::kRejected) {
    return ErrorResponse(StatusForError(ErrorKind::kRejectedTransfer),
                         ErrorKindName(ErrorKind::kRejectedTransfer), result.reason);
  }
  json out = {
      {"status", std::string(transfer::AcceptStatusName(result.status))},
      {"transition_id", util::HexEncode(result.transition_id)},
      {"contract_id", contract::ContractIdToString(result.contract_id)},
      {"amount", result.amount},
  };
  if (result.outpoint) out["outpoint"] = result.outpoint->ToString();
  return JsonResponse(200, out);
}

json RpcServer::HandleImport(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  const auto genesis = contract::ContractFromJson(body.contains("genesis") ? body.at("genesis") : body);
  const bool imported = contract::ImportContract(store_, creds.public_key, genesis);
  return {{"contract_id", contract::ContractIdToString(genesis.Id())}, {"imported", imported}};
}

json RpcServer::HandleExportGenesis(const HttpRequest& request, std::string_view contract_id) {
  const auto creds = Authenticate(request);
  const auto genesis = contract::ExportGenesis(store_, creds.public_key,
                                               contract::ParseContractId(contract_id));
  return contract::ContractToJson(genesis);
}

json RpcServer::HandleAbandon(const HttpRequest& request) {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  const auto txid = RequireString(body, "txid");
  transfer::Abandon(store_, creds.public_key, txid);
  return {{"abandoned", txid}};
}

json RpcServer::HandleListTransfers(const HttpRequest& request) const {
  const auto creds = Authenticate(request);
  const auto listing = transfer::ListTransfers(store_, creds.public_key);
  json sent = json::array();
  for (const auto& p : listing.sent) {
    sent.push_back({
        {"txid", p.txid},
        {"contract_id", contract::ContractIdToString(p.contract_id)},
        {"transition_id", util::HexEncode(p.transition_id)},
        {"invoice", p.invoice},
        {"amount", p.amount},
        {"change", p.change},
        {"created_at", p.created_at},
    });
  }
  json received = json::array();
  for (const auto& a : listing.received) {
    received.push_back({
        {"txid", a.txid},
        {"contract_id", contract::ContractIdToString(a.contract_id)},
        {"transition_id", util::HexEncode(a.transition_id)},
        {"outpoint", a.outpoint.ToString()},
        {"amount", a.amount},
        {"accepted_at", a.accepted_at},
    });
  }
  return {{"sent", std::move(sent)}, {"received", std::move(received)}};
}

json RpcServer::HandleListContracts(const HttpRequest& request) const {
  const auto creds = Authenticate(request);
  json contracts = json::array();
  for (const auto& summary : contract::ListContracts(store_, creds.public_key)) {
    contracts.push_back(SummaryToJson(summary));
  }
  return {{"contracts", std::move(contracts)}};
}

json RpcServer::HandleServerKey(std::string_view public_key) const {
  if (server_identity_ == nullptr) {
    ThrowError(ErrorKind::kNotFound, "server identity is not configured");
  }
  const auto server = server_identity_->Acquire();
  return {
      {"server_public_key", server.public_key},
      {"shared_secret", SharedSecretHex(server.key, public_key)},
  };
}

json RpcServer::HandleDerive(const HttpRequest& request) const {
  const auto creds = Authenticate(request);
  const auto body = ParseBody(request);
  return {{"shared_secret", SharedSecretHex(creds.key, RequireString(body, "public_key"))}};
}

json RpcServer::HandleBlobPut(const HttpRequest& request, std::string_view owner,
                              std::string_view name) {
  const auto creds = Authenticate(request);
  storage::ValidateBlobKey(owner, name);
  if (crypto::PublicKey::FromHex(owner) != crypto::PublicKey::FromHex(creds.public_key)) {
    ThrowHttpError(403, "forbidden", "bearer key does not own this namespace");
  }
  const std::span<const std::uint8_t> bytes(
      reinterpret_cast<const std::uint8_t*>(request.body.data()), request.body.size());
  blobs_.Put(owner, name, bytes);
  return {
      {"owner", std::string(owner)},
      {"name", std::string(name)},
      {"bytes", bytes.size()},
      {"sha3_256", util::HexEncode(crypto::Sha3_256(bytes))},
  };
}

HttpResponse RpcServer::HandleBlobGet(std::string_view owner, std::string_view name) const {
  const auto bytes = blobs_.Get(owner, name);
  return HttpResponse{200, "application/octet-stream", std::string(bytes.begin(), bytes.end())};
}

json RpcServer::HandleHealth() const {
  return {
      {"status", "ok"},
      {"network", config::GetNetworkConfig().network_id},
      {"server_identity", server_identity_ != nullptr},
  };
}

}  // namespace sealnode::rpc
