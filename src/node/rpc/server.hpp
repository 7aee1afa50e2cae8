#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "core/error.hpp"
#include "identity/credentials.hpp"
#include "ledger/identity_store.hpp"
#include "nlohmann/json.hpp"
#include "rpc/http_server.hpp"
#include "storage/blob_store.hpp"

namespace sealnode::rpc {

// HTTP status for each error kind (400 validation, 404 not found, ...).
int StatusForError(ErrorKind kind) noexcept;

// REST front end of the daemon. Every handler authenticates the caller from
// the request's bearer key, runs one core operation and renders its result.
class RpcServer {
 public:
  // `server_identity` may be null, in which case GET /key/:pk answers 404.
  RpcServer(ledger::IdentityStore& store, storage::BlobStore& blobs,
            const identity::CredentialProvider* server_identity);

  HttpResponse Handle(const HttpRequest& request);

 private:
  identity::Credentials Authenticate(const HttpRequest& request) const;

  nlohmann::json HandleIssue(const HttpRequest& request);
  nlohmann::json HandleInvoice(const HttpRequest& request);
  nlohmann::json HandlePsbt(const HttpRequest& request);
  nlohmann::json HandlePay(const HttpRequest& request);
  HttpResponse HandleAccept(const HttpRequest& request);
  nlohmann::json HandleImport(const HttpRequest& request);
  nlohmann::json HandleExportGenesis(const HttpRequest& request, std::string_view contract_id);
  nlohmann::json HandleAbandon(const HttpRequest& request);
  nlohmann::json HandleListTransfers(const HttpRequest& request) const;
  nlohmann::json HandleListContracts(const HttpRequest& request) const;
  nlohmann::json HandleServerKey(std::string_view public_key) const;
  nlohmann::json HandleDerive(const HttpRequest& request) const;
  nlohmann::json HandleBlobPut(const HttpRequest& request, std::string_view owner,
                               std::string_view name);
  HttpResponse HandleBlobGet(std::string_view owner, std::string_view name) const;
  nlohmann::json HandleHealth() const;

  ledger::IdentityStore& store_;
  storage::BlobStore& blobs_;
  const identity::CredentialProvider* server_identity_;
};

}  // namespace sealnode::rpc
