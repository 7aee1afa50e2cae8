#include <array>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "config/network.hpp"
#include "crypto/ec_key.hpp"
#include "crypto/hash.hpp"
#include "identity/credentials.hpp"
#include "ledger/identity_store.hpp"
#include "net/socket.hpp"
#include "nlohmann/json.hpp"
#include "rpc/http_server.hpp"
#include "rpc/server.hpp"
#include "storage/blob_store.hpp"
#include "util/base64.hpp"
#include "util/hex.hpp"
#include "util/time.hpp"

using namespace sealnode;
using nlohmann::json;

namespace {

const char* kAliceKey = "1111111111111111111111111111111111111111111111111111111111111111";
const char* kBobKey = "2222222222222222222222222222222222222222222222222222222222222222";
const char* kServerKey = "4444444444444444444444444444444444444444444444444444444444444444";
const char* kFundingTxid = "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b";
const char* kBobTxid = "0e3e2357e806b6cdb1f70b54c3a3a17b6714ee1f0e68bebb44a74b1efd512098";

rpc::HttpRequest MakeRequest(std::string method, std::string path, std::optional<std::string> key,
                             std::string body = {}) {
  rpc::HttpRequest request;
  request.method = std::move(method);
  request.path = std::move(path);
  request.peer = "127.0.0.1";
  if (key) {
    request.headers["authorization"] = "Bearer " + *key;
  }
  request.body = std::move(body);
  return request;
}

struct Reply {
  int status{0};
  json body;
  std::string raw;
  std::string content_type;
};

Reply Call(rpc::RpcServer& server, const rpc::HttpRequest& request) {
  const auto response = server.Handle(request);
  Reply reply;
  reply.status = response.status;
  reply.raw = response.body;
  reply.content_type = response.content_type;
  if (response.content_type == "application/json") {
    reply.body = json::parse(response.body);
  }
  return reply;
}

Reply Post(rpc::RpcServer& server, const std::string& path, const std::optional<std::string>& key,
           const json& body) {
  return Call(server, MakeRequest("POST", path, key, body.dump()));
}

Reply Get(rpc::RpcServer& server, const std::string& path, const std::optional<std::string>& key) {
  return Call(server, MakeRequest("GET", path, key));
}

bool ExpectStatus(const char* label, const Reply& reply, int status,
                  std::string_view kind = {}) {
  if (reply.status != status) {
    std::cerr << label << ": expected HTTP " << status << ", got " << reply.status << " "
              << reply.raw << "\n";
    return false;
  }
  if (!kind.empty()) {
    if (!reply.body.contains("error") || reply.body["error"].value("kind", "") != kind) {
      std::cerr << label << ": expected error kind " << kind << ", got " << reply.raw << "\n";
      return false;
    }
  }
  return true;
}

bool AlwaysFailSave(const std::filesystem::path&, const ledger::IdentityLedger&, std::string* error) {
  if (error) *error = "/secret/path is read-only";
  return false;
}

bool RunFlow() {
  config::SelectNetwork(config::NetworkType::kBitcoin);
  ledger::IdentityStore store;
  storage::MemoryBlobStore blobs;
  const identity::KeyFileCredentials server_identity(crypto::PrivateKey::FromHex(kServerKey));
  rpc::RpcServer server(store, blobs, &server_identity);

  const auto alice_pk = crypto::PrivateKey::FromHex(kAliceKey).Public().ToHex();
  const auto bob_pk = crypto::PrivateKey::FromHex(kBobKey).Public().ToHex();

  {
    const auto reply = Get(server, "/health", std::nullopt);
    if (!ExpectStatus("health", reply, 200)) return false;
    if (reply.body.value("network", "") != "bitcoin" || !reply.body.value("server_identity", false)) {
      std::cerr << "health body unexpected: " << reply.raw << "\n";
      return false;
    }
  }
  if (!ExpectStatus("unknown route", Get(server, "/nope", std::nullopt), 404, "not_found")) return false;
  if (!ExpectStatus("interfaces", Get(server, "/interfaces", std::nullopt), 200)) return false;
  if (!ExpectStatus("schemas", Get(server, "/schemas", std::nullopt), 200)) return false;

  const json issue = {{"ticker", "USDT"}, {"name", "Tether"}, {"precision", 2},
                      {"supply", 1000},   {"seal", std::string(kFundingTxid) + ":0"}};
  if (!ExpectStatus("no bearer", Post(server, "/issue", std::nullopt, issue), 401, "unauthenticated")) {
    return false;
  }
  {
    const std::string bad_key = "zz" + std::string(62, '1');
    const auto reply = Post(server, "/issue", bad_key, issue);
    if (!ExpectStatus("bad bearer", reply, 400, "invalid_key")) return false;
    if (reply.raw.find(bad_key) != std::string::npos) {
      std::cerr << "bearer token echoed in error\n";
      return false;
    }
  }
  if (!ExpectStatus("malformed body",
                    Call(server, MakeRequest("POST", "/issue", kAliceKey, "{not json")), 400,
                    "validation_error")) {
    return false;
  }
  {
    auto bad = issue;
    bad["precision"] = 40;
    if (!ExpectStatus("bad precision", Post(server, "/issue", kAliceKey, bad), 400, "validation_error")) {
      return false;
    }
  }

  const auto issued = Post(server, "/issue", kAliceKey, issue);
  if (!ExpectStatus("issue", issued, 200)) return false;
  const auto contract_id = issued.body.at("contract_id").get<std::string>();
  {
    const auto again = Post(server, "/issue", kAliceKey, issue);
    if (!ExpectStatus("issue retry", again, 200)) return false;
    if (again.body.at("contract_id") != contract_id || again.body.at("created").get<bool>()) {
      std::cerr << "issue retry not idempotent\n";
      return false;
    }
  }
  {
    const auto listed = Get(server, "/contracts", kAliceKey);
    if (!ExpectStatus("contracts", listed, 200)) return false;
    const auto& first = listed.body.at("contracts").at(0);
    if (first.at("balance") != 1000 || first.at("balance_formatted") != "10.00") {
      std::cerr << "contract balance wrong: " << listed.raw << "\n";
      return false;
    }
  }

  // Bob imports the genesis and invoices 2.5 units.
  const auto genesis = Get(server, "/contracts/" + contract_id + "/genesis", kAliceKey);
  if (!ExpectStatus("genesis", genesis, 200)) return false;
  if (!ExpectStatus("genesis for stranger",
                    Get(server, "/contracts/" + contract_id + "/genesis", kBobKey), 404, "not_found")) {
    return false;
  }
  {
    const auto imported = Post(server, "/import", kBobKey, json{{"genesis", genesis.body}});
    if (!ExpectStatus("import", imported, 200)) return false;
    if (imported.body.at("contract_id") != contract_id || !imported.body.at("imported").get<bool>()) {
      std::cerr << "import reported wrong contract\n";
      return false;
    }
  }
  const auto invoice = Post(server, "/invoice", kBobKey,
                            json{{"contract_id", contract_id},
                                 {"amount", "2.5"},
                                 {"seal", std::string(kBobTxid) + ":1"}});
  if (!ExpectStatus("invoice", invoice, 200)) return false;
  if (invoice.body.at("amount") != 250) {
    std::cerr << "invoice amount not scaled by precision\n";
    return false;
  }
  const auto invoice_text = invoice.body.at("invoice").get<std::string>();

  const auto built = Post(server, "/psbt", kAliceKey, json{{"invoice", invoice_text}});
  if (!ExpectStatus("psbt", built, 200)) return false;
  if (built.body.at("change") != 750 ||
      built.body.value("change_address", "").rfind("bc1p", 0) != 0) {
    std::cerr << "psbt response unexpected: " << built.raw << "\n";
    return false;
  }
  if (!ExpectStatus("pay by stranger", Post(server, "/pay", kBobKey, json{{"psbt", built.body.at("psbt")}}),
                    403, "signing_error")) {
    return false;
  }
  if (!ExpectStatus("pay garbage", Post(server, "/pay", kAliceKey, json{{"psbt", "AAAA"}}), 400,
                    "validation_error")) {
    return false;
  }
  const auto paid = Post(server, "/pay", kAliceKey, json{{"psbt", built.body.at("psbt")}});
  if (!ExpectStatus("pay", paid, 200)) return false;
  if (!ExpectStatus("pay twice", Post(server, "/psbt", kAliceKey, json{{"invoice", invoice_text}}), 409,
                    "invoice_already_used")) {
    return false;
  }

  const auto consignment = paid.body.at("consignment");
  {
    const auto accepted = Post(server, "/accept", kBobKey, json{{"consignment", consignment}});
    if (!ExpectStatus("accept", accepted, 200)) return false;
    if (accepted.body.at("status") != "accepted" || accepted.body.at("amount") != 250) {
      std::cerr << "accept body unexpected: " << accepted.raw << "\n";
      return false;
    }
    const auto again = Post(server, "/accept", kBobKey, json{{"consignment", consignment}});
    if (!ExpectStatus("accept again", again, 200)) return false;
    if (again.body.at("status") != "already_accepted") {
      std::cerr << "re-accept not idempotent: " << again.raw << "\n";
      return false;
    }
    const auto wrong_seal = Post(server, "/accept", kBobKey,
                                 json{{"consignment", consignment},
                                      {"seal", "tapret1st:" + std::string(kBobTxid) + ":1#1"}});
    if (!ExpectStatus("tampered seal", wrong_seal, 422, "rejected_transfer")) return false;
    if (!ExpectStatus("garbage consignment",
                      Post(server, "/accept", kBobKey, json{{"consignment", "!!"}}), 400,
                      "validation_error")) {
      return false;
    }
    const auto wrong_version =
        util::Base64Encode(std::string(R"({"version":"1","genesis":{},"history":[]})"));
    if (!ExpectStatus("consignment version type",
                      Post(server, "/accept", kBobKey, json{{"consignment", wrong_version}}), 400,
                      "validation_error")) {
      return false;
    }
  }
  {
    const auto transfers = Get(server, "/transfers", kAliceKey);
    if (!ExpectStatus("transfers", transfers, 200)) return false;
    if (transfers.body.at("sent").size() != 1) {
      std::cerr << "sent transfer not listed\n";
      return false;
    }
    const auto txid = transfers.body.at("sent").at(0).at("txid");
    if (!ExpectStatus("abandon", Post(server, "/abandon", kAliceKey, json{{"txid", txid}}), 200)) {
      return false;
    }
    if (!ExpectStatus("abandon twice", Post(server, "/abandon", kAliceKey, json{{"txid", txid}}), 404,
                      "not_found")) {
      return false;
    }
  }

  // Failure kinds surfaced through the API.
  {
    const auto big = Post(server, "/invoice", kAliceKey,
                          json{{"contract_id", contract_id}, {"amount", 900},
                               {"seal", std::string(kFundingTxid) + ":7"}});
    if (!ExpectStatus("big invoice", big, 200)) return false;
    if (!ExpectStatus("insufficient", Post(server, "/psbt", kBobKey, json{{"invoice", big.body.at("invoice")}}),
                      422, "insufficient_funds")) {
      return false;
    }
    const auto past = Post(server, "/invoice", kAliceKey,
                           json{{"contract_id", contract_id}, {"amount", 1},
                                {"seal", std::string(kFundingTxid) + ":8"}, {"expiry", 1}});
    if (!ExpectStatus("past expiry", past, 400, "validation_error")) return false;
  }

  // Key agreement.
  {
    const auto from_alice = Post(server, "/derive", kAliceKey, json{{"public_key", bob_pk}});
    const auto from_bob = Post(server, "/derive", kBobKey, json{{"public_key", alice_pk}});
    if (!ExpectStatus("derive", from_alice, 200) || !ExpectStatus("derive", from_bob, 200)) return false;
    if (from_alice.body.at("shared_secret") != from_bob.body.at("shared_secret")) {
      std::cerr << "derive is not symmetric\n";
      return false;
    }
    const auto with_server = Get(server, "/key/" + alice_pk, std::nullopt);
    if (!ExpectStatus("key", with_server, 200)) return false;
    const auto server_pk = with_server.body.at("server_public_key").get<std::string>();
    const auto expected = crypto::DeriveSharedSecret(crypto::PrivateKey::FromHex(kAliceKey),
                                                     crypto::PublicKey::FromHex(server_pk));
    if (with_server.body.at("shared_secret") != util::HexEncode(expected)) {
      std::cerr << "server key agreement mismatch\n";
      return false;
    }
    if (!ExpectStatus("key bad pk", Get(server, "/key/02abcd", std::nullopt), 400, "invalid_key")) {
      return false;
    }
    rpc::RpcServer anonymous(store, blobs, nullptr);
    if (!ExpectStatus("key without identity", Get(anonymous, "/key/" + alice_pk, std::nullopt), 404,
                      "not_found")) {
      return false;
    }
  }

  // Blob namespace.
  {
    const std::string payload = std::string("wallet\0bytes", 12);
    auto put = MakeRequest("POST", "/carbonado/" + bob_pk + "/backup.bin", kAliceKey, payload);
    if (!ExpectStatus("foreign blob put", Call(server, put), 403, "forbidden")) return false;
    put = MakeRequest("POST", "/carbonado/" + bob_pk + "/backup.bin", kBobKey, payload);
    const auto stored = Call(server, put);
    if (!ExpectStatus("blob put", stored, 200)) return false;
    const std::span<const std::uint8_t> bytes(reinterpret_cast<const std::uint8_t*>(payload.data()),
                                              payload.size());
    if (stored.body.at("bytes") != payload.size() ||
        stored.body.at("sha3_256") != util::HexEncode(crypto::Sha3_256(bytes))) {
      std::cerr << "blob put response unexpected: " << stored.raw << "\n";
      return false;
    }
    const auto fetched = Get(server, "/carbonado/" + bob_pk + "/backup.bin", std::nullopt);
    if (fetched.status != 200 || fetched.content_type != "application/octet-stream" ||
        fetched.raw != payload) {
      std::cerr << "blob get returned different bytes\n";
      return false;
    }
    if (!ExpectStatus("blob missing", Get(server, "/carbonado/" + bob_pk + "/other", std::nullopt), 404,
                      "not_found")) {
      return false;
    }
    if (!ExpectStatus("blob traversal", Get(server, "/carbonado/" + bob_pk + "/.hidden", std::nullopt),
                      400, "validation_error")) {
      return false;
    }
  }
  return true;
}

bool RunStorageFailure() {
  auto temp_root = std::filesystem::temp_directory_path() / "sealnode-rest-storage-test";
  std::filesystem::remove_all(temp_root);
  ledger::IdentityStore store(temp_root);
  store.SetSaverForTest(&AlwaysFailSave);
  storage::MemoryBlobStore blobs;
  rpc::RpcServer server(store, blobs, nullptr);
  const json issue = {{"ticker", "USDT"}, {"name", "Tether"}, {"precision", 2},
                      {"supply", 1000},   {"seal", std::string(kFundingTxid) + ":0"}};
  const auto reply = Post(server, "/issue", kAliceKey, issue);
  std::filesystem::remove_all(temp_root);
  if (!ExpectStatus("storage failure", reply, 500, "storage_error")) return false;
  if (reply.body["error"].value("message", "") != "storage failure" ||
      reply.raw.find("/secret/path") != std::string::npos) {
    std::cerr << "storage failure leaked detail: " << reply.raw << "\n";
    return false;
  }
  return true;
}

bool RunOverHttp() {
  ledger::IdentityStore store;
  storage::MemoryBlobStore blobs;
  rpc::RpcServer rpc(store, blobs, nullptr);
  rpc::HttpServer::Options options;
  options.bind_address = "127.0.0.1";
  options.port = 0;
  rpc::HttpServer http(options, [&rpc](const rpc::HttpRequest& request) { return rpc.Handle(request); });
  http.Start();

  net::TcpSocket socket;
  if (!socket.Connect("127.0.0.1", http.Port())) {
    std::cerr << "connect to REST server failed\n";
    return false;
  }
  const std::string body = R"({"public_key":"02466d7fcae563e5cb09a0d1870bb580344804617879a14949cf22285f1bae3f27"})";
  const std::string request = "POST /derive HTTP/1.1\r\nHost: localhost\r\nAuthorization: Bearer " +
                              std::string(kAliceKey) + "\r\nContent-Type: application/json\r\n" +
                              "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
  if (!socket.SendAll(request)) {
    std::cerr << "send to REST server failed\n";
    return false;
  }
  std::string response;
  std::array<std::uint8_t, 2048> chunk{};
  while (true) {
    const auto bytes = socket.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) break;
    response.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
  }
  http.Stop();
  if (response.rfind("HTTP/1.1 200", 0) != 0 ||
      response.find("b36b6d195982c5be874d6d542dc268234379e1ae4ff1709402135b7de5cf0766") ==
          std::string::npos) {
    std::cerr << "REST over HTTP returned: " << response << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  if (!RunFlow()) return EXIT_FAILURE;
  if (!RunStorageFailure()) return EXIT_FAILURE;
  if (!RunOverHttp()) return EXIT_FAILURE;
  std::cout << "rest api tests passed\n";
  return EXIT_SUCCESS;
}
