#include "rpc/http_server.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <charconv>
#include <chrono>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "util/logging.hpp"

namespace sealnode::rpc {

namespace {

constexpr std::size_t kMaxHeaderSize = 64 * 1024;
constexpr std::size_t kDefaultMaxBodySize = 8 * 1024 * 1024;
constexpr std::size_t kMaxQueuedConnections = 256;

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
    value.remove_prefix(1);
  }
  while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
    value.remove_suffix(1);
  }
  return value;
}

bool ParseHeaders(std::string_view block, HttpRequest* request) {
  auto first_end = block.find("\r\n");
  const auto request_line = block.substr(0, first_end);
  const auto sp1 = request_line.find(' ');
  const auto sp2 = sp1 == std::string_view::npos ? sp1 : request_line.find(' ', sp1 + 1);
  if (sp2 == std::string_view::npos || !request_line.substr(sp2 + 1).starts_with("HTTP/1.")) {
    return false;
  }
  request->method = std::string(request_line.substr(0, sp1));
  const auto target = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
  if (target.empty() || target.front() != '/') {
    return false;
  }
  const auto q = target.find('?');
  request->path = std::string(target.substr(0, q));
  request->query = q == std::string_view::npos ? std::string() : std::string(target.substr(q + 1));

  std::size_t start = first_end == std::string_view::npos ? block.size() : first_end + 2;
  while (start < block.size()) {
    auto end = block.find("\r\n", start);
    auto line = end == std::string_view::npos ? block.substr(start) : block.substr(start, end - start);
    const auto colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return false;
    }
    request->headers[Lower(Trim(line.substr(0, colon)))] = std::string(Trim(line.substr(colon + 1)));
    if (end == std::string_view::npos) break;
    start = end + 2;
  }
  return true;
}

std::string ErrorBody(std::string_view kind, std::string_view message) {
  std::string body = R"({"error":{"kind":")";
  body += kind;
  body += R"(","message":")";
  body += message;
  body += "\"}}";
  return body;
}

}  // namespace

std::string HttpRequest::Header(std::string_view name) const {
  auto it = headers.find(Lower(name));
  return it == headers.end() ? std::string() : it->second;
}

std::string_view StatusText(int status) noexcept {
  switch (status) {
    case 200: return "OK";
    case 201: return "Created";
    case 400: return "Bad Request";
    case 401: return "Unauthorized";
    case 403: return "Forbidden";
    case 404: return "Not Found";
    case 405: return "Method Not Allowed";
    case 409: return "Conflict";
    case 410: return "Gone";
    case 413: return "Payload Too Large";
    case 422: return "Unprocessable Entity";
    case 500: return "Internal Server Error";
    case 503: return "Service Unavailable";
    default: return "Error";
  }
}

HttpServer::HttpServer(Options options, Handler handler)
    : options_(std::move(options)), handler_(std::move(handler)) {
  if (options_.max_body_bytes == 0) {
    options_.max_body_bytes = kDefaultMaxBodySize;
  }
  if (options_.threads == 0) {
    options_.threads = 1;
  }
}

HttpServer::~HttpServer() { Stop(); }

void HttpServer::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  if (!listener_.BindAndListen(options_.bind_address, options_.port)) {
    running_.store(false);
    throw std::runtime_error("failed to bind " + options_.bind_address + ":" +
                             std::to_string(options_.port));
  }
  bound_port_ = listener_.LocalPort();
  for (std::size_t i = 0; i < options_.threads; ++i) {
    workers_.emplace_back([this]() { WorkerLoop(); });
  }
  acceptor_ = std::thread([this]() { AcceptLoop(); });
  util::LogInfo("http: listening on " + options_.bind_address + ":" + std::to_string(bound_port_));
}

void HttpServer::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) {
    return;
  }
  if (acceptor_.joinable()) {
    acceptor_.join();
  }
  listener_.Close();
  queue_cv_.notify_all();
  for (auto& worker : workers_) {
    if (worker.joinable()) worker.join();
  }
  workers_.clear();
  std::lock_guard<std::mutex> lock(queue_mutex_);
  queue_.clear();
}

void HttpServer::Serve() {
  Start();
  while (running_) {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
}

void HttpServer::AcceptLoop() {
  while (running_) {
    auto client = listener_.AcceptWithTimeout(200);
    if (!client.IsValid()) {
      continue;
    }
    if (options_.socket_timeout_ms > 0) {
      client.SetTimeout(options_.socket_timeout_ms);
    }
    std::unique_lock<std::mutex> lock(queue_mutex_);
    if (queue_.size() >= kMaxQueuedConnections) {
      lock.unlock();
      SendResponse(client, HttpResponse{503, "application/json", ErrorBody("unavailable", "busy")});
      continue;
    }
    queue_.push_back(std::move(client));
    lock.unlock();
    queue_cv_.notify_one();
  }
}

void HttpServer::WorkerLoop() {
  while (true) {
    net::TcpSocket client;
    {
      std::unique_lock<std::mutex> lock(queue_mutex_);
      queue_cv_.wait(lock, [this]() { return !running_ || !queue_.empty(); });
      if (queue_.empty()) {
        return;
      }
      client = std::move(queue_.front());
      queue_.pop_front();
    }
    HandleClient(std::move(client));
  }
}

void HttpServer::HandleClient(net::TcpSocket client) {
  HttpRequest request;
  request.peer = client.PeerAddress();
  if (!HostAllowed(request.peer)) {
    util::LogWarn("http", "rejected connection from " + request.peer);
    SendResponse(client, HttpResponse{403, "application/json", ErrorBody("forbidden", "peer not allowed")});
    return;
  }
  int status = 400;
  if (!ReadRequest(client, &request, &status)) {
    const auto kind = status == 413 ? "payload_too_large" : "bad_request";
    SendResponse(client, HttpResponse{status, "application/json", ErrorBody(kind, StatusText(status))});
    return;
  }
  try {
    SendResponse(client, handler_(request));
  } catch (const std::exception& ex) {
    util::LogError("http", request.method + " " + request.path + " failed: " + ex.what());
    SendResponse(client, HttpResponse{500, "application/json", ErrorBody("internal", "internal error")});
  }
}

bool HttpServer::ReadRequest(net::TcpSocket& client, HttpRequest* request, int* status) {
  std::string buffer;
  buffer.reserve(1024);
  std::array<std::uint8_t, 4096> chunk{};
  std::size_t header_end = std::string::npos;
  while (buffer.size() < kMaxHeaderSize) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    buffer.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
    header_end = buffer.find("\r\n\r\n");
    if (header_end != std::string::npos) {
      break;
    }
  }
  if (header_end == std::string::npos) {
    *status = 413;
    return false;
  }
  if (!ParseHeaders(std::string_view(buffer).substr(0, header_end), request)) {
    *status = 400;
    return false;
  }
  if (request->method != "GET" && request->method != "POST") {
    *status = 405;
    return false;
  }
  if (!request->Header("transfer-encoding").empty()) {
    *status = 400;
    return false;
  }

  std::size_t content_length = 0;
  const auto length_header = request->Header("content-length");
  if (!length_header.empty()) {
    const auto* end = length_header.data() + length_header.size();
    auto [ptr, ec] = std::from_chars(length_header.data(), end, content_length);
    if (ec != std::errc() || ptr != end) {
      *status = 400;
      return false;
    }
  }
  if (content_length > options_.max_body_bytes) {
    *status = 413;
    return false;
  }
  std::string payload = buffer.substr(header_end + 4);
  while (payload.size() < content_length) {
    const auto bytes = client.Recv(chunk.data(), chunk.size());
    if (bytes <= 0) {
      *status = 400;
      return false;
    }
    payload.append(reinterpret_cast<const char*>(chunk.data()), static_cast<std::size_t>(bytes));
  }
  payload.resize(content_length);
  request->body = std::move(payload);
  return true;
}

bool HttpServer::HostAllowed(const std::string& peer) const {
  if (peer.empty()) {
    return false;
  }
  if (options_.allowed_hosts.empty()) {
    // default allow loopback
    return peer == "::1" || peer.rfind("127.", 0) == 0;
  }
  return std::find(options_.allowed_hosts.begin(), options_.allowed_hosts.end(), peer) !=
         options_.allowed_hosts.end();
}

void HttpServer::SendResponse(net::TcpSocket& client, const HttpResponse& response) {
  std::ostringstream oss;
  oss << "HTTP/1.1 " << response.status << ' ' << StatusText(response.status) << "\r\n";
  oss << "Content-Type: " << response.content_type << "\r\n";
  if (response.status == 401) {
    oss << "WWW-Authenticate: Bearer realm=\"sealnode\"\r\n";
  }
  oss << "Content-Length: " << response.body.size() << "\r\n";
  oss << "Connection: close\r\n\r\n";
  oss << response.body;
  if (!client.SendAll(oss.str())) {
    util::LogDebug("http: client went away before the response was sent");
  }
  client.Close();
}

}  // namespace sealnode::rpc
