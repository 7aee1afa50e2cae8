#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "net/socket.hpp"

namespace sealnode::rpc {

struct HttpRequest {
  std::string method;
  std::string path;   // target without the query string
  std::string query;  // raw, without '?'
  std::map<std::string, std::string> headers;  // lower-case names
  std::string body;
  std::string peer;

  // Empty if absent.
  std::string Header(std::string_view name) const;
};

struct HttpResponse {
  int status{200};
  std::string content_type{"application/json"};
  std::string body;
};

std::string_view StatusText(int status) noexcept;

class HttpServer {
 public:
  struct Options {
    std::string bind_address{"127.0.0.1"};
    std::uint16_t port{0};
    std::vector<std::string> allowed_hosts;  // exact peer addresses; empty -> loopback only.
    std::size_t max_body_bytes{8 * 1024 * 1024};
    int socket_timeout_ms{5000};
    std::size_t threads{4};
  };

  using Handler = std::function<HttpResponse(const HttpRequest&)>;

  HttpServer(Options options, Handler handler);
  ~HttpServer();

  // Binds the listen socket and returns; requests are served by the worker
  // pool until Stop(). Throws std::runtime_error if the port cannot be bound.
  void Start();

  // Closes the listener, drains the workers and joins every thread. Safe to
  // call more than once.
  void Stop();

  // Start() and block until Stop() is called from another thread.
  void Serve();

  // Actual port after Start(); useful with port 0.
  std::uint16_t Port() const { return bound_port_; }

 private:
  void AcceptLoop();
  void WorkerLoop();
  void HandleClient(net::TcpSocket client);
  bool ReadRequest(net::TcpSocket& client, HttpRequest* request, int* status);
  bool HostAllowed(const std::string& peer) const;
  void SendResponse(net::TcpSocket& client, const HttpResponse& response);

  Options options_;
  Handler handler_;
  std::atomic<bool> running_{false};
  net::TcpSocket listener_;
  std::uint16_t bound_port_{0};
  std::thread acceptor_;
  std::vector<std::thread> workers_;

  std::mutex queue_mutex_;
  std::condition_variable queue_cv_;
  std::deque<net::TcpSocket> queue_;
};

}  // namespace sealnode::rpc
