#include "net/socket.hpp"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <memory>

#include "util/logging.hpp"

namespace sealnode::net {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* info) const { freeaddrinfo(info); }
};

bool ConnectWithTimeout(int fd, const sockaddr* addr, socklen_t addr_len, int timeout_ms) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags < 0 || fcntl(fd, F_SETFL, flags | O_NONBLOCK) != 0) {
    return false;
  }
  bool ok = ::connect(fd, addr, addr_len) == 0;
  if (!ok && errno == EINPROGRESS) {
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, timeout_ms) == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      ok = ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0;
    }
  }
  return fcntl(fd, F_SETFL, flags) == 0 && ok;
}

}  // namespace

TcpSocket::TcpSocket(TcpSocket&& other) noexcept : handle_(other.handle_) { other.handle_ = -1; }

TcpSocket& TcpSocket::operator=(TcpSocket&& other) noexcept {
  if (this != &other) {
    Close();
    handle_ = other.handle_;
    other.handle_ = -1;
  }
  return *this;
}

TcpSocket::~TcpSocket() { Close(); }

bool TcpSocket::Connect(const std::string& host, std::uint16_t port, int timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  addrinfo* raw = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &raw) != 0 || raw == nullptr) {
    util::LogDebug("socket: resolve " + host + " failed");
    return false;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> result(raw);
  for (auto* entry = result.get(); entry != nullptr; entry = entry->ai_next) {
    const int fd = ::socket(entry->ai_family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) continue;
    if (ConnectWithTimeout(fd, entry->ai_addr, entry->ai_addrlen, timeout_ms)) {
      Close();
      handle_ = fd;
      return true;
    }
    ::close(fd);
  }
  util::LogDebug("socket: connect " + host + ":" + port_str + " failed");
  return false;
}

bool TcpSocket::BindAndListen(const std::string& address, std::uint16_t port, int backlog) {
  addrinfo hints{};
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_protocol = IPPROTO_TCP;
  hints.ai_flags = AI_PASSIVE | AI_NUMERICHOST;
  hints.ai_family = AF_UNSPEC;
  addrinfo* raw = nullptr;
  const std::string port_str = std::to_string(port);
  const char* node = address.empty() ? nullptr : address.c_str();
  if (getaddrinfo(node, port_str.c_str(), &hints, &raw) != 0 || raw == nullptr) {
    return false;
  }
  std::unique_ptr<addrinfo, AddrInfoDeleter> result(raw);
  for (auto* entry = result.get(); entry != nullptr; entry = entry->ai_next) {
    const int fd = ::socket(entry->ai_family, SOCK_STREAM | SOCK_CLOEXEC, IPPROTO_TCP);
    if (fd < 0) continue;
    int opt = 1;
    (void)setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    if (::bind(fd, entry->ai_addr, entry->ai_addrlen) != 0 || ::listen(fd, backlog) != 0) {
      ::close(fd);
      continue;
    }
    Close();
    handle_ = fd;
    return true;
  }
  return false;
}

TcpSocket TcpSocket::AcceptWithTimeout(int timeout_ms) const {
  if (!IsValid()) return TcpSocket();
  pollfd pfd{handle_, POLLIN, 0};
  if (::poll(&pfd, 1, timeout_ms) <= 0) {
    return TcpSocket();
  }
  return TcpSocket(::accept4(handle_, nullptr, nullptr, SOCK_CLOEXEC));
}

std::ptrdiff_t TcpSocket::Send(const std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  return ::send(handle_, data, length, MSG_NOSIGNAL);
}

bool TcpSocket::SendAll(std::string_view data) const {
  const auto* ptr = reinterpret_cast<const std::uint8_t*>(data.data());
  std::size_t remaining = data.size();
  while (remaining > 0) {
    const auto sent = Send(ptr, remaining);
    if (sent <= 0) {
      if (sent < 0 && errno == EINTR) continue;
      return false;
    }
    ptr += sent;
    remaining -= static_cast<std::size_t>(sent);
  }
  return true;
}

std::ptrdiff_t TcpSocket::Recv(std::uint8_t* data, std::size_t length) const {
  if (!IsValid()) return -1;
  std::ptrdiff_t got;
  do {
    got = ::recv(handle_, data, length, 0);
  } while (got < 0 && errno == EINTR);
  return got;
}

bool TcpSocket::SetTimeout(int milliseconds) {
  if (!IsValid()) return false;
  timeval tv{milliseconds / 1000, (milliseconds % 1000) * 1000};
  return ::setsockopt(handle_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(handle_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

std::string TcpSocket::PeerAddress() const {
  if (!IsValid()) return {};
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getpeername(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return {};
  }
  char host[NI_MAXHOST]{};
  if (getnameinfo(reinterpret_cast<sockaddr*>(&addr), len, host, sizeof(host), nullptr, 0,
                  NI_NUMERICHOST) != 0) {
    return {};
  }
  std::string out(host);
  // IPv4-mapped IPv6 peers are reported in dotted form.
  constexpr std::string_view kMapped = "::ffff:";
  if (out.rfind(kMapped, 0) == 0 && out.find('.') != std::string::npos) {
    out.erase(0, kMapped.size());
  }
  return out;
}

std::uint16_t TcpSocket::LocalPort() const {
  if (!IsValid()) return 0;
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(handle_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    return 0;
  }
  if (addr.ss_family == AF_INET) {
    return ntohs(reinterpret_cast<sockaddr_in*>(&addr)->sin_port);
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<sockaddr_in6*>(&addr)->sin6_port);
  }
  return 0;
}

void TcpSocket::Close() {
  if (handle_ >= 0) {
    ::close(handle_);
    handle_ = -1;
  }
}

}  // namespace sealnode::net
