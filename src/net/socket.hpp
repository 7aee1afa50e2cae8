#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace sealnode::net {

// Blocking POSIX TCP socket. Move-only; closes on destruction.
class TcpSocket {
 public:
  TcpSocket() = default;
  explicit TcpSocket(int handle) : handle_(handle) {}
  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;
  TcpSocket(TcpSocket&& other) noexcept;
  TcpSocket& operator=(TcpSocket&& other) noexcept;
  ~TcpSocket();

  bool Connect(const std::string& host, std::uint16_t port, int timeout_ms = 5000);
  // Port 0 asks the kernel for an ephemeral port; see LocalPort().
  bool BindAndListen(const std::string& address, std::uint16_t port, int backlog = 16);
  // Invalid socket on timeout or error.
  TcpSocket AcceptWithTimeout(int timeout_ms) const;

  std::ptrdiff_t Send(const std::uint8_t* data, std::size_t length) const;
  // Loops over short writes.
  bool SendAll(std::string_view data) const;
  std::ptrdiff_t Recv(std::uint8_t* data, std::size_t length) const;
  bool SetTimeout(int milliseconds);

  std::string PeerAddress() const;
  std::uint16_t LocalPort() const;
  void Close();
  bool IsValid() const noexcept { return handle_ >= 0; }

 private:
  int handle_{-1};
};

}  // namespace sealnode::net
