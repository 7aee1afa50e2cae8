#include "util/csprng.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

namespace sealnode::util {

namespace {

bool ReadUrandom(std::span<std::uint8_t> out, std::size_t filled, std::string* error) {
  const int fd = ::open("/dev/urandom", O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      if (error) {
        *error = n == 0 ? std::string("read(/dev/urandom) returned EOF")
                        : std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      ::close(fd);
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

}  // namespace

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }
#endif
  return ReadUrandom(out, filled, error);
}

std::vector<std::uint8_t> SecureRandomBytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  std::string error;
  if (!FillSecureRandomBytes(out, &error)) {
    throw std::runtime_error("secure randomness unavailable: " + error);
  }
  return out;
}

std::uint64_t SecureRandomUint64() {
  std::uint8_t buf[8];
  std::string error;
  if (!FillSecureRandomBytes(buf, &error)) {
    throw std::runtime_error("secure randomness unavailable: " + error);
  }
  std::uint64_t value = 0;
  for (std::uint8_t b : buf) {
    value = (value << 8) | b;
  }
  return value;
}

}  // namespace sealnode::util
