#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <iterator>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace sealnode::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path TempPathFor(const std::filesystem::path& target) {
  const auto seq = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto ticks = std::chrono::steady_clock::now().time_since_epoch().count();
  return target.parent_path() /
         (target.filename().string() + ".tmp." + std::to_string(::getpid()) + "." +
          std::to_string(ticks) + "." + std::to_string(seq));
}

void SetError(std::string* error, const std::string& message) {
  if (error) {
    *error = message;
  }
}

bool WriteAll(int fd, std::span<const std::uint8_t> data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n <= 0) {
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  return true;
}

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      SetError(error, "create_directories failed: " + ec.message());
      return false;
    }
  }

  const auto tmp_path = TempPathFor(path);
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
  if (fd < 0) {
    SetError(error, std::string("open temp file failed: ") + std::strerror(errno));
    return false;
  }
  const bool ok = WriteAll(fd, data) && ::fsync(fd) == 0;
  const int saved_errno = errno;
  ::close(fd);
  std::error_code ec;
  if (!ok) {
    std::filesystem::remove(tmp_path, ec);
    SetError(error, std::string("write temp file failed: ") + std::strerror(saved_errno));
    return false;
  }
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp_path, ignored);
    SetError(error, "rename failed: " + ec.message());
    return false;
  }
  return true;
}

bool AtomicWriteFileText(const std::filesystem::path& path, std::string_view text,
                         std::string* error) {
  return AtomicWriteFileBytes(
      path,
      std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()),
                                    text.size()),
      error);
}

bool ReadFileBytes(const std::filesystem::path& path, std::vector<std::uint8_t>* out,
                   std::string* error) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    SetError(error, "");
    return false;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    SetError(error, "failed to open " + path.string());
    return false;
  }
  out->assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) {
    SetError(error, "failed to read " + path.string());
    return false;
  }
  return true;
}

}  // namespace sealnode::util
