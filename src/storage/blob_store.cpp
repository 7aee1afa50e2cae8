#include "storage/blob_store.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "core/error.hpp"
#include "util/atomic_file.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"

namespace sealnode::storage {

namespace {

constexpr std::size_t kMaxNameLength = 128;

std::string Lower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

}  // namespace

void ValidateBlobKey(std::string_view owner, std::string_view name) {
  if ((owner.size() != 66 && owner.size() != 130) || !util::IsHex(owner)) {
    ThrowError(ErrorKind::kValidation, "owner must be a hex encoded public key");
  }
  if (name.empty() || name.size() > kMaxNameLength || name.front() == '.') {
    ThrowError(ErrorKind::kValidation, "invalid blob name");
  }
  for (unsigned char c : name) {
    if (!(std::isalnum(c) || c == '.' || c == '_' || c == '-')) {
      ThrowError(ErrorKind::kValidation, "invalid blob name");
    }
  }
}

FileBlobStore::FileBlobStore(std::filesystem::path root) : root_(std::move(root)) {}

std::filesystem::path FileBlobStore::PathFor(std::string_view owner, std::string_view name) const {
  ValidateBlobKey(owner, name);
  return root_ / Lower(owner) / std::string(name);
}

void FileBlobStore::Put(std::string_view owner, std::string_view name,
                        std::span<const std::uint8_t> bytes) {
  const auto path = PathFor(owner, name);
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    util::LogError("blob", "create " + path.parent_path().string() + ": " + ec.message());
    ThrowError(ErrorKind::kStorage, "failed to create blob namespace");
  }
  std::string error;
  if (!util::AtomicWriteFileBytes(path, bytes, &error)) {
    util::LogError("blob", "write " + path.string() + ": " + error);
    ThrowError(ErrorKind::kStorage, "failed to store blob");
  }
  util::LogDebug("blob: stored " + std::string(name) + " (" + std::to_string(bytes.size()) +
                 " bytes)");
}

std::vector<std::uint8_t> FileBlobStore::Get(std::string_view owner, std::string_view name) const {
  const auto path = PathFor(owner, name);
  std::vector<std::uint8_t> out;
  std::string error;
  if (!util::ReadFileBytes(path, &out, &error)) {
    if (error.empty()) {
      ThrowError(ErrorKind::kNotFound, "no blob named " + std::string(name));
    }
    util::LogError("blob", "read " + path.string() + ": " + error);
    ThrowError(ErrorKind::kStorage, "failed to read blob");
  }
  return out;
}

void MemoryBlobStore::Put(std::string_view owner, std::string_view name,
                          std::span<const std::uint8_t> bytes) {
  ValidateBlobKey(owner, name);
  std::lock_guard<std::mutex> lock(mutex_);
  blobs_[{Lower(owner), std::string(name)}].assign(bytes.begin(), bytes.end());
}

std::vector<std::uint8_t> MemoryBlobStore::Get(std::string_view owner,
                                               std::string_view name) const {
  ValidateBlobKey(owner, name);
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blobs_.find({Lower(owner), std::string(name)});
  if (it == blobs_.end()) {
    ThrowError(ErrorKind::kNotFound, "no blob named " + std::string(name));
  }
  return it->second;
}

}  // namespace sealnode::storage
