#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sealnode::storage {

// Opaque payloads addressed by (owner public key hex, name). Writes replace
// the previous record.
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  virtual void Put(std::string_view owner, std::string_view name,
                   std::span<const std::uint8_t> bytes) = 0;
  // Throws Error(kNotFound) when nothing was stored under the pair.
  virtual std::vector<std::uint8_t> Get(std::string_view owner, std::string_view name) const = 0;
};

// Throws Error(kValidation) unless `owner` is 66 or 130 hex characters and
// `name` is 1..128 characters of [A-Za-z0-9._-] not starting with a dot.
void ValidateBlobKey(std::string_view owner, std::string_view name);

// One directory per owner under a single root: <root>/<owner>/<name>.
class FileBlobStore final : public BlobStore {
 public:
  explicit FileBlobStore(std::filesystem::path root);

  void Put(std::string_view owner, std::string_view name,
           std::span<const std::uint8_t> bytes) override;
  std::vector<std::uint8_t> Get(std::string_view owner, std::string_view name) const override;

  const std::filesystem::path& Root() const noexcept { return root_; }

 private:
  std::filesystem::path PathFor(std::string_view owner, std::string_view name) const;

  std::filesystem::path root_;
};

class MemoryBlobStore final : public BlobStore {
 public:
  void Put(std::string_view owner, std::string_view name,
           std::span<const std::uint8_t> bytes) override;
  std::vector<std::uint8_t> Get(std::string_view owner, std::string_view name) const override;

 private:
  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, std::vector<std::uint8_t>> blobs_;
};

}  // namespace sealnode::storage
