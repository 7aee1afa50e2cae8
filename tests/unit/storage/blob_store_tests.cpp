#include <cctype>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "storage/blob_store.hpp"

using namespace sealnode;

namespace {

const std::string kOwner = "02" + std::string(64, 'a');
const std::string kOther = "03" + std::string(64, 'b');

std::vector<std::uint8_t> Bytes(const std::string& text) {
  return std::vector<std::uint8_t>(text.begin(), text.end());
}

template <typename Fn>
bool ExpectKind(const char* label, ErrorKind expected, Fn&& fn) {
  try {
    fn();
  } catch (const Error& ex) {
    if (ex.kind == expected) return true;
    std::cerr << label << ": got " << ErrorKindName(ex.kind) << "\n";
    return false;
  }
  std::cerr << label << ": no error\n";
  return false;
}

bool ExerciseStore(const char* label, storage::BlobStore& store) {
  store.Put(kOwner, "wallet.bin", Bytes("first"));
  if (store.Get(kOwner, "wallet.bin") != Bytes("first")) {
    std::cerr << label << ": stored bytes differ\n";
    return false;
  }
  store.Put(kOwner, "wallet.bin", Bytes("second"));
  if (store.Get(kOwner, "wallet.bin") != Bytes("second")) {
    std::cerr << label << ": last write did not win\n";
    return false;
  }
  store.Put(kOwner, "empty", {});
  if (!store.Get(kOwner, "empty").empty()) {
    std::cerr << label << ": empty payload not preserved\n";
    return false;
  }
  if (!ExpectKind(label, ErrorKind::kNotFound, [&] { (void)store.Get(kOther, "wallet.bin"); })) {
    return false;
  }
  if (!ExpectKind(label, ErrorKind::kNotFound, [&] { (void)store.Get(kOwner, "missing"); })) {
    return false;
  }
  const std::vector<std::string> bad_names = {"../escape", ".hidden", "a/b", "",
                                              std::string(129, 'x'), "sp ace"};
  for (const auto& bad : bad_names) {
    if (!ExpectKind(label, ErrorKind::kValidation, [&] { store.Put(kOwner, bad, Bytes("x")); })) {
      std::cerr << label << ": accepted name '" << bad << "'\n";
      return false;
    }
  }
  if (!ExpectKind(label, ErrorKind::kValidation, [&] { store.Put("../../etc", "passwd", Bytes("x")); })) {
    return false;
  }
  if (!ExpectKind(label, ErrorKind::kValidation, [&] { (void)store.Get("02abc", "wallet.bin"); })) {
    return false;
  }
  return true;
}

}  // namespace

int main() {
  {
    storage::MemoryBlobStore memory;
    if (!ExerciseStore("memory", memory)) return 1;
  }

  auto temp_root = std::filesystem::temp_directory_path() / "sealnode-blob-store-test";
  std::filesystem::remove_all(temp_root);
  {
    storage::FileBlobStore files(temp_root);
    if (!ExerciseStore("file", files)) return 1;
    if (!std::filesystem::exists(temp_root / kOwner / "wallet.bin")) {
      std::cerr << "blob not stored under <root>/<owner>/<name>\n";
      return 1;
    }
    if (std::filesystem::exists(temp_root.parent_path() / "escape")) {
      std::cerr << "blob escaped the root directory\n";
      return 1;
    }
  }
  {
    // Reads and writes share one root: a fresh instance sees earlier writes.
    storage::FileBlobStore reopened(temp_root);
    if (reopened.Get(kOwner, "wallet.bin") != Bytes("second")) {
      std::cerr << "blob not readable after reopening\n";
      return 1;
    }
    // Owner keys are case-insensitive hex.
    std::string upper = kOwner;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    if (reopened.Get(upper, "wallet.bin") != Bytes("second")) {
      std::cerr << "owner case changes the blob location\n";
      return 1;
    }
  }
  std::filesystem::remove_all(temp_root);

  std::cout << "blob store tests passed\n";
  return 0;
}
