#include "crypto/keyfile.hpp"

#include <array>
#include <string>
#include <vector>

#include "core/error.hpp"
#include "nlohmann/json.hpp"
#include "util/aead.hpp"
#include "util/atomic_file.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"

namespace sealnode::crypto {

namespace {

constexpr int kKeyFileVersion = 1;
constexpr std::size_t kSaltSize = 16;
constexpr std::string_view kAad = "sealnode-identity-key-v1";

std::span<const std::uint8_t> AadBytes() {
  return {reinterpret_cast<const std::uint8_t*>(kAad.data()), kAad.size()};
}

util::DerivedKey DeriveFileKey(std::string_view passphrase, std::span<const std::uint8_t> salt,
                               const util::Argon2idParams& params) {
  util::DerivedKey key{};
  std::string error;
  if (!util::DeriveKeyArgon2id(passphrase, salt, params, &key, &error)) {
    ThrowError(ErrorKind::kStorage, "key file: " + error);
  }
  return key;
}

std::vector<std::uint8_t> HexField(const nlohmann::json& doc, const char* name) {
  std::vector<std::uint8_t> out;
  if (!doc.contains(name) || !doc[name].is_string() ||
      !util::HexDecode(doc[name].get<std::string>(), &out)) {
    ThrowError(ErrorKind::kStorage, std::string("key file: bad field '") + name + "'");
  }
  return out;
}

}  // namespace

void WriteKeyFile(const std::filesystem::path& path, const PrivateKey& key,
                  std::string_view passphrase, const util::Argon2idParams& params) {
  const auto salt = util::SecureRandomBytes(kSaltSize);
  const auto nonce = util::SecureRandomBytes(util::kChaCha20Poly1305NonceSize);
  auto file_key = DeriveFileKey(passphrase, salt, params);
  const auto sealed = util::ChaCha20Poly1305Encrypt(file_key, nonce, AadBytes(), key.Secret());
  util::SecureWipe(file_key);

  nlohmann::json doc = {
      {"version", kKeyFileVersion},
      {"kdf", "argon2id"},
      {"t_cost", params.t_cost},
      {"m_cost_kib", params.m_cost_kib},
      {"parallelism", params.parallelism},
      {"salt", util::HexEncode(salt)},
      {"nonce", util::HexEncode(nonce)},
      {"ciphertext", util::HexEncode(sealed)},
      {"public_key", key.Public().ToHex()},
  };
  std::string error;
  if (!util::AtomicWriteFileText(path, doc.dump(2) + "\n", &error)) {
    ThrowError(ErrorKind::kStorage, "failed to write key file " + path.string() + ": " + error);
  }
}

PrivateKey ReadKeyFile(const std::filesystem::path& path, std::string_view passphrase) {
  std::vector<std::uint8_t> raw;
  std::string error;
  if (!util::ReadFileBytes(path, &raw, &error)) {
    if (error.empty()) {
      ThrowError(ErrorKind::kNotFound, "key file not found: " + path.string());
    }
    ThrowError(ErrorKind::kStorage, error);
  }
  nlohmann::json doc;
  try {
    doc = nlohmann::json::parse(raw.begin(), raw.end());
  } catch (const nlohmann::json::exception& ex) {
    ThrowError(ErrorKind::kStorage, std::string("key file is not JSON: ") + ex.what());
  }
  if (doc.value("version", 0) != kKeyFileVersion || doc.value("kdf", "") != "argon2id") {
    ThrowError(ErrorKind::kStorage, "unsupported key file format");
  }
  util::Argon2idParams params;
  params.t_cost = doc.value("t_cost", params.t_cost);
  params.m_cost_kib = doc.value("m_cost_kib", params.m_cost_kib);
  params.parallelism = doc.value("parallelism", params.parallelism);
  const auto salt = HexField(doc, "salt");
  const auto nonce = HexField(doc, "nonce");
  const auto sealed = HexField(doc, "ciphertext");
  if (nonce.size() != util::kChaCha20Poly1305NonceSize) {
    ThrowError(ErrorKind::kStorage, "key file: bad nonce length");
  }

  auto file_key = DeriveFileKey(passphrase, salt, params);
  std::vector<std::uint8_t> secret;
  const bool opened = util::ChaCha20Poly1305Decrypt(file_key, nonce, AadBytes(), sealed, &secret);
  util::SecureWipe(file_key);
  if (!opened) {
    ThrowError(ErrorKind::kInvalidKey, "key file passphrase is incorrect");
  }
  try {
    auto key = PrivateKey::FromBytes(secret);
    util::SecureWipe(secret);
    return key;
  } catch (const Error&) {
    util::SecureWipe(secret);
    throw;
  }
}

}  // namespace sealnode::crypto
