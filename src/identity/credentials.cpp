#include "identity/credentials.hpp"

#include "core/error.hpp"
#include "crypto/keyfile.hpp"
#include "util/logging.hpp"

namespace sealnode::identity {

RequestCredentials::RequestCredentials(std::string_view bearer)
    : key_(crypto::PrivateKey::FromHex(bearer)) {}

Credentials RequestCredentials::Acquire() const { return Credentials{key_, key_.Public().ToHex()}; }

KeyFileCredentials KeyFileCredentials::Load(const std::filesystem::path& path,
                                            std::string_view passphrase, bool create_if_missing) {
  try {
    return KeyFileCredentials(crypto::ReadKeyFile(path, passphrase));
  } catch (const Error& ex) {
    if (ex.kind != ErrorKind::kNotFound || !create_if_missing) {
      throw;
    }
  }
  auto key = crypto::PrivateKey::Generate();
  crypto::WriteKeyFile(path, key, passphrase);
  util::LogInfo("identity: created server key " + key.Public().ToHex() + " at " + path.string());
  return KeyFileCredentials(std::move(key));
}

Credentials KeyFileCredentials::Acquire() const { return Credentials{key_, key_.Public().ToHex()}; }

}  // namespace sealnode::identity
