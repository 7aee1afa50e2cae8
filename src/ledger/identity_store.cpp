#include "ledger/identity_store.hpp"

#include <system_error>

#include "core/error.hpp"
#include "util/atomic_file.hpp"
#include "util/logging.hpp"

namespace sealnode::ledger {

bool SaveLedgerFile(const std::filesystem::path& path, const IdentityLedger& ledger,
                    std::string* error) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  if (ec) {
    if (error) *error = "create " + path.parent_path().string() + ": " + ec.message();
    return false;
  }
  return util::AtomicWriteFileText(path, LedgerToJson(ledger).dump(2), error);
}

std::optional<IdentityLedger> LoadLedgerFile(const std::filesystem::path& path) {
  std::vector<std::uint8_t> bytes;
  std::string error;
  if (!util::ReadFileBytes(path, &bytes, &error)) {
    if (error.empty()) return std::nullopt;
    ThrowError(ErrorKind::kStorage, "ledger: " + error);
  }
  auto json = nlohmann::json::parse(bytes.begin(), bytes.end(), nullptr, false);
  if (json.is_discarded()) {
    ThrowError(ErrorKind::kStorage, "ledger: " + path.string() + " is not valid JSON");
  }
  return LedgerFromJson(json);
}

IdentityStore::IdentityStore(std::filesystem::path data_dir)
    : data_dir_(std::move(data_dir)), saver_(&SaveLedgerFile) {}

void IdentityStore::SetSaverForTest(SaverFn saver) { saver_ = saver; }

std::filesystem::path IdentityStore::LedgerPath(const std::string& identity) const {
  return data_dir_ / "ledger" / (identity + ".json");
}

std::shared_ptr<IdentityStore::Slot> IdentityStore::SlotFor(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  auto& slot = slots_[identity];
  if (!slot) {
    slot = std::make_shared<Slot>();
  }
  return slot;
}

void IdentityStore::EnsureLoadedLocked(const std::string& identity, Slot* slot) const {
  if (slot->loaded) return;
  if (!data_dir_.empty()) {
    if (auto loaded = LoadLedgerFile(LedgerPath(identity))) {
      slot->ledger = std::move(*loaded);
      util::LogDebug("ledger: loaded " + identity.substr(0, 16));
    }
  }
  slot->loaded = true;
}

IdentityLedger IdentityStore::Read(const std::string& identity) const {
  auto slot = SlotFor(identity);
  {
    std::shared_lock<std::shared_mutex> lock(slot->mutex);
    if (slot->loaded) {
      return slot->ledger;
    }
  }
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  EnsureLoadedLocked(identity, slot.get());
  return slot->ledger;
}

bool IdentityStore::Transact(const std::string& identity,
                             const std::function<bool(IdentityLedger&)>& fn) {
  auto slot = SlotFor(identity);
  std::unique_lock<std::shared_mutex> lock(slot->mutex);
  EnsureLoadedLocked(identity, slot.get());

  IdentityLedger draft = slot->ledger;
  if (!fn(draft)) {
    return false;
  }
  if (!data_dir_.empty()) {
    std::string error;
    if (!saver_(LedgerPath(identity), draft, &error)) {
      util::LogError("ledger", "persist failed: " + error);
      ThrowError(ErrorKind::kStorage, "failed to persist identity ledger");
    }
  }
  slot->ledger = std::move(draft);
  return true;
}

std::vector<std::string> IdentityStore::Identities() const {
  std::lock_guard<std::mutex> lock(slots_mutex_);
  std::vector<std::string> out;
  out.reserve(slots_.size());
  for (const auto& [identity, slot] : slots_) out.push_back(identity);
  return out;
}

}  // namespace sealnode::ledger
