#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

#include "ledger/identity_ledger.hpp"

namespace sealnode::ledger {

// Per-identity ledgers keyed by compressed public key hex. Writers of one
// identity are serialized; readers get a consistent copy and never observe a
// half-applied update.
class IdentityStore {
 public:
  using SaverFn = bool (*)(const std::filesystem::path& path, const IdentityLedger& ledger,
                           std::string* error);

  // An empty `data_dir` keeps everything in memory.
  explicit IdentityStore(std::filesystem::path data_dir = {});

  IdentityLedger Read(const std::string& identity) const;

  // Runs `fn` on a private copy of the identity's ledger while holding its
  // write lock. The copy is persisted and published only when `fn` returns
  // true; if `fn` throws, or returns false, the stored ledger is untouched.
  // Returns what `fn` returned. Persistence failures throw Error(kStorage).
  bool Transact(const std::string& identity, const std::function<bool(IdentityLedger&)>& fn);

  std::vector<std::string> Identities() const;

  // Test-only hook: replaces how ledgers are written so tests can simulate
  // IO failures.
  void SetSaverForTest(SaverFn saver);

 private:
  struct Slot {
    mutable std::shared_mutex mutex;
    bool loaded{false};
    IdentityLedger ledger;
  };

  std::shared_ptr<Slot> SlotFor(const std::string& identity) const;
  void EnsureLoadedLocked(const std::string& identity, Slot* slot) const;
  std::filesystem::path LedgerPath(const std::string& identity) const;

  std::filesystem::path data_dir_;
  mutable std::mutex slots_mutex_;
  mutable std::map<std::string, std::shared_ptr<Slot>> slots_;
  SaverFn saver_;
};

bool SaveLedgerFile(const std::filesystem::path& path, const IdentityLedger& ledger,
                    std::string* error);
// Returns std::nullopt when no file exists. Throws Error(kStorage) otherwise
// on failure.
std::optional<IdentityLedger> LoadLedgerFile(const std::filesystem::path& path);

}  // namespace sealnode::ledger
