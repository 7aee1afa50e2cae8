#pragma once

#include <cstdint>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace sealnode::primitives {

struct COutPoint {
  Hash256 txid{};
  std::uint32_t index{0};
  bool operator==(const COutPoint& other) const = default;
};

struct CTxIn {
  COutPoint prevout{};
  std::vector<std::uint8_t> script_sig{};
  std::vector<std::vector<std::uint8_t>> witness{};
  std::uint32_t sequence{0xFFFFFFFD};  // opt-in RBF
};

struct CTxOut {
  Amount value{0};
  std::vector<std::uint8_t> script_pubkey{};
};

struct CTransaction {
  std::uint32_t version{2};
  std::vector<CTxIn> vin{};
  std::vector<CTxOut> vout{};
  std::uint32_t lock_time{0};

  [[nodiscard]] bool HasWitness() const noexcept {
    for (const auto& in : vin) {
      if (!in.witness.empty()) return true;
    }
    return false;
  }
};

}  // namespace sealnode::primitives
