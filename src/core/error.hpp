#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace sealnode {

enum class ErrorKind {
  kValidation,
  kSeal,
  kInsufficientFunds,
  kInvoiceAlreadyUsed,
  kInvoiceExpired,
  kSigning,
  kRejectedTransfer,
  kNotFound,
  kInvalidKey,
  kStorage,
};

// Stable identifier reported to API clients ("validation_error", ...).
std::string_view ErrorKindName(ErrorKind kind) noexcept;

struct Error : public std::runtime_error {
  ErrorKind kind;
  Error(ErrorKind k, const std::string& msg) : std::runtime_error(msg), kind(k) {}
};

[[noreturn]] inline void ThrowError(ErrorKind kind, const std::string& msg) {
  throw Error(kind, msg);
}

}  // namespace sealnode
