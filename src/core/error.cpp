#include "core/error.hpp"

namespace sealnode {

std::string_view ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kValidation:
      return "validation_error";
    case ErrorKind::kSeal:
      return "seal_error";
    case ErrorKind::kInsufficientFunds:
      return "insufficient_funds";
    case ErrorKind::kInvoiceAlreadyUsed:
      return "invoice_already_used";
    case ErrorKind::kInvoiceExpired:
      return "invoice_expired";
    case ErrorKind::kSigning:
      return "signing_error";
    case ErrorKind::kRejectedTransfer:
      return "rejected_transfer";
    case ErrorKind::kNotFound:
      return "not_found";
    case ErrorKind::kInvalidKey:
      return "invalid_key";
    case ErrorKind::kStorage:
      return "storage_error";
  }
  return "unknown";
}

}  // namespace sealnode
