#include "invoice/invoice.hpp"

#include <charconv>

#include "core/error.hpp"

namespace sealnode::invoice {

namespace {

constexpr std::string_view kScheme = "rgb:";
constexpr std::string_view kExpiryParam = "expiry=";

template <typename T>
bool ParseInteger(std::string_view text, T* out) {
  if (text.empty()) return false;
  const auto* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, *out);
  return ec == std::errc() && ptr == end;
}

[[noreturn]] void Malformed(const std::string& what) {
  ThrowError(ErrorKind::kValidation, "malformed invoice: " + what);
}

}  // namespace

std::string Invoice::ToString() const {
  std::string out(kScheme);
  out += contract::ContractIdToString(contract_id);
  out += '/';
  out += iface;
  out += '/';
  out += std::to_string(amount);
  out += '+';
  out += beneficiary.ToString();
  if (expiry) {
    out += '?';
    out += kExpiryParam;
    out += std::to_string(*expiry);
  }
  return out;
}

Invoice ParseInvoice(std::string_view text) {
  if (text.substr(0, kScheme.size()) != kScheme) {
    Malformed("missing rgb: prefix");
  }
  text.remove_prefix(kScheme.size());

  Invoice invoice;
  const auto query = text.find('?');
  if (query != std::string_view::npos) {
    const auto param = text.substr(query + 1);
    if (param.substr(0, kExpiryParam.size()) != kExpiryParam) {
      Malformed("unsupported query parameter");
    }
    std::int64_t expiry = 0;
    if (!ParseInteger(param.substr(kExpiryParam.size()), &expiry) || expiry < 0) {
      Malformed("invalid expiry");
    }
    invoice.expiry = expiry;
    text = text.substr(0, query);
  }

  const auto first = text.find('/');
  const auto second = first == std::string_view::npos ? first : text.find('/', first + 1);
  const auto plus = second == std::string_view::npos ? second : text.find('+', second + 1);
  if (plus == std::string_view::npos) {
    Malformed("expected <contract>/<iface>/<amount>+<seal>");
  }
  invoice.contract_id = contract::ParseContractId(text.substr(0, first));
  invoice.iface = std::string(text.substr(first + 1, second - first - 1));
  if (invoice.iface.empty()) {
    Malformed("empty interface");
  }
  if (!ParseInteger(text.substr(second + 1, plus - second - 1), &invoice.amount) ||
      invoice.amount == 0) {
    Malformed("amount must be a positive integer");
  }
  try {
    invoice.beneficiary = seal::ConcealedSeal::Parse(text.substr(plus + 1));
  } catch (const Error& ex) {
    Malformed(ex.what());
  }
  return invoice;
}

}  // namespace sealnode::invoice
