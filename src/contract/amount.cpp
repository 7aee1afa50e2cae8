#include "contract/amount.hpp"

#include <cctype>

#include "core/error.hpp"

namespace sealnode::contract {

namespace {

bool MultiplyAdd(AssetAmount value, unsigned digit, AssetAmount* out) {
  if (value > (std::numeric_limits<AssetAmount>::max() - digit) / 10) {
    return false;
  }
  *out = value * 10 + digit;
  return true;
}

}  // namespace

std::string FormatAmount(AssetAmount atomic, std::uint8_t precision) {
  std::string digits = std::to_string(atomic);
  if (precision == 0) {
    return digits;
  }
  if (digits.size() <= precision) {
    digits.insert(0, precision - digits.size() + 1, '0');
  }
  digits.insert(digits.size() - precision, 1, '.');
  return digits;
}

AssetAmount ParseDecimalAmount(std::string_view text, std::uint8_t precision) {
  if (text.empty()) {
    ThrowError(ErrorKind::kValidation, "amount is empty");
  }
  const auto dot = text.find('.');
  const std::string_view whole = text.substr(0, dot);
  const std::string_view fraction =
      dot == std::string_view::npos ? std::string_view() : text.substr(dot + 1);
  if (whole.empty() || (dot != std::string_view::npos && fraction.empty())) {
    ThrowError(ErrorKind::kValidation, "malformed amount '" + std::string(text) + "'");
  }
  if (fraction.size() > precision) {
    ThrowError(ErrorKind::kValidation, "amount '" + std::string(text) + "' has more than " +
                                           std::to_string(precision) + " decimal places");
  }
  AssetAmount value = 0;
  auto push_digits = [&](std::string_view digits) {
    for (char c : digits) {
      if (!std::isdigit(static_cast<unsigned char>(c)) ||
          !MultiplyAdd(value, static_cast<unsigned>(c - '0'), &value)) {
        ThrowError(ErrorKind::kValidation, "malformed amount '" + std::string(text) + "'");
      }
    }
  };
  push_digits(whole);
  push_digits(fraction);
  for (std::size_t i = fraction.size(); i < precision; ++i) {
    if (!MultiplyAdd(value, 0, &value)) {
      ThrowError(ErrorKind::kValidation, "amount '" + std::string(text) + "' overflows");
    }
  }
  return value;
}

}  // namespace sealnode::contract
