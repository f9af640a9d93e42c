#include "amount.hpp"

#include <limits>

#include "internal/util/errors.hpp"

namespace acp::util {

uint64_t CheckedAdd(uint64_t a, uint64_t b, const char* what) {
  if (b > std::numeric_limits<uint64_t>::max() - a) {
    throw InvalidArgument(std::string(what) + " overflows");
  }
  return a + b;
}

uint64_t CheckedMul(uint64_t a, uint64_t b, const char* what) {
  if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
    throw InvalidArgument(std::string(what) + " overflows");
  }
  return a * b;
}

uint64_t UnitScale(uint32_t decimals) {
  uint64_t scale = 1;
  for (uint32_t i = 0; i < decimals; ++i) {
    scale = CheckedMul(scale, 10, "decimals");
  }
  return scale;
}

std::string FormatUnits(uint64_t amount, uint32_t decimals) {
  const uint64_t scale = UnitScale(decimals);
  std::string    out   = std::to_string(amount / scale);

  uint64_t frac = amount % scale;
  if (frac == 0) {
    return out;
  }

  std::string digits = std::to_string(frac);
  digits.insert(0, decimals - digits.size(), '0');
  while (!digits.empty() && digits.back() == '0') {
    digits.pop_back();
  }
  return out + "." + digits;
}

uint64_t ParseUnits(std::string_view text, uint32_t decimals) {
  if (text.empty()) {
    throw InvalidArgument("amount is empty");
  }

  const auto dot = text.find('.');
  const auto whole = text.substr(0, dot);
  const auto frac  = dot == std::string_view::npos ? std::string_view{} : text.substr(dot + 1);

  if (whole.empty() && frac.empty()) {
    throw InvalidArgument("amount has no digits: " + std::string(text));
  }
  if (frac.size() > decimals) {
    throw InvalidArgument("amount has more than " + std::to_string(decimals) + " fractional digits: " + std::string(text));
  }

  auto accumulate = [&](std::string_view digits, uint64_t value) {
    for (char c : digits) {
      if (c < '0' || c > '9') {
        throw InvalidArgument("invalid amount: " + std::string(text));
      }
      value = CheckedAdd(CheckedMul(value, 10, "amount"), static_cast<uint64_t>(c - '0'), "amount");
    }
    return value;
  };

  uint64_t value = accumulate(whole, 0);
  value          = accumulate(frac, value);
  for (size_t i = frac.size(); i < decimals; ++i) {
    value = CheckedMul(value, 10, "amount");
  }
  return value;
}

} // namespace acp::util
