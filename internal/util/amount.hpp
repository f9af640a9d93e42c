#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace acp::util {

/*
  Conversion between base units and decimal token strings.

  FormatUnits(12500000, 6) == "12.5"
  ParseUnits("12.5", 6)    == 12500000

  ParseUnits throws InvalidArgument for empty input, signs, stray
  characters, more fractional digits than `decimals` and overflow.
*/
std::string FormatUnits(uint64_t amount, uint32_t decimals);
uint64_t    ParseUnits(std::string_view text, uint32_t decimals);

// 10^decimals; throws InvalidArgument when it does not fit in 64 bits.
uint64_t UnitScale(uint32_t decimals);

// a + b, throwing InvalidArgument on overflow.
uint64_t CheckedAdd(uint64_t a, uint64_t b, const char* what);
uint64_t CheckedMul(uint64_t a, uint64_t b, const char* what);

} // namespace acp::util
