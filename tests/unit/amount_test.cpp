#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>

#include "internal/util/amount.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/identity.hpp"
#include "support/ledger_fixture.hpp"

namespace {

using acp::testing::Throws;
using acp::util::FormatUnits;
using acp::util::InvalidArgument;
using acp::util::ParseUnits;

void TestFormatUnitsTrimsTrailingZeros() {
  assert(FormatUnits(12'500'000, 6) == "12.5");
  assert(FormatUnits(1'000'000, 6) == "1");
  assert(FormatUnits(1, 6) == "0.000001");
  assert(FormatUnits(0, 6) == "0");
  assert(FormatUnits(42, 0) == "42");
}

void TestParseUnitsScalesToBaseUnits() {
  assert(ParseUnits("12.5", 6) == 12'500'000);
  assert(ParseUnits("100", 6) == 100'000'000);
  assert(ParseUnits("0.000001", 6) == 1);
  assert(ParseUnits(".5", 6) == 500'000);
  assert(ParseUnits("7", 0) == 7);
}

void TestParseUnitsRejectsMalformedInput() {
  assert(Throws<InvalidArgument>([] { ParseUnits("", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits(".", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("-1", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("+1", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("1.2.3", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("12abc", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("0.0000001", 6); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("18446744073709551616", 0); }));
  assert(Throws<InvalidArgument>([] { ParseUnits("18446744073710", 6); }));
}

void TestCheckedArithmeticThrowsOnOverflow() {
  constexpr auto kMax = std::numeric_limits<uint64_t>::max();
  assert(acp::util::CheckedAdd(kMax - 1, 1, "sum") == kMax);
  assert(Throws<InvalidArgument>([] { acp::util::CheckedAdd(kMax, 1, "sum"); }));
  assert(Throws<InvalidArgument>([] { acp::util::CheckedMul(kMax / 2 + 1, 2, "product"); }));
  assert(Throws<InvalidArgument>([] { acp::util::UnitScale(20); }));
  assert(acp::util::UnitScale(19) == 10'000'000'000'000'000'000ULL);
}

void TestZeroIdentities() {
  assert(acp::util::IsZeroIdentity(""));
  assert(acp::util::IsZeroIdentity("0x0000000000000000000000000000000000000000"));
  assert(!acp::util::IsZeroIdentity("0x0000000000000000000000000000000000000001"));
  assert(!acp::util::IsZeroIdentity("alice"));
}

} // namespace

int main() {
  TestFormatUnitsTrimsTrailingZeros();
  TestParseUnitsScalesToBaseUnits();
  TestParseUnitsRejectsMalformedInput();
  TestCheckedArithmeticThrowsOnOverflow();
  TestZeroIdentities();

  std::cout << "acp_unit_amount: pass\n";
  return 0;
}
