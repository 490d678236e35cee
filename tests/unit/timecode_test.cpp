#include "internal/util/timecode.hpp"

#include <cassert>
#include <cmath>
#include <iostream>

namespace {

using mediaforge::util::FormatSeconds;
using mediaforge::util::ParseTimecode;

bool Near(std::optional<double> value, double expected) {
  return value && std::fabs(*value - expected) < 1e-9;
}

void TestAcceptedForms() {
  assert(Near(ParseTimecode("0:02"), 2.0));
  assert(Near(ParseTimecode("01:30"), 90.0));
  assert(Near(ParseTimecode("1:00:00"), 3600.0));
  assert(Near(ParseTimecode("00:00:02.5"), 2.5));
  assert(Near(ParseTimecode("42"), 42.0));
  assert(Near(ParseTimecode("7.25"), 7.25));
  assert(Near(ParseTimecode("  0:10 "), 10.0));
}

void TestRejectedForms() {
  assert(!ParseTimecode(""));
  assert(!ParseTimecode("abc"));
  assert(!ParseTimecode("1:75"));
  assert(!ParseTimecode("1:2:3:4"));
  assert(!ParseTimecode("-5"));
  assert(!ParseTimecode("1.5:30"));
  assert(!ParseTimecode("1::2"));
  assert(!ParseTimecode("."));
}

void TestFormatSeconds() {
  assert(FormatSeconds(12.5) == "12.500");
  assert(FormatSeconds(0.0) == "0.000");
  assert(FormatSeconds(-1.0) == "0.000");
}

} // namespace

int main() {
  TestAcceptedForms();
  TestRejectedForms();
  TestFormatSeconds();

  std::cout << "mediaforge_unit_timecode: pass\n";
  return 0;
}
