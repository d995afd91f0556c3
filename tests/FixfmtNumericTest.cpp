//===- FixfmtNumericTest.cpp ----------------------------------------===//
//
// Copyright (C) 2024 Eightfold
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
//     limitations under the License.
//
//===----------------------------------------------------------------===//

#include <Fixfmt.hpp>
#include <gtest/gtest.h>
#include <cfloat>
#include <cmath>
#include <cstdlib>
#include <limits>
#include <string>

using namespace ffmt;

namespace {

template <typename...TT>
std::string render(StrView Str, const TT&...Args) {
  FixedBuf<512> Buf;
  const FmtResult Res = Buf.format(Str, Args...);
  EXPECT_TRUE(Res.isOk()) << Str << ": " << getErrorName(Res.getError());
  EXPECT_FALSE(Res.isTruncated()) << Str;
  return std::string(Buf.str());
}

//======================================================================//
// Integers
//======================================================================//

TEST(IntFormatTest, Decimal) {
  EXPECT_EQ(render("{}", 0), "0");
  EXPECT_EQ(render("{}", 7), "7");
  EXPECT_EQ(render("{}", -123), "-123");
  EXPECT_EQ(render("{}", 100u), "100");
  EXPECT_EQ(render("{}", 9999999999LL), "9999999999");
  EXPECT_EQ(render("{}", std::uint8_t(255)), "255");
  EXPECT_EQ(render("{}", std::int8_t(-128)), "-128");
}

TEST(IntFormatTest, Extremes) {
  EXPECT_EQ(render("{}", std::numeric_limits<std::int64_t>::min()),
    "-9223372036854775808");
  EXPECT_EQ(render("{}", std::numeric_limits<std::int64_t>::max()),
    "9223372036854775807");
  EXPECT_EQ(render("{}", std::numeric_limits<std::uint64_t>::max()),
    "18446744073709551615");
  EXPECT_EQ(render("{}", std::numeric_limits<std::int32_t>::min()),
    "-2147483648");
}

TEST(IntFormatTest, PowersOfTen) {
  std::uint64_t Value = 1;
  std::string Expected = "1";
  for (int Ix = 0; Ix < 19; ++Ix) {
    EXPECT_EQ(render("{}", Value), Expected);
    EXPECT_EQ(render("{}", Value - 1), std::to_string(Value - 1));
    Value *= 10;
    Expected += '0';
  }
}

TEST(IntFormatTest, Radix) {
  EXPECT_EQ(render("{:x}", 255), "ff");
  EXPECT_EQ(render("{:X}", 255), "FF");
  EXPECT_EQ(render("{:o}", 8), "10");
  EXPECT_EQ(render("{:b}", 5), "101");
  EXPECT_EQ(render("{:b}", 0), "0");
  EXPECT_EQ(render("{:x}", 0xDEADBEEFu), "deadbeef");
  EXPECT_EQ(render("{:o}", std::numeric_limits<std::uint64_t>::max()),
    "1777777777777777777777");
  EXPECT_EQ(render("{:b}", std::numeric_limits<std::uint64_t>::max()),
    std::string(64, '1'));
}

TEST(IntFormatTest, AlternateForm) {
  EXPECT_EQ(render("{:#x}", 255), "0xff");
  EXPECT_EQ(render("{:#X}", 255), "0xFF");
  EXPECT_EQ(render("{:#o}", 8), "0o10");
  EXPECT_EQ(render("{:#b}", 2), "0b10");
  // No prefix in decimal.
  EXPECT_EQ(render("{:#}", 10), "10");
}

TEST(IntFormatTest, NegativeRadixIsTwosComplement) {
  EXPECT_EQ(render("{:x}", std::int32_t(-1)), "ffffffff");
  EXPECT_EQ(render("{:x}", std::int64_t(-1)), "ffffffffffffffff");
  EXPECT_EQ(render("{:x}", std::int16_t(-1)), "ffff");
  EXPECT_EQ(render("{:#b}", std::int8_t(-2)), "0b11111110");
  EXPECT_EQ(render("{:X}", std::int32_t(-123)), "FFFFFF85");
}

TEST(IntFormatTest, Sign) {
  EXPECT_EQ(render("{:+}", 5), "+5");
  EXPECT_EQ(render("{:+}", -5), "-5");
  EXPECT_EQ(render("{:+}", 0), "+0");
  EXPECT_EQ(render("{:-}", 5), "5");
  EXPECT_EQ(render("{:+#x}", 255), "+0xff");
}

TEST(IntFormatTest, WidthAndAlignment) {
  EXPECT_EQ(render("{:6}", 42), "    42");
  EXPECT_EQ(render("{:<6}", 42), "42    ");
  EXPECT_EQ(render("{:^7}", 42), "  42   ");
  EXPECT_EQ(render("{:*>6}", -7), "****-7");
  EXPECT_EQ(render("{:2}", 12345), "12345");
}

TEST(IntFormatTest, ZeroPadding) {
  EXPECT_EQ(render("{:05}", 42), "00042");
  EXPECT_EQ(render("{:05}", -42), "-0042");
  EXPECT_EQ(render("{:+05}", 42), "+0042");
  EXPECT_EQ(render("{:#010x}", 255), "0x000000ff");
  EXPECT_EQ(render("{:03}", 12345), "12345");
}

//======================================================================//
// Floats
//======================================================================//

TEST(FloatFormatTest, DefaultPrecision) {
  EXPECT_EQ(render("{}", 1.5), "1.500000");
  EXPECT_EQ(render("{}", 0.0), "0.000000");
  EXPECT_EQ(render("{}", 1.0 / 3.0), "0.333333");
  EXPECT_EQ(render("{}", -2.0), "-2.000000");
}

TEST(FloatFormatTest, Precision) {
  EXPECT_EQ(render("{:.2}", 42.3456), "42.35");
  EXPECT_EQ(render("{:.3}", 123.456), "123.456");
  EXPECT_EQ(render("{:.0}", 3.14159), "3");
  EXPECT_EQ(render("{:.1}", -1.5), "-1.5");
  EXPECT_EQ(render("{:.1}", 9007199254740992.0), "9007199254740992.0");
  EXPECT_EQ(render("{:.2}", 1e15 + 0.3), "1000000000000000.25");
}

TEST(FloatFormatTest, RoundsOnExactBinaryValue) {
  // 1.005 and 2.675 are stored slightly below the written value.
  EXPECT_EQ(render("{:.2}", 1.005), "1.00");
  EXPECT_EQ(render("{:.2}", 2.675), "2.67");
  EXPECT_EQ(render("{:.6}", 5e-7), "0.000000");
  EXPECT_EQ(render("{:.6}", 1.5e-6), "0.000002");
}

TEST(FloatFormatTest, TiesRoundToEven) {
  EXPECT_EQ(render("{:.2}", 0.125), "0.12");
  EXPECT_EQ(render("{:.2}", 0.375), "0.38");
  EXPECT_EQ(render("{:.0}", 0.5), "0");
  EXPECT_EQ(render("{:.0}", 1.5), "2");
  EXPECT_EQ(render("{:.0}", 2.5), "2");
  EXPECT_EQ(render("{:.0}", 3.5), "4");
  EXPECT_EQ(render("{:.1}", 2.25), "2.2");
  EXPECT_EQ(render("{:.1}", -2.75), "-2.8");
}

TEST(FloatFormatTest, CarriesIntoIntegerPart) {
  EXPECT_EQ(render("{:.2}", 9.9999), "10.00");
  EXPECT_EQ(render("{:.2}", 0.999), "1.00");
  EXPECT_EQ(render("{:.2}", -0.999), "-1.00");
  EXPECT_EQ(render("{:.1}", 99.96), "100.0");
  EXPECT_EQ(render("{:.3}", 1.2995), "1.300");
}

TEST(FloatFormatTest, LargeIntegers) {
  EXPECT_EQ(render("{:.0}", 1e22), "10000000000000000000000");
  EXPECT_EQ(render("{:.0}", 1e23), "99999999999999991611392");
  EXPECT_EQ(render("{:.0}", std::ldexp(1.0, 70)),
    "1180591620717411303424");
  EXPECT_EQ(render("{:.2}", 4096.0), "4096.00");
}

TEST(FloatFormatTest, LargestDouble) {
  const std::string Out = render("{:.0}", DBL_MAX);
  EXPECT_EQ(Out.size(), 309u);
  EXPECT_EQ(Out.substr(0, 19), "1797693134862315708");
  EXPECT_EQ(render("{:.1}", DBL_MAX).substr(309), ".0");
}

TEST(FloatFormatTest, SmallestSubnormal) {
  const double Tiny = std::numeric_limits<double>::denorm_min();
  EXPECT_EQ(render("{:.324}", Tiny), "0." + std::string(323, '0') + "5");
  EXPECT_EQ(render("{:.323}", Tiny), "0." + std::string(323, '0'));
  EXPECT_EQ(render("{}", Tiny), "0.000000");
}

TEST(FloatFormatTest, ExactExpansions) {
  EXPECT_EQ(render("{:.20}", 0.1), "0.10000000000000000555");
  EXPECT_EQ(render("{:.17}", 0.3), "0.29999999999999999");
  EXPECT_EQ(render("{:.10}", 0.1f), "0.1000000015");
  EXPECT_EQ(render("{:.30}", 0.5), "0.5" + std::string(29, '0'));
}

TEST(FloatFormatTest, SpecialValues) {
  const double Inf = std::numeric_limits<double>::infinity();
  const double NaN = std::numeric_limits<double>::quiet_NaN();
  EXPECT_EQ(render("{}", NaN), "NaN");
  EXPECT_EQ(render("{:+}", NaN), "NaN");
  EXPECT_EQ(render("{}", Inf), "inf");
  EXPECT_EQ(render("{}", -Inf), "-inf");
  EXPECT_EQ(render("{:+}", Inf), "+inf");
  EXPECT_EQ(render("{:.2}", Inf), "inf");
}

TEST(FloatFormatTest, NegativeZero) {
  EXPECT_EQ(render("{}", -0.0), "-0.000000");
  EXPECT_EQ(render("{:.2}", -0.0), "-0.00");
  EXPECT_EQ(render("{:.0}", -0.0), "-0");
  EXPECT_EQ(render("{:.2}", -0.001), "-0.00");
}

TEST(FloatFormatTest, Padding) {
  EXPECT_EQ(render("{:8.2}", 3.14159), "    3.14");
  EXPECT_EQ(render("{:<8.2}", 3.14159), "3.14    ");
  EXPECT_EQ(render("{:08.2}", -1.5), "-0001.50");
  EXPECT_EQ(render("{:+08.1}", 2.5), "+00002.5");
  // Zero padding doesn't apply to NaN and infinity.
  EXPECT_EQ(render("{:08}", -std::numeric_limits<double>::infinity()),
    "    -inf");
  EXPECT_EQ(render("{:06}", std::numeric_limits<double>::quiet_NaN()),
    "   NaN");
}

TEST(FloatFormatTest, ReparsesWithinHalfUnit) {
  const double Values[] {
    0.1, 2.0 / 3.0, 123.456789, -98765.4321, 1e-5,
    3.0000005, -0.0000004, 7.25
  };
  for (double Value : Values) {
    const std::string Out = render("{:.6}", Value);
    const double Back = std::strtod(Out.c_str(), nullptr);
    EXPECT_LE(std::fabs(Back - Value), 0.5e-6 * (1 + 1e-9)) << Out;
  }
}

} // namespace
