/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


#include "chrono.h"

#include "../dflags/dflags.h"
#include "../dflags/gtest_main_with_dflags.h"

using cordon::Exists;
using cordon::Value;

TEST(Time, ParseCivilDateTime) {
  const auto t = cordon::ParseCivilDateTime("2025-01-05 17:30:59");
  ASSERT_TRUE(Exists(t));
  EXPECT_EQ(1736098259000000ll, Value(t).count());
  EXPECT_EQ("2025-01-05 17:30:59", cordon::FormatDateTime(Value(t)));

  EXPECT_EQ(Value(t), Value(cordon::ParseCivilDateTime("2025-01-05T17:30:59")));
  EXPECT_EQ(Value(t), Value(cordon::ParseCivilDateTime(" 2025-01-05 17:30:59.000 ")));
}

TEST(Time, UnparseableIsNull) {
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("   ")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("yesterday")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2025-01-05")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2025-01-05 17:30:59 EST")));
}

TEST(Time, ImpossibleDatesAreNullNotShifted) {
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2024-02-30 10:00:00")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2025-02-29 10:00:00")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2024-04-31T00:00:00")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDateTime("2024-12-31 23:59:60")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDate("2023-02-29")));
  EXPECT_EQ("2024-02-29 10:00:00", cordon::FormatDateTime(Value(cordon::ParseCivilDateTime("2024-02-29 10:00:00"))));
  EXPECT_EQ("2024-02-29", cordon::FormatDate(Value(cordon::ParseCivilDate("2024-02-29"))));
}

TEST(Time, BreakDown) {
  const auto fields = cordon::time::BreakDown(Value(cordon::ParseCivilDateTime("2024-03-10 02:15:00")));
  EXPECT_EQ(2024, fields.year);
  EXPECT_EQ(3, fields.month);
  EXPECT_EQ(10, fields.day);
  // The hour that does not exist in New York local time is kept as written.
  EXPECT_EQ(2, fields.hour);
  // Sunday.
  EXPECT_EQ(0, fields.weekday);

  EXPECT_EQ(6, cordon::time::BreakDown(Value(cordon::ParseCivilDateTime("2025-02-01 23:59:59"))).weekday);
}

TEST(Time, Formats) {
  const auto t = Value(cordon::ParseCivilDateTime("2023-12-31 23:59:59"));
  EXPECT_EQ("2023-12", cordon::FormatYearMonth(t));
  EXPECT_EQ("2023-12-31", cordon::FormatDate(t));
  EXPECT_EQ("2025-07", cordon::FormatYearMonth(2025, 7));
  EXPECT_EQ(Value(cordon::ParseCivilDate("2023-12-31")), Value(cordon::ParseCivilDateTime("2023-12-31 00:00:00")));
  EXPECT_FALSE(Exists(cordon::ParseCivilDate("2023-12")));
}

TEST(Time, NowIsMonotonic) {
  const auto a = cordon::time::Now();
  const auto b = cordon::time::Now();
  EXPECT_LT(a, b);
}
