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


#include <map>
#include <set>
#include <string>
#include <vector>

#include "strings.h"

#include "../dflags/dflags.h"
#include "../dflags/gtest_main_with_dflags.h"

using cordon::strings::EmptyFields;
using cordon::strings::Join;
using cordon::strings::Printf;
using cordon::strings::Split;
using cordon::strings::Trim;
using cordon::strings::TryFromString;

TEST(Strings, Printf) {
  EXPECT_EQ("Test: 42, 'Hello', 0000ABBA", Printf("Test: %d, '%s', %08X", 42, "Hello", 0xabba));
  EXPECT_EQ(5000u, Printf("%s", std::string(5000, 'A').c_str()).length());
  EXPECT_EQ("", Printf("%s", ""));
}

TEST(Strings, Trim) {
  EXPECT_EQ("foo", Trim("  foo \t\r\n"));
  EXPECT_EQ("", Trim("   "));
  EXPECT_EQ("a b", Trim(std::string(" a b ")));
}

TEST(Strings, ToStringAndFromString) {
  EXPECT_EQ("42", cordon::ToString(42));
  EXPECT_EQ("true", cordon::ToString(true));
  EXPECT_EQ("x", cordon::ToString('x'));
  EXPECT_EQ("text", cordon::ToString(std::string("text")));

  EXPECT_EQ(161, cordon::FromString<int>("161"));
  EXPECT_DOUBLE_EQ(2.5, cordon::FromString<double>(" 2.5 "));
  EXPECT_EQ(0, cordon::FromString<int>(""));
  EXPECT_EQ(0, cordon::FromString<int>("12.5"));
  EXPECT_DOUBLE_EQ(0.0, cordon::FromString<double>("1.5 miles"));

  int x = -1;
  EXPECT_FALSE(TryFromString("abc", x));
  EXPECT_EQ(-1, x);
  EXPECT_TRUE(TryFromString("-7", x));
  EXPECT_EQ(-7, x);

  bool b = false;
  EXPECT_TRUE(TryFromString("1", b));
  EXPECT_TRUE(b);
  EXPECT_TRUE(TryFromString("false", b));
  EXPECT_FALSE(b);
  EXPECT_FALSE(TryFromString("yes", b));
}

TEST(Strings, Split) {
  EXPECT_EQ(std::vector<std::string>({"2024", "2025"}), Split("2024,2025", ','));
  EXPECT_EQ(std::vector<std::string>({"2024", "2025"}), Split(",2024,,2025,", ','));
  EXPECT_EQ(std::vector<std::string>({"", "2024", "", "2025", ""}), Split(",2024,,2025,", ',', EmptyFields::Keep));
  EXPECT_EQ(std::vector<std::string>(), Split("", ','));

  std::vector<std::string> chunks;
  EXPECT_EQ(3u, Split("a;b;c", ';', [&chunks](std::string&& s) { chunks.push_back(s); }));
  EXPECT_EQ("a b c", Join(chunks, ' '));
}

TEST(Strings, Join) {
  EXPECT_EQ("", Join(std::vector<std::string>(), ","));
  EXPECT_EQ("one", Join(std::vector<std::string>({"one"}), ","));
  EXPECT_EQ("a, b", Join(std::set<std::string>({"b", "a"}), ", "));
}
