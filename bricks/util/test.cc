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


#include <string>

#include "optional.h"
#include "singleton.h"

#include "../exception.h"

#include "../dflags/dflags.h"
#include "../dflags/gtest_main_with_dflags.h"

using cordon::Exists;
using cordon::NoValueException;
using cordon::Optional;
using cordon::Value;

TEST(Util, OptionalHoldsAValueOrNothing) {
  Optional<double> surcharge;
  EXPECT_FALSE(Exists(surcharge));
  ASSERT_THROW(Value(surcharge), NoValueException);
  EXPECT_EQ(-1.0, surcharge.ValueOrDefault(-1.0));

  surcharge = 2.5;
  ASSERT_TRUE(Exists(surcharge));
  EXPECT_EQ(2.5, Value(surcharge));

  surcharge = nullptr;
  EXPECT_FALSE(Exists(surcharge));
}

TEST(Util, OptionalComparison) {
  EXPECT_TRUE(Optional<int>() == Optional<int>(nullptr));
  EXPECT_TRUE(Optional<int>(0) != Optional<int>());
  EXPECT_TRUE(Optional<int>(1) == Optional<int>(1));
  EXPECT_TRUE(Optional<int>(1) != Optional<int>(2));
}

namespace util_test {
struct Counter {
  int value = 0;
};
}  // namespace util_test

TEST(Util, Singleton) {
  ++cordon::Singleton<util_test::Counter>().value;
  ++cordon::Singleton<util_test::Counter>().value;
  EXPECT_EQ(2, cordon::Singleton<util_test::Counter>().value);
}

namespace util_test {
struct SampleException : cordon::Exception {
  using cordon::Exception::Exception;
};
}  // namespace util_test

TEST(Util, ThrownExceptionCarriesItsSite) {
  try {
    CORDON_THROW(util_test::SampleException("Boom."));
  } catch (const cordon::Exception& e) {
    EXPECT_EQ("Boom.", e.OriginalDescription());
    const std::string what = e.what();
    EXPECT_NE(std::string::npos, what.find("test.cc:"));
    EXPECT_EQ("\tBoom.", what.substr(what.length() - 6u));
  }
}
