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

#include "dflags.h"
#include "gtest_main_with_dflags.h"

TEST(DFlags, DefinesAFlag) {
  ::dflags::FlagsManager::DefaultRegisterer local_registerer;
  const ::dflags::FlagsManager::ScopedSingletonInjector local_registerer_scope(local_registerer);
  DEFINE_int32(foo, 42, "");
  static_assert(std::is_same<decltype(FLAGS_foo), int32_t>::value, "");
  EXPECT_EQ(42, FLAGS_foo);
  FLAGS_foo = -1;
  EXPECT_EQ(-1, FLAGS_foo);
}

TEST(DFlags, ParsesAllSpellings) {
  ::dflags::FlagsManager::DefaultRegisterer local_registerer;
  const ::dflags::FlagsManager::ScopedSingletonInjector local_registerer_scope(local_registerer);
  DEFINE_int32(quality_cutoff_year, 2023, "");
  DEFINE_string(output_dir, "out", "");
  DEFINE_bool(parallel_aggregations, true, "");
  DEFINE_double(weight, 0.3, "");
  int argc = 7;
  char p1[] = "./ParsesAllSpellings";
  char p2[] = "-quality_cutoff_year";
  char p3[] = "2020";
  char p4[] = "--output_dir=/tmp/cordon";
  char p5[] = "positional";
  char p6[] = "-parallel_aggregations=false";
  char p7[] = "--weight=0.7";
  char* pp[] = {p1, p2, p3, p4, p5, p6, p7};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  EXPECT_EQ(2020, FLAGS_quality_cutoff_year);
  EXPECT_EQ("/tmp/cordon", FLAGS_output_dir);
  EXPECT_FALSE(FLAGS_parallel_aggregations);
  EXPECT_DOUBLE_EQ(0.7, FLAGS_weight);
  ASSERT_EQ(2, argc);
  EXPECT_EQ("./ParsesAllSpellings", std::string(argv[0]));
  EXPECT_EQ("positional", std::string(argv[1]));
}

TEST(DFlags, UndefinedFlagDeathTest) {
  ::dflags::FlagsManager::DefaultRegisterer local_registerer;
  const ::dflags::FlagsManager::ScopedSingletonInjector local_registerer_scope(local_registerer);
  int argc = 2;
  char p1[] = "./UndefinedFlagDeathTest";
  char p2[] = "--no_such_flag=1";
  char* pp[] = {p1, p2};
  char** argv = pp;
  ASSERT_DEATH(ParseDFlags(&argc, &argv), "Undefined flag: 'no_such_flag'\\.");
}

TEST(DFlags, UnparseableValueDeathTest) {
  ::dflags::FlagsManager::DefaultRegisterer local_registerer;
  const ::dflags::FlagsManager::ScopedSingletonInjector local_registerer_scope(local_registerer);
  DEFINE_int32(policy_cutoff_year, 2024, "");
  int argc = 2;
  char p1[] = "./UnparseableValueDeathTest";
  char p2[] = "--policy_cutoff_year=next";
  char* pp[] = {p1, p2};
  char** argv = pp;
  ASSERT_DEATH(ParseDFlags(&argc, &argv), "Can not parse 'next' for flag 'policy_cutoff_year'\\.");
}

TEST(DFlags, MultipleCallsToParseDFlagsDeathTest) {
  ::dflags::FlagsManager::DefaultRegisterer local_registerer;
  const ::dflags::FlagsManager::ScopedSingletonInjector local_registerer_scope(local_registerer);
  int argc = 1;
  char p1[] = "./MultipleCallsToParseDFlagsDeathTest";
  char* pp[] = {p1};
  char** argv = pp;
  ParseDFlags(&argc, &argv);
  ASSERT_DEATH(ParseDFlags(&argc, &argv), "ParseDFlags\\(\\) is called more than once\\.");
}
