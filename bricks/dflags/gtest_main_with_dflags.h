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


// The `main()` for unit tests that define their own flags, ex. `--table_test_tmpdir`.
// "dflags.h" should already be included for this header to do its job.
//
// NOTE: Each `test.cc` includes this header exactly once, and is linked against `gtest`, not `gtest_main`.

#ifndef CORDON_BRICKS_DFLAGS_GTEST_MAIN_WITH_DFLAGS_H
#define CORDON_BRICKS_DFLAGS_GTEST_MAIN_WITH_DFLAGS_H

#include <gtest/gtest.h>

#include "dflags.h"

int main(int argc, char** argv) {
  testing::InitGoogleTest(&argc, argv);
  ParseDFlags(&argc, &argv);
  // Postpone the `Death tests use fork(), which is unsafe particularly in a threaded context.` warning.
  GTEST_FLAG_SET(death_test_style, "threadsafe");
  if (GTEST_FLAG_GET(repeat) != 1) {
    // Break on any error when `--gtest_repeat` is set.
    // Otherwise a failure in one of hundreds or thousands of runs may get unnoticed.
    GTEST_FLAG_SET(break_on_failure, true);
  }
  return RUN_ALL_TESTS();
}

#endif  // CORDON_BRICKS_DFLAGS_GTEST_MAIN_WITH_DFLAGS_H
