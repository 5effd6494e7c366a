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


#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include "log.h"

#include "../strings/split.h"

#include "../dflags/dflags.h"
#include "../dflags/gtest_main_with_dflags.h"

TEST(Log, SilentByDefault) {
  // Must not crash, and must not print.
  cordon::Log().Info("Nobody listens.");
}

TEST(Log, LinesCarryLevelAndMessage) {
  std::ostringstream os;
  {
    cordon::ScopedLogToStream scope(os);
    cordon::Log().Info("Stage 'unify' started.");
    cordon::Log().Warning("Dropped 3 trips.");
    cordon::Log().Error("Stage 'zones' failed: boom");
  }
  cordon::Log().Info("After the scope.");

  const std::vector<std::string> lines = cordon::strings::Split(os.str(), '\n');
  ASSERT_EQ(3u, lines.size());
  EXPECT_EQ('[', lines[0][0]);
  EXPECT_EQ(']', lines[0][20]);
  EXPECT_EQ("INFO Stage 'unify' started.", lines[0].substr(22));
  EXPECT_EQ("WARNING Dropped 3 trips.", lines[1].substr(22));
  EXPECT_EQ("ERROR Stage 'zones' failed: boom", lines[2].substr(22));
}

TEST(Log, ConcurrentLinesAreNotInterleaved) {
  std::ostringstream os;
  {
    cordon::ScopedLogToStream scope(os);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
      threads.emplace_back([t]() {
        for (int i = 0; i < 100; ++i) {
          cordon::Log().Info("pass " + std::to_string(t));
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }
  }
  const std::vector<std::string> lines = cordon::strings::Split(os.str(), '\n');
  ASSERT_EQ(400u, lines.size());
  for (const auto& line : lines) {
    EXPECT_EQ("INFO pass ", line.substr(22, 10));
    EXPECT_EQ(33u, line.length());
  }
}
