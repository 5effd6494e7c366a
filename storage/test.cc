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
#include <vector>

#include "table.h"

#include "../bricks/dflags/dflags.h"
#include "../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(table_test_tmpdir, ".cordon_table_test", "Local path for the test to create temporary files in.");

using cordon::FileSystem;
using cordon::Optional;
using cordon::TableStore;

namespace table_test {

struct Reading {
  std::string day;
  int32_t zone = 0;
  int64_t count = 0;
  double value = 0.0;
  bool flag = false;
  Optional<double> maybe;
  Optional<std::chrono::microseconds> when;

  template <typename A>
  void Serialize(A& ar) {
    ar("day", day);
    ar("zone", zone);
    ar("count", count);
    ar("value", value);
    ar("flag", flag);
    ar("maybe", maybe);
    ar("when", when);
  }
};

struct Narrow {
  std::string day;
  template <typename A>
  void Serialize(A& ar) {
    ar("day", day);
  }
};

inline Reading MakeReading(const std::string& day, int32_t zone, double value) {
  Reading r;
  r.day = day;
  r.zone = zone;
  r.count = 10000000000ll;
  r.value = value;
  r.flag = zone % 2 == 0;
  if (zone % 2) {
    r.maybe = value * 2;
  }
  r.when = cordon::Value(cordon::ParseCivilDateTime(day + " 08:15:00"));
  return r;
}

}  // namespace table_test

using table_test::MakeReading;
using table_test::Narrow;
using table_test::Reading;

TEST(Table, ColumnNames) {
  EXPECT_EQ(std::vector<std::string>({"day", "zone", "count", "value", "flag", "maybe", "when"}),
            cordon::ColumnNames<Reading>());
}

TEST(Table, WritesTheDirectiveAndOneObjectPerRow) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  EXPECT_FALSE(store.Exists("readings"));
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-02", 43, 0.1), MakeReading("2024-01-03", 42, 17.0)}));
  EXPECT_TRUE(store.Exists("readings"));
  EXPECT_FALSE(FileSystem::Exists(store.TablePath("readings") + ".tmp"));
  EXPECT_EQ(
      "#table {\"name\":\"readings\",\"columns\":[\"day\",\"zone\",\"count\",\"value\",\"flag\",\"maybe\",\"when\"]}\n"
      "{\"day\":\"2024-01-02\",\"zone\":43,\"count\":10000000000,\"value\":0.1,\"flag\":false,\"maybe\":0.2,"
      "\"when\":\"2024-01-02 08:15:00\"}\n"
      "{\"day\":\"2024-01-03\",\"zone\":42,\"count\":10000000000,\"value\":17.0,\"flag\":true,\"maybe\":null,"
      "\"when\":\"2024-01-03 08:15:00\"}\n",
      FileSystem::ReadFileAsString(store.TablePath("readings")));
}

TEST(Table, ReadsBackWhatWasWritten) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-02", 43, 1.0 / 3), MakeReading("2024-01-03", 42, 5)}));
  const std::vector<Reading> rows = store.Read<Reading>("readings");
  ASSERT_EQ(2u, rows.size());
  EXPECT_EQ("2024-01-02", rows[0].day);
  EXPECT_EQ(43, rows[0].zone);
  EXPECT_EQ(10000000000ll, rows[0].count);
  EXPECT_EQ(1.0 / 3, rows[0].value);
  EXPECT_FALSE(rows[0].flag);
  EXPECT_EQ(2.0 / 3, cordon::Value(rows[0].maybe));
  EXPECT_TRUE(rows[1].flag);
  EXPECT_FALSE(cordon::Exists(rows[1].maybe));
  EXPECT_EQ("2024-01-03 08:15:00", cordon::FormatDateTime(cordon::Value(rows[1].when)));
}

TEST(Table, EmptyTableIsValid) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  store.Write("readings", std::vector<Reading>());
  EXPECT_TRUE(store.Read<Reading>("readings").empty());
}

TEST(Table, RewriteIsAFullReplacement) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-02", 1, 1), MakeReading("2024-01-03", 2, 2)}));
  const std::string before = FileSystem::ReadFileAsString(store.TablePath("readings"));
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-02", 1, 1), MakeReading("2024-01-03", 2, 2)}));
  EXPECT_EQ(before, FileSystem::ReadFileAsString(store.TablePath("readings")));
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-04", 3, 3)}));
  ASSERT_EQ(1u, store.Read<Reading>("readings").size());
}

TEST(Table, MissingTableIsAMissingDependency) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  ASSERT_THROW(store.Read<Reading>("clean_trips"), cordon::MissingDependencyException);
  ASSERT_THROW(store.Read<Reading>("clean_trips"), cordon::MissingTableException);
}

TEST(Table, MalformedTables) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  const std::string fn = store.TablePath("readings");

  FileSystem::WriteStringToFile("", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableDirectiveException);

  FileSystem::WriteStringToFile("{\"day\":\"2024-01-01\"}\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableDirectiveException);

  FileSystem::WriteStringToFile("#table {\"name\":\"other\",\"columns\":[\"day\"]}\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableDirectiveException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"date\"]}\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableDirectiveException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"day\"]}\n[1,2]\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableRowException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"day\"]}\n{\"day\":\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableRowException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"day\"]}\n{\"day\":42}\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableFormatException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"day\"]}\n{\"date\":\"x\"}\n", fn.c_str());
  ASSERT_THROW(store.Read<Narrow>("readings"), cordon::TableFormatException);

  FileSystem::WriteStringToFile("#table {\"name\":\"readings\",\"columns\":[\"day\"]}\n{\"day\":\"ok\"}\n", fn.c_str());
  ASSERT_EQ(1u, store.Read<Narrow>("readings").size());
}

TEST(Table, NonFiniteDoublesAreRejected) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  Reading r = MakeReading("2024-01-02", 1, 0.0);
  r.value = std::numeric_limits<double>::infinity();
  ASSERT_THROW(store.Write("readings", std::vector<Reading>({r})), cordon::TableFormatException);
  EXPECT_FALSE(store.Exists("readings"));
  EXPECT_FALSE(FileSystem::Exists(store.TablePath("readings") + ".tmp"));
}

TEST(Table, StreamingWriterPublishesOnlyOnCommit) {
  const FileSystem::ScopedTmpDir dir(FLAGS_table_test_tmpdir);
  const TableStore store(dir.Path());
  store.Write("readings", std::vector<Reading>({MakeReading("2024-01-02", 1, 1)}));
  const std::string before = FileSystem::ReadFileAsString(store.TablePath("readings"));
  {
    const auto writer = store.OpenWriter<Reading>("readings");
    writer->Add(MakeReading("2024-01-03", 2, 2));
    writer->Add(MakeReading("2024-01-04", 3, 3));
    EXPECT_EQ(2u, writer->Rows());
    EXPECT_TRUE(FileSystem::Exists(store.TablePath("readings") + ".tmp"));
    EXPECT_EQ(before, FileSystem::ReadFileAsString(store.TablePath("readings")));
  }
  // Dropped uncommitted.
  EXPECT_FALSE(FileSystem::Exists(store.TablePath("readings") + ".tmp"));
  EXPECT_EQ(before, FileSystem::ReadFileAsString(store.TablePath("readings")));

  const auto writer = store.OpenWriter<Reading>("readings");
  writer->Add(MakeReading("2024-01-03", 2, 2));
  writer->Add(MakeReading("2024-01-04", 3, 3));
  writer->Commit();
  EXPECT_FALSE(FileSystem::Exists(store.TablePath("readings") + ".tmp"));
  const std::vector<Reading> rows = store.Read<Reading>("readings");
  ASSERT_EQ(2u, rows.size());
  EXPECT_EQ(3, rows[1].zone);
}
