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

#include "csv.h"

#include "../../bricks/file/file.h"

#include "../../bricks/dflags/dflags.h"
#include "../../bricks/dflags/gtest_main_with_dflags.h"

DEFINE_string(csv_test_tmpdir, ".cordon_csv_test", "Local path for the test to create temporary files in.");

using cordon::CSVReader;
using cordon::FileSystem;

TEST(CSV, SplitsQuotedFields) {
  std::vector<std::string> fields;
  ASSERT_TRUE(cordon::csv::SplitCSVLine("1,\"Manhattan\",\"Upper East Side, North\",\"say \"\"hi\"\"\",", fields));
  EXPECT_EQ(std::vector<std::string>({"1", "Manhattan", "Upper East Side, North", "say \"hi\"", ""}), fields);
  EXPECT_FALSE(cordon::csv::SplitCSVLine("1,\"unterminated", fields));
}

TEST(CSV, ColumnsAreAddressedByName) {
  const FileSystem::ScopedTmpDir dir(FLAGS_csv_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "zones.csv");
  FileSystem::WriteStringToFile(
      "\xEF\xBB\xBF\"LocationID\",\"Borough\",\"Zone\",\"service_zone\"\r\n"
      "4,\"Manhattan\",\"Alphabet City\",\"Yellow Zone\"\r\n"
      "\r\n"
      "7,\"Queens\",\"Astoria\",\"Boro Zone\"\r\n",
      fn.c_str());
  CSVReader reader(fn);
  EXPECT_EQ(std::vector<std::string>({"LocationID", "Borough", "Zone", "service_zone"}), reader.Header());
  EXPECT_TRUE(reader.HasColumn("Zone"));
  EXPECT_FALSE(reader.HasColumn("zone"));
  const size_t zone = reader.ColumnIndex("Zone");
  const size_t id = reader.ColumnIndex("LocationID");
  ASSERT_THROW(reader.ColumnIndex("PULocationID"), cordon::CSVColumnNotFoundException);
  std::vector<std::string> seen;
  EXPECT_EQ(2u, reader.ForEachRow([&](const CSVReader::Row& row) { seen.push_back(row[id] + ':' + row[zone]); }));
  EXPECT_EQ(std::vector<std::string>({"4:Alphabet City", "7:Astoria"}), seen);
}

TEST(CSV, Errors) {
  const FileSystem::ScopedTmpDir dir(FLAGS_csv_test_tmpdir);
  const std::string fn = FileSystem::JoinPath(dir.Path(), "bad.csv");
  ASSERT_THROW(CSVReader missing(FileSystem::JoinPath(dir.Path(), "missing.csv")), cordon::CSVFileNotFoundException);

  FileSystem::WriteStringToFile("", fn.c_str());
  ASSERT_THROW(CSVReader reader(fn), cordon::CSVFileFormatException);

  FileSystem::WriteStringToFile("a,b\n1,2\n3\n", fn.c_str());
  CSVReader reader(fn);
  ASSERT_THROW(reader.ForEachRow([](const CSVReader::Row&) {}), cordon::CSVFileFormatException);
}
