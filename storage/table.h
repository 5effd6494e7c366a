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


// The table store: every pipeline table is one text file `<directory>/<name>.jsonl`.
//
// The first line is the `#table` directive, `#table {"name":"clean_trips","columns":["taxi_type",...]}`.
// Each following line is one row, a JSON object with exactly these keys, in this order.
//
// Writes are full replacements, and atomic from the reader's perspective: the rows stream into `<name>.jsonl.tmp`,
// which is then renamed over `<name>.jsonl`. Reads stream too, one row at a time.

#ifndef CORDON_STORAGE_TABLE_H
#define CORDON_STORAGE_TABLE_H

#include "../port.h"

#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "archives.h"
#include "exceptions.h"
#include "rapidjson.h"

#include "../bricks/file/file.h"
#include "../bricks/strings/join.h"

namespace cordon {
namespace storage {
namespace constants {
constexpr char kTableDirective[] = "#table";
constexpr char kTableFileExtension[] = ".jsonl";
}  // namespace constants

inline std::string DirectiveJSON(const std::string& name, const std::vector<std::string>& columns) {
  rapidjson::StringBuffer buffer;
  JSONWriter writer(buffer);
  writer.StartObject();
  writer.Key("name");
  writer.String(name);
  writer.Key("columns");
  writer.StartArray();
  for (const std::string& column : columns) {
    writer.String(column);
  }
  writer.EndArray();
  writer.EndObject();
  return buffer.GetString();
}

}  // namespace storage

// Streams the rows of one table into its temporary file. `Commit()` puts the table in place.
// A writer destroyed uncommitted removes its temporary file, and the previous table, if any, stays intact.
template <typename ROW>
class TableWriter final {
 public:
  TableWriter(const std::string& name, const std::string& file_name)
      : file_name_(file_name), tmp_file_name_(file_name + ".tmp") {
    fo_.open(tmp_file_name_, std::ofstream::trunc | std::ofstream::binary);
    if (!fo_.good()) {
      CORDON_THROW(CannotWriteFileException(tmp_file_name_));
    }
    fo_ << storage::constants::kTableDirective << ' ' << storage::DirectiveJSON(name, ColumnNames<ROW>()) << '\n';
  }

  TableWriter(const TableWriter&) = delete;
  TableWriter& operator=(const TableWriter&) = delete;

  ~TableWriter() {
    if (!committed_) {
      fo_.close();
      FileSystem::RmFile(tmp_file_name_, FileSystem::RmFileParameters::Silent);
    }
  }

  void Add(const ROW& row) {
    buffer_.Clear();
    JSONWriter writer(buffer_);
    writer.StartObject();
    storage::JSONRowWriter archive(writer);
    // `Serialize()` is shared with the reader, hence non-const; the writer archive only reads the fields.
    const_cast<ROW&>(row).Serialize(archive);
    writer.EndObject();
    fo_.write(buffer_.GetString(), static_cast<std::streamsize>(buffer_.GetSize()));
    fo_.put('\n');
    if (!fo_.good()) {
      CORDON_THROW(CannotWriteFileException(tmp_file_name_));
    }
    ++rows_;
  }

  size_t Rows() const { return rows_; }

  void Commit() {
    fo_.close();
    if (fo_.fail()) {
      CORDON_THROW(CannotWriteFileException(tmp_file_name_));
    }
    FileSystem::RenameFile(tmp_file_name_, file_name_);
    committed_ = true;
  }

 private:
  const std::string file_name_;
  const std::string tmp_file_name_;
  std::ofstream fo_;
  rapidjson::StringBuffer buffer_;
  size_t rows_ = 0u;
  bool committed_ = false;
};

class TableStore final {
 public:
  explicit TableStore(const std::string& directory) : directory_(directory) {}

  const std::string& Directory() const { return directory_; }

  std::string TablePath(const std::string& name) const {
    return FileSystem::JoinPath(directory_, name + storage::constants::kTableFileExtension);
  }

  bool Exists(const std::string& name) const { return FileSystem::Exists(TablePath(name)); }

  template <typename ROW>
  std::unique_ptr<TableWriter<ROW>> OpenWriter(const std::string& name) const {
    return std::make_unique<TableWriter<ROW>>(name, TablePath(name));
  }

  template <typename ROW>
  void Write(const std::string& name, const std::vector<ROW>& rows) const {
    TableWriter<ROW> writer(name, TablePath(name));
    for (const ROW& row : rows) {
      writer.Add(row);
    }
    writer.Commit();
  }

  // Calls `f(ROW&&)` for every row, in file order, without holding the whole table in memory.
  template <typename ROW, typename F>
  size_t ForEach(const std::string& name, F&& f) const {
    const std::string file_name = TablePath(name);
    if (!FileSystem::Exists(file_name)) {
      CORDON_THROW(MissingTableException(name, file_name));
    }
    std::ifstream fi(file_name);
    if (!fi.good()) {
      CORDON_THROW(CannotReadFileException(file_name));
    }
    std::string line;
    if (!std::getline(fi, line)) {
      CORDON_THROW(TableDirectiveException(file_name, "the file is empty."));
    }
    ValidateDirective(file_name, line, name, ColumnNames<ROW>());
    const size_t number_of_columns = ColumnNames<ROW>().size();
    size_t line_number = 1u;
    size_t rows = 0u;
    while (std::getline(fi, line)) {
      ++line_number;
      rapidjson::Document document;
      if (document.Parse<rapidjson::kParseFullPrecisionFlag>(line.c_str()).HasParseError()) {
        CORDON_THROW(TableRowException(file_name, line_number, "not a valid JSON."));
      }
      if (!document.IsObject()) {
        CORDON_THROW(TableRowException(file_name, line_number, "not a JSON object."));
      }
      if (document.MemberCount() != number_of_columns) {
        CORDON_THROW(TableRowException(file_name, line_number, "wrong number of columns."));
      }
      ROW row;
      storage::JSONRowReader archive(document, file_name, line_number);
      row.Serialize(archive);
      f(std::move(row));
      ++rows;
    }
    if (fi.bad()) {
      CORDON_THROW(CannotReadFileException(file_name));
    }
    return rows;
  }

  template <typename ROW>
  std::vector<ROW> Read(const std::string& name) const {
    std::vector<ROW> result;
    ForEach<ROW>(name, [&result](ROW&& row) { result.push_back(std::move(row)); });
    return result;
  }

 private:
  static void ValidateDirective(const std::string& file_name,
                                const std::string& line,
                                const std::string& expected_name,
                                const std::vector<std::string>& expected_columns) {
    const std::string prefix = std::string(storage::constants::kTableDirective) + ' ';
    if (line.compare(0u, prefix.length(), prefix) != 0) {
      CORDON_THROW(TableDirectiveException(file_name, "the first line must begin with `" + prefix + "`."));
    }
    rapidjson::Document document;
    if (document.Parse(line.c_str() + prefix.length()).HasParseError() || !document.IsObject()) {
      CORDON_THROW(TableDirectiveException(file_name, "not a JSON object."));
    }
    const auto name = document.FindMember("name");
    if (name == document.MemberEnd() || !name->value.IsString() || expected_name != name->value.GetString()) {
      CORDON_THROW(TableDirectiveException(file_name, "expected the name `" + expected_name + "`."));
    }
    std::vector<std::string> columns;
    const auto columns_member = document.FindMember("columns");
    if (columns_member != document.MemberEnd() && columns_member->value.IsArray()) {
      for (const auto& column : columns_member->value.GetArray()) {
        columns.push_back(column.IsString() ? column.GetString() : "");
      }
    }
    if (columns != expected_columns) {
      CORDON_THROW(TableDirectiveException(
          file_name, "expected the columns `" + strings::Join(expected_columns, ',') + "`, got `" +
                         strings::Join(columns, ',') + "`."));
    }
  }

  const std::string directory_;
};

}  // namespace cordon

#endif  // CORDON_STORAGE_TABLE_H
