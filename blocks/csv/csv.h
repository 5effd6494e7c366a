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


// A streaming CSV reader for the raw trip and zone files.
//
// The first line is the header. Columns are addressed by their header name, never by position,
// since the two fleets order and name their columns differently. Fields may be double-quoted,
// with `""` standing for a literal quote inside a quoted field.

#ifndef CORDON_BLOCKS_CSV_CSV_H
#define CORDON_BLOCKS_CSV_CSV_H

#include "../../port.h"

#include <fstream>
#include <map>
#include <string>
#include <vector>

#include "../../bricks/exception.h"
#include "../../bricks/strings/strings.h"

namespace cordon {

struct CSVException : Exception {
  using Exception::Exception;
};

struct CSVFileNotFoundException : CSVException {
  using CSVException::CSVException;
};

struct CSVFileFormatException : CSVException {
  using CSVException::CSVException;
};

struct CSVColumnNotFoundException : CSVException {
  using CSVException::CSVException;
};

namespace csv {

// Splits one line into fields. Returns `false` on an unterminated quote.
inline bool SplitCSVLine(const std::string& line, std::vector<std::string>& fields) {
  fields.clear();
  std::string field;
  bool in_quotes = false;
  for (size_t i = 0; i < line.length(); ++i) {
    const char c = line[i];
    if (in_quotes) {
      if (c == '"') {
        if (i + 1 < line.length() && line[i + 1] == '"') {
          field += '"';
          ++i;
        } else {
          in_quotes = false;
        }
      } else {
        field += c;
      }
    } else if (c == '"') {
      in_quotes = true;
    } else if (c == ',') {
      fields.push_back(std::move(field));
      field.clear();
    } else {
      field += c;
    }
  }
  fields.push_back(std::move(field));
  return !in_quotes;
}

}  // namespace csv

class CSVReader final {
 public:
  class Row final {
   public:
    const std::string& operator[](size_t column) const { return fields_[column]; }
    size_t size() const { return fields_.size(); }

   private:
    friend class CSVReader;
    std::vector<std::string> fields_;
  };

  explicit CSVReader(const std::string& file_name) : file_name_(file_name), fi_(file_name) {
    if (!fi_.good()) {
      CORDON_THROW(CSVFileNotFoundException("The CSV file `" + file_name_ + "` could not be opened."));
    }
    std::string line;
    if (!std::getline(fi_, line)) {
      CORDON_THROW(CSVFileFormatException("The CSV file `" + file_name_ + "` is empty."));
    }
    StripLineEnd(line);
    // Exports from spreadsheet tools may start with a UTF-8 byte order mark.
    if (line.compare(0u, 3u, "\xEF\xBB\xBF") == 0) {
      line = line.substr(3u);
    }
    if (!csv::SplitCSVLine(line, header_) || strings::Trim(line).empty()) {
      CORDON_THROW(CSVFileFormatException("The CSV file `" + file_name_ + "` does not even contain the header."));
    }
    for (size_t i = 0; i < header_.size(); ++i) {
      header_[i] = strings::Trim(header_[i]);
      column_index_[header_[i]] = i;
    }
  }

  const std::vector<std::string>& Header() const { return header_; }

  bool HasColumn(const std::string& name) const { return column_index_.count(name) != 0u; }

  size_t ColumnIndex(const std::string& name) const {
    const auto cit = column_index_.find(name);
    if (cit == column_index_.end()) {
      CORDON_THROW(CSVColumnNotFoundException("The CSV file `" + file_name_ + "` has no column `" + name + "`."));
    }
    return cit->second;
  }

  // Calls `f(const Row&)` for every data line. Blank lines are skipped.
  template <typename F>
  size_t ForEachRow(F&& f) {
    Row row;
    std::string line;
    size_t line_number = 1u;
    size_t rows = 0u;
    while (std::getline(fi_, line)) {
      ++line_number;
      StripLineEnd(line);
      if (line.empty()) {
        continue;
      }
      if (!csv::SplitCSVLine(line, row.fields_)) {
        CORDON_THROW(CSVFileFormatException("Unterminated quote in CSV file `" + file_name_ + "`, line " +
                                            ToString(line_number) + '.'));
      }
      if (row.fields_.size() != header_.size()) {
        CORDON_THROW(CSVFileFormatException("Column number mismatch in CSV file `" + file_name_ + "`, line " +
                                            ToString(line_number) + '.'));
      }
      f(static_cast<const Row&>(row));
      ++rows;
    }
    return rows;
  }

 private:
  static void StripLineEnd(std::string& line) {
    if (!line.empty() && line.back() == '\r') {
      line.resize(line.size() - 1u);
    }
  }

  const std::string file_name_;
  std::ifstream fi_;
  std::vector<std::string> header_;
  std::map<std::string, size_t> column_index_;
};

}  // namespace cordon

#endif  // CORDON_BLOCKS_CSV_CSV_H
