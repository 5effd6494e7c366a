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


#ifndef CORDON_STORAGE_EXCEPTIONS_H
#define CORDON_STORAGE_EXCEPTIONS_H

#include <string>

#include "../bricks/exception.h"
#include "../bricks/strings/util.h"

namespace cordon {

// A required upstream file or table is absent, even after an attempt to fetch it. Always fatal for the run.
struct MissingDependencyException : Exception {
  using Exception::Exception;
};

struct MissingTableException : MissingDependencyException {
  MissingTableException(const std::string& table_name, const std::string& file_name)
      : MissingDependencyException("Table `" + table_name + "` does not exist, expected it in `" + file_name + "`.") {}
};

// A persisted table does not match what its reader expects.
struct TableFormatException : Exception {
  using Exception::Exception;
};

struct TableDirectiveException : TableFormatException {
  TableDirectiveException(const std::string& file_name, const std::string& details)
      : TableFormatException("Malformed `#table` directive in `" + file_name + "`: " + details) {}
};

struct TableRowException : TableFormatException {
  TableRowException(const std::string& file_name, size_t line_number, const std::string& details)
      : TableFormatException("Malformed row in `" + file_name + "`, line " + strings::ToString(line_number) + ": " +
                             details) {}
};

}  // namespace cordon

#endif  // CORDON_STORAGE_EXCEPTIONS_H
