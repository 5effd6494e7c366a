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


// Row types describe their columns once, in order, through a `Serialize()` member:
//
//   struct ZoneCount {
//     int32_t pickup_loc = 0;
//     int64_t trip_count = 0;
//     template <typename A>
//     void Serialize(A& ar) {
//       ar("pickup_loc", pickup_loc);
//       ar("trip_count", trip_count);
//     }
//   };
//
// The same member is visited by the archives below to list the columns, to write a row as a JSON object,
// and to read it back. A new column type needs a `WriteColumnValue()` / `ReadColumnValue()` pair in `cordon`,
// where argument-dependent lookup finds it.

#ifndef CORDON_STORAGE_ARCHIVES_H
#define CORDON_STORAGE_ARCHIVES_H

#include "../port.h"

#include <chrono>
#include <string>
#include <vector>

#include "exceptions.h"
#include "rapidjson.h"

#include "../bricks/time/chrono.h"
#include "../bricks/util/optional.h"

namespace cordon {

using JSONWriter = rapidjson::Writer<rapidjson::StringBuffer>;

inline void WriteColumnValue(JSONWriter& writer, bool value) { writer.Bool(value); }
inline void WriteColumnValue(JSONWriter& writer, int32_t value) { writer.Int(value); }
inline void WriteColumnValue(JSONWriter& writer, int64_t value) { writer.Int64(value); }
inline void WriteColumnValue(JSONWriter& writer, const std::string& value) { writer.String(value); }

inline void WriteColumnValue(JSONWriter& writer, double value) {
  if (!writer.Double(value)) {
    CORDON_THROW(
        TableFormatException("Only finite doubles can be persisted, got " + strings::ToString(value) + '.'));
  }
}

inline void WriteColumnValue(JSONWriter& writer, std::chrono::microseconds value) {
  writer.String(FormatDateTime(value));
}

template <typename T>
inline void WriteColumnValue(JSONWriter& writer, const Optional<T>& value) {
  if (Exists(value)) {
    WriteColumnValue(writer, Value(value));
  } else {
    writer.Null();
  }
}

// Each `ReadColumnValue()` returns `false` when the JSON value is of the wrong type.
inline bool ReadColumnValue(const rapidjson::Value& json, bool& value) {
  if (!json.IsBool()) {
    return false;
  }
  value = json.GetBool();
  return true;
}

inline bool ReadColumnValue(const rapidjson::Value& json, int32_t& value) {
  if (!json.IsInt()) {
    return false;
  }
  value = json.GetInt();
  return true;
}

inline bool ReadColumnValue(const rapidjson::Value& json, int64_t& value) {
  if (!json.IsInt64()) {
    return false;
  }
  value = json.GetInt64();
  return true;
}

inline bool ReadColumnValue(const rapidjson::Value& json, double& value) {
  if (!json.IsNumber()) {
    return false;
  }
  value = json.GetDouble();
  return true;
}

inline bool ReadColumnValue(const rapidjson::Value& json, std::string& value) {
  if (!json.IsString()) {
    return false;
  }
  value.assign(json.GetString(), json.GetStringLength());
  return true;
}

inline bool ReadColumnValue(const rapidjson::Value& json, std::chrono::microseconds& value) {
  if (!json.IsString()) {
    return false;
  }
  const Optional<std::chrono::microseconds> parsed = ParseCivilDateTime(json.GetString());
  if (!Exists(parsed)) {
    return false;
  }
  value = Value(parsed);
  return true;
}

template <typename T>
inline bool ReadColumnValue(const rapidjson::Value& json, Optional<T>& value) {
  if (json.IsNull()) {
    value = nullptr;
    return true;
  }
  T inner = T();
  if (!ReadColumnValue(json, inner)) {
    return false;
  }
  value = inner;
  return true;
}

namespace storage {

class ColumnNamesArchive final {
 public:
  template <typename T>
  void operator()(const char* name, const T&) {
    names_.push_back(name);
  }
  const std::vector<std::string>& Names() const { return names_; }

 private:
  std::vector<std::string> names_;
};

class JSONRowWriter final {
 public:
  explicit JSONRowWriter(JSONWriter& writer) : writer_(writer) {}

  template <typename T>
  void operator()(const char* name, const T& value) {
    writer_.Key(name);
    WriteColumnValue(writer_, value);
  }

 private:
  JSONWriter& writer_;
};

class JSONRowReader final {
 public:
  JSONRowReader(const rapidjson::Value& object, const std::string& file_name, size_t line_number)
      : object_(object), file_name_(file_name), line_number_(line_number) {}

  template <typename T>
  void operator()(const char* name, T& value) {
    const auto cit = object_.FindMember(name);
    if (cit == object_.MemberEnd()) {
      CORDON_THROW(TableRowException(file_name_, line_number_, std::string("missing column `") + name + "`."));
    }
    if (!ReadColumnValue(cit->value, value)) {
      CORDON_THROW(TableRowException(file_name_, line_number_, std::string("bad value for column `") + name + "`."));
    }
  }

 private:
  const rapidjson::Value& object_;
  const std::string& file_name_;
  const size_t line_number_;
};

}  // namespace storage

template <typename ROW>
inline std::vector<std::string> ColumnNames() {
  ROW row;
  storage::ColumnNamesArchive archive;
  row.Serialize(archive);
  return archive.Names();
}

}  // namespace cordon

#endif  // CORDON_STORAGE_ARCHIVES_H
