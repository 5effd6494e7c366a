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


#ifndef CORDON_BRICKS_STRINGS_UTIL_H
#define CORDON_BRICKS_STRINGS_UTIL_H

#include <cctype>
#include <cstring>
#include <sstream>
#include <string>
#include <type_traits>

namespace cordon {
namespace strings {

// Default implementation for arithmetic types calling `std::to_string`.
template <typename T, bool IS_ENUM = std::is_enum<T>::value>
struct ToStringImpl {
  static std::string DoIt(T value) { return std::to_string(value); }
};

template <typename T>
struct ToStringImpl<T, true> {
  static std::string DoIt(T value) {
    return std::to_string(static_cast<typename std::underlying_type<T>::type>(value));
  }
};

template <>
struct ToStringImpl<bool, false> {
  static std::string DoIt(bool b) { return b ? "true" : "false"; }
};

template <>
struct ToStringImpl<char, false> {
  static std::string DoIt(char c) { return std::string(1u, c); }
};

template <>
struct ToStringImpl<std::string, false> {
  static std::string DoIt(const std::string& s) { return s; }
};

inline std::string ToString(const char* s) { return s; }

template <typename T>
inline std::string ToString(const T& something) {
  return ToStringImpl<typename std::decay<T>::type>::DoIt(something);
}

inline std::string Trim(const char* input, const size_t length) {
  const char* begin = input;
  const char* end = input + length;
  const char* output_begin = begin;
  while (output_begin < end && ::isspace(static_cast<unsigned char>(*output_begin))) {
    ++output_begin;
  }
  const char* output_end = end;
  while (output_end > output_begin && ::isspace(static_cast<unsigned char>(*(output_end - 1)))) {
    --output_end;
  }
  return std::string(output_begin, output_end);
}

inline std::string Trim(const char* s) { return Trim(s, ::strlen(s)); }

inline std::string Trim(const std::string& s) { return Trim(s.c_str(), s.length()); }

// Parses the whole (trimmed) input. Returns `false` and leaves `output` untouched on any leftover characters,
// which is what distinguishes "1.5" from "1.5 miles" or from an empty field.
template <typename T>
inline bool TryFromString(const std::string& input, T& output) {
  const std::string trimmed = Trim(input);
  if (trimmed.empty()) {
    return false;
  }
  std::istringstream is(trimmed);
  T value;
  if (!(is >> value)) {
    return false;
  }
  if (is.rdbuf()->in_avail() > 0) {
    return false;
  }
  output = value;
  return true;
}

template <>
inline bool TryFromString(const std::string& input, bool& output) {
  const std::string trimmed = Trim(input);
  if (trimmed == "true" || trimmed == "1") {
    output = true;
    return true;
  } else if (trimmed == "false" || trimmed == "0") {
    output = false;
    return true;
  } else {
    return false;
  }
}

// Default initializer, zero for primitive types, when the input can not be parsed.
template <typename T>
inline T FromString(const std::string& input) {
  T output = T();
  TryFromString(input, output);
  return output;
}

}  // namespace strings

using strings::ToString;
using strings::FromString;

}  // namespace cordon

#endif  // CORDON_BRICKS_STRINGS_UTIL_H
