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


#ifndef CORDON_BRICKS_STRINGS_JOIN_H
#define CORDON_BRICKS_STRINGS_JOIN_H

#include <string>

namespace cordon {
namespace strings {

template <typename T_CONTAINER>
std::string Join(const T_CONTAINER& strings, const std::string& separator) {
  std::string result;
  bool first = true;
  for (const auto& s : strings) {
    if (first) {
      first = false;
    } else {
      result += separator;
    }
    result += s;
  }
  return result;
}

template <typename T_CONTAINER>
std::string Join(const T_CONTAINER& strings, char separator) {
  return Join(strings, std::string(1u, separator));
}

}  // namespace strings
}  // namespace cordon

#endif  // CORDON_BRICKS_STRINGS_JOIN_H
