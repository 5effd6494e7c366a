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


#ifndef CORDON_BRICKS_STRINGS_SPLIT_H
#define CORDON_BRICKS_STRINGS_SPLIT_H

#include <string>
#include <vector>

namespace cordon {
namespace strings {

// Skip: Skip empty chunks, Keep: Keep empty fields.
enum class EmptyFields { Skip, Keep };

template <typename T_PROCESSOR>
inline size_t Split(const std::string& s,
                    char separator,
                    T_PROCESSOR&& processor,
                    EmptyFields empty_fields_strategy = EmptyFields::Skip) {
  size_t i = 0;
  size_t j = 0;
  size_t n = 0;
  const auto emit = [&]() {
    if (empty_fields_strategy == EmptyFields::Keep || i != j) {
      ++n;
      processor(s.substr(j, i - j));
    }
  };
  for (i = 0; i < s.size(); ++i) {
    if (s[i] == separator) {
      emit();
      j = i + 1;
    }
  }
  emit();
  return n;
}

inline std::vector<std::string> Split(const std::string& s,
                                      char separator,
                                      EmptyFields empty_fields_strategy = EmptyFields::Skip) {
  std::vector<std::string> result;
  Split(s, separator, [&result](std::string&& chunk) { result.emplace_back(std::move(chunk)); }, empty_fields_strategy);
  return result;
}

}  // namespace strings
}  // namespace cordon

#endif  // CORDON_BRICKS_STRINGS_SPLIT_H
