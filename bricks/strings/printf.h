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


#ifndef CORDON_BRICKS_STRINGS_PRINTF_H
#define CORDON_BRICKS_STRINGS_PRINTF_H

#include "../../port.h"

#include <cstdarg>
#include <string>
#include <vector>

namespace cordon {
namespace strings {

// Thread-safe: formats into a per-call buffer, sized by a dry run of `vsnprintf`.
inline std::string Printf(const char* fmt, ...) {
  va_list ap;
  va_start(ap, fmt);
  va_list ap_copy;
  va_copy(ap_copy, ap);
  const int length = ::vsnprintf(nullptr, 0, fmt, ap_copy);
  va_end(ap_copy);
  if (length <= 0) {
    va_end(ap);
    return "";
  }
  std::vector<char> buffer(static_cast<size_t>(length) + 1u);
  ::vsnprintf(&buffer[0], buffer.size(), fmt, ap);
  va_end(ap);
  return std::string(&buffer[0], static_cast<size_t>(length));
}

}  // namespace strings
}  // namespace cordon

#endif  // CORDON_BRICKS_STRINGS_PRINTF_H
