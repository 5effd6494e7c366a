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


#ifndef CORDON_BRICKS_EXCEPTION_H
#define CORDON_BRICKS_EXCEPTION_H

#include <exception>
#include <string>

#include "strings/printf.h"

namespace cordon {

// The base of every exception Cordon throws.
//
// `OriginalDescription()` is the bare message, for the log and for tests.
// `what()` prefixes it with `file:line` of the `CORDON_THROW` that threw it.
class Exception : public std::exception {
 public:
  Exception(const std::string& message = "") : message_(message), what_(message) {}

  const std::string& OriginalDescription() const noexcept { return message_; }

  const char* what() const noexcept override { return what_.c_str(); }

  void SetThrowSite(const char* file, int line) { what_ = strings::Printf("%s:%d\t", file, line) + message_; }

 private:
  std::string message_;
  std::string what_;
};

// The extra parentheses keep `_e_((E))` from parsing as a function declaration.
#define CORDON_THROW(E)                   \
  {                                       \
    auto _e_((E));                        \
    _e_.SetThrowSite(__FILE__, __LINE__); \
    throw _e_;                            \
  }

}  // namespace cordon

#endif  // CORDON_BRICKS_EXCEPTION_H
