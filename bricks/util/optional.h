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


// `Optional<T>` for the plain value types that can be absent in a row: a missing surcharge, an unparseable
// timestamp, an undefined ratio. Test with `Exists(x)`, read with `Value(x)`; reading a missing value throws.

#ifndef CORDON_BRICKS_UTIL_OPTIONAL_H
#define CORDON_BRICKS_UTIL_OPTIONAL_H

#include "../../port.h"

#include <cstddef>
#include <type_traits>

#include "../exception.h"

namespace cordon {

struct NoValueException : Exception {
  NoValueException() : Exception("The optional value is not set.") {}
};

template <typename T>
class Optional final {
  static_assert(std::is_trivially_copyable<T>::value, "`Optional<T>` is only intended for plain value types.");

 public:
  Optional() : value_(), exists_(false) {}
  Optional(std::nullptr_t) : value_(), exists_(false) {}
  Optional(T value) : value_(value), exists_(true) {}

  Optional<T>& operator=(std::nullptr_t) {
    exists_ = false;
    value_ = T();
    return *this;
  }

  Optional<T>& operator=(T value) {
    value_ = value;
    exists_ = true;
    return *this;
  }

  bool ExistsImpl() const { return exists_; }

  T ValueImpl() const {
    if (!exists_) {
      CORDON_THROW(NoValueException());
    }
    return value_;
  }

  T ValueOrDefault(T default_value) const { return exists_ ? value_ : default_value; }

  bool operator==(const Optional<T>& rhs) const {
    return exists_ == rhs.exists_ && (!exists_ || value_ == rhs.value_);
  }
  bool operator!=(const Optional<T>& rhs) const { return !operator==(rhs); }

 private:
  T value_;
  bool exists_;
};

template <typename T>
inline bool Exists(const Optional<T>& x) {
  return x.ExistsImpl();
}

template <typename T>
inline T Value(const Optional<T>& x) {
  return x.ValueImpl();
}

}  // namespace cordon

#endif  // CORDON_BRICKS_UTIL_OPTIONAL_H
