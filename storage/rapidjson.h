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


#ifndef CORDON_STORAGE_RAPIDJSON_H
#define CORDON_STORAGE_RAPIDJSON_H

// Keep all RapidJSON includes here, to make sure the right macros are defined.

#include "../bricks/exception.h"

namespace cordon {

struct RapidJSONAssertionFailedException : Exception {
  using Exception::Exception;
};

}  // namespace cordon

inline void CordonRapidJSONAssert(bool condition, const char* text, const char* file, int line) {
  if (!condition) {
    cordon::RapidJSONAssertionFailedException e(text);
    e.SetThrowSite(file, line);
    throw e;
  }
}

#define RAPIDJSON_HAS_STDSTRING 1
#define RAPIDJSON_ASSERT(x) CordonRapidJSONAssert(x, #x, __FILE__, __LINE__)

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#endif  // CORDON_STORAGE_RAPIDJSON_H
