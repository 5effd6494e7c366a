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


// Cross-platform portability header.
//
// Ensures that one and only one of CORDON_{POSIX,APPLE} is defined.
// Keeps the one provided externally. Defaults to environmental setting if none has been defined.

#ifndef CORDON_PORT_H
#define CORDON_PORT_H

#include <cstdint>
#include <cstdio>
#include <limits>  // For data type implementation details.
#include <memory>  // For `std::unique_ptr`.
#include <string>

#ifdef CORDON_PORT_COUNT
#error "`CORDON_PORT_COUNT` should not be defined for port.h"
#endif

#ifdef CORDON_POSIX
#define COUNT_CORDON_POSIX_DEFINED 1
#else
#define COUNT_CORDON_POSIX_DEFINED 0
#endif

#ifdef CORDON_APPLE
#define COUNT_CORDON_APPLE_DEFINED 1
#else
#define COUNT_CORDON_APPLE_DEFINED 0
#endif

#define CORDON_PORT_COUNT (COUNT_CORDON_POSIX_DEFINED + COUNT_CORDON_APPLE_DEFINED)

#if CORDON_PORT_COUNT > 1
#error "More than one `CORDON_*` architectures have been defined."
#elif CORDON_PORT_COUNT == 0

#if defined(__linux)
#define CORDON_POSIX
#elif defined(__APPLE__)
#define CORDON_APPLE
#else
#error "Could not detect architecture. Please define one of the `CORDON_*` macros explicitly."
#endif

#endif  // `CORDON_PORT_COUNT == 0`

#undef CORDON_PORT_COUNT
#undef COUNT_CORDON_POSIX_DEFINED
#undef COUNT_CORDON_APPLE_DEFINED

#ifdef CORDON_APPLE
// The following line is needed to avoid OS X headers conflicts with C++.
#define __ASSERT_MACROS_DEFINE_VERSIONS_WITHOUT_UNDERSCORES 0
#endif  // CORDON_APPLE

// The pipeline relies on exact integer widths and IEEE doubles for byte-stable output tables.
static_assert(sizeof(int32_t) == 4u, "`int32_t` must be exactly 4 bytes.");
static_assert(sizeof(int64_t) == 8u, "`int64_t` must be exactly 8 bytes.");
static_assert(std::numeric_limits<double>::is_iec559, "`double` type is not IEC-559 compliant.");
static_assert(sizeof(double) == 8u, "Only 64-bit `double` is supported.");

#endif  // CORDON_PORT_H
