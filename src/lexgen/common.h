// Copyright (c) 2026 lexgen contributors
// Licensed under the MIT License:
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in
// all copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN
// THE SOFTWARE.

#pragma once

#include <kj/common.h>
#include <kj/string.h>

#define LEXGEN_BEGIN_HEADER KJ_BEGIN_HEADER
#define LEXGEN_END_HEADER KJ_END_HEADER

LEXGEN_BEGIN_HEADER

namespace lexgen {

#define LEXGEN_VERSION_MAJOR 0
#define LEXGEN_VERSION_MINOR 3
#define LEXGEN_VERSION_MICRO 1

#define LEXGEN_VERSION \
  (LEXGEN_VERSION_MAJOR * 1000000 + LEXGEN_VERSION_MINOR * 1000 + LEXGEN_VERSION_MICRO)

#define LEXGEN_STRINGIFY_VERSION_(a, b, c) #a "." #b "." #c
#define LEXGEN_STRINGIFY_VERSION(a, b, c) LEXGEN_STRINGIFY_VERSION_(a, b, c)
#define LEXGEN_VERSION_STRING LEXGEN_STRINGIFY_VERSION( \
    LEXGEN_VERSION_MAJOR, LEXGEN_VERSION_MINOR, LEXGEN_VERSION_MICRO)
// The version string is mixed into every cache digest, so bumping any component invalidates
// previously cached output.

typedef unsigned int uint;

}  // namespace lexgen

LEXGEN_END_HEADER
