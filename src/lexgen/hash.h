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

#include "common.h"
#include <kj/filesystem.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

constexpr size_t DIGEST_BYTES = 8;
// Digests are the first 8 bytes of a SHA-256, written as 16 lower-case hex digits.

kj::String hashLexicons(const kj::ReadableDirectory& root,
                        kj::Maybe<kj::StringPtr> prefix = kj::none,
                        kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs = nullptr);
// Fingerprints everything a generate() run over the same arguments would read: the compiler
// version, the prefix filter, and every `*.json` file under `root` (then under each import
// directory, in order) as (relative path, raw bytes) pairs in path order.  Files are not
// parsed, so this succeeds on trees that generate() would reject.
//
// Each item is framed (strings are NUL-terminated, file contents are length-prefixed), so no
// two distinct inputs produce the same byte stream.

}  // namespace lexgen

LEXGEN_END_HEADER
