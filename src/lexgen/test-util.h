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

#include "error.h"
#include <kj/filesystem.h>
#include <kj/test.h>
#include <kj/time.h>
#include <string.h>

namespace lexgen {
namespace _ {  // private

inline kj::Own<const kj::Directory> newTestDirectory() {
  return kj::newInMemoryDirectory(kj::nullClock());
}

inline void writeFile(const kj::Directory& dir, kj::StringPtr path, kj::StringPtr content) {
  dir.openFile(kj::Path::parse(path),
      kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT)
      ->writeAll(content);
}

inline kj::String readFile(const kj::ReadableDirectory& dir, kj::StringPtr path) {
  return dir.openFile(kj::Path::parse(path))->readAllText();
}

inline bool contains(kj::StringPtr text, kj::StringPtr part) {
  return strstr(text.cStr(), part.cStr()) != nullptr;
}

template <typename Func>
kj::Maybe<ErrorKind> errorKindOf(Func&& func) {
  // The kind of lexicon error thrown by `func`, or none if it returned normally.  Any other
  // exception is rethrown.
  KJ_IF_SOME(exception, kj::runCatchingExceptions(kj::fwd<Func>(func))) {
    auto kind = getErrorKind(exception);
    if (kind != kj::none) {
      return kind;
    }
    kj::throwFatalException(kj::mv(exception));
  }
  return kj::none;
}

template <typename Func>
bool throwsKind(ErrorKind expected, Func&& func) {
  auto thrown = errorKindOf(kj::fwd<Func>(func));
  KJ_IF_SOME(kind, thrown) {
    return kind == expected;
  }
  return false;
}

}  // namespace _ (private)
}  // namespace lexgen

#define LEXGEN_EXPECT_ERROR(kind, code) \
  KJ_EXPECT(::lexgen::_::throwsKind(::lexgen::ErrorKind::kind, [&]() { code; }))
// Expects `code` to throw a lexicon error of the given kind.
