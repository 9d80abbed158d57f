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

#include "error.h"
#include "test-util.h"

namespace lexgen {
namespace {

KJ_TEST("lexicon errors carry their kind") {
  auto file = "a.json"_kj;
  auto thrown = kj::runCatchingExceptions([&]() {
    LEXGEN_FAIL(DUPLICATE_DOCUMENT, "NSID declared by two files", file);
  });
  auto& exception = KJ_ASSERT_NONNULL(thrown);

  auto kind = getErrorKind(exception);
  KJ_EXPECT(KJ_ASSERT_NONNULL(kind) == ErrorKind::DUPLICATE_DOCUMENT);
  KJ_EXPECT(exception.getDescription().startsWith("DuplicateDocument: "),
            exception.getDescription());
  KJ_EXPECT(_::contains(exception.getDescription(), "file = a.json"),
            exception.getDescription());
}

KJ_TEST("other exceptions have no kind") {
  auto thrown = kj::runCatchingExceptions([&]() {
    KJ_FAIL_REQUIRE("plain failure");
  });
  KJ_EXPECT(getErrorKind(KJ_ASSERT_NONNULL(thrown)) == kj::none);
}

KJ_TEST("LEXGEN_REQUIRE") {
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND, LEXGEN_REQUIRE(1 + 1 == 3, UNSUPPORTED_KIND, "math"));
  KJ_EXPECT(_::errorKindOf([&]() {
    LEXGEN_REQUIRE(1 + 1 == 2, UNSUPPORTED_KIND, "math");
  }) == kj::none);
}

}  // namespace
}  // namespace lexgen
