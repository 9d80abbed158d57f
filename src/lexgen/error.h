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
#include <kj/debug.h>
#include <kj/exception.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

enum class ErrorKind: uint8_t {
  // Every failure the compiler reports itself falls into one of these kinds.  All of them are
  // fatal: the first one aborts the run before anything is written.

  MALFORMED_DOCUMENT,
  // A schema file is not valid JSON, or lacks (or has an invalid) `lexicon`, `id`, or `defs`,
  // or a definition inside it is structurally wrong.

  DUPLICATE_DOCUMENT,
  // Two schema files declare the same NSID.

  UNRESOLVED_REFERENCE,
  // A `ref` (or union member) names a document or definition that does not exist.

  NAME_COLLISION,
  // Two distinct symbols were allocated the same output identifier.

  UNSUPPORTED_KIND,
  // An unrecognized definition kind, a kind used where the lexicon language forbids it, or an
  // unsatisfiable combination of constraints.

  NOT_A_DIRECTORY
  // The input root does not exist or is not a directory.
};

kj::StringPtr KJ_STRINGIFY(ErrorKind kind);

struct LexiconError {
  // Attached to every kj::Exception thrown by the compiler so that callers can classify the
  // failure without parsing the description.

  static constexpr uint64_t EXCEPTION_DETAIL_TYPE_ID = 0xd41f6c2b8e0a3b57ull;

  ErrorKind kind;
};

KJ_NORETURN(void throwLexiconError(ErrorKind kind, kj::Exception&& exception));
// Prefixes the description with the kind name, attaches a LexiconError detail, and throws.

kj::Maybe<ErrorKind> getErrorKind(const kj::Exception& exception);
// Returns the kind of an exception thrown by throwLexiconError(), or none for any other
// exception (e.g. filesystem failures).

#define LEXGEN_FAIL(kind, ...) \
  ::lexgen::throwLexiconError(::lexgen::ErrorKind::kind, KJ_EXCEPTION(FAILED, __VA_ARGS__))
// Throws a lexicon error of the given kind.  The remaining arguments are formatted the way
// KJ_FAIL_REQUIRE formats them: string literals verbatim, everything else as `name = value`.

#define LEXGEN_REQUIRE(condition, kind, ...) \
  if (KJ_LIKELY(condition)) {} else LEXGEN_FAIL(kind, __VA_ARGS__)

}  // namespace lexgen

LEXGEN_END_HEADER
