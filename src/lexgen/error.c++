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

namespace lexgen {

kj::StringPtr KJ_STRINGIFY(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::MALFORMED_DOCUMENT: return "MalformedDocument";
    case ErrorKind::DUPLICATE_DOCUMENT: return "DuplicateDocument";
    case ErrorKind::UNRESOLVED_REFERENCE: return "UnresolvedReference";
    case ErrorKind::NAME_COLLISION: return "NameCollision";
    case ErrorKind::UNSUPPORTED_KIND: return "UnsupportedKind";
    case ErrorKind::NOT_A_DIRECTORY: return "NotADirectory";
  }
  KJ_UNREACHABLE;
}

void throwLexiconError(ErrorKind kind, kj::Exception&& exception) {
  exception.setDescription(kj::str(kind, ": ", exception.getDescription()));
  exception.setDetail(LexiconError { kind });
  kj::throwFatalException(kj::mv(exception), 1);
}

kj::Maybe<ErrorKind> getErrorKind(const kj::Exception& exception) {
  KJ_IF_SOME(detail, exception.getDetail<LexiconError>()) {
    return detail.kind;
  }
  return kj::none;
}

}  // namespace lexgen
