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

#include "emitter.h"

LEXGEN_BEGIN_HEADER

namespace lexgen {

class OutputCache {
  // Content-addressed store of generated output.  Each entry is a directory named after a
  // digest from hashLexicons(), mirroring the generated files:
  //
  //     <root>/<digest>/models.py
  //
  // Entries are replaced atomically as a whole, so concurrent writers of the same digest (which
  // by construction write the same content) never expose a partial entry.  No lock is taken.

public:
  explicit OutputCache(const kj::Directory& root);
  KJ_DISALLOW_COPY_AND_MOVE(OutputCache);

  kj::Maybe<kj::Array<kj::Path>> find(kj::StringPtr digest) const;
  // The files of the entry, ordered, or none on a miss.  An entry with no files is a hit: the
  // run it records generated nothing.

  void store(kj::StringPtr digest, kj::ArrayPtr<const OutputFile> files) const;
  void store(kj::StringPtr digest, const kj::ReadableDirectory& outputDir,
             kj::ArrayPtr<const kj::Path> files) const;
  // Records an entry, from rendered files or by copying already-written ones.

  kj::Array<kj::Path> restore(kj::StringPtr digest, const kj::Directory& outputDir) const;
  // Copies the entry's files into `outputDir`, each atomically, and returns their paths.
  // Requires that find(digest) succeeds.

private:
  const kj::Directory& root;

  static kj::Path entryPath(kj::StringPtr digest);
};

kj::Maybe<kj::Path> defaultCacheRoot();
// `$XDG_CACHE_HOME/lexgen`, else `$HOME/.cache/lexgen`, else none.  Absolute.

}  // namespace lexgen

LEXGEN_END_HEADER
