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

#include "schema.h"
#include <kj/filesystem.h>
#include <kj/vector.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

struct SourceFile {
  kj::Path path;
  // Relative to the directory that was listed.
  kj::String name;
  // `path.toString()`, cached because files are ordered by it.
};

kj::Array<SourceFile> listLexiconFiles(const kj::ReadableDirectory& root);
// Finds every `*.json` file under `root`, recursively, ordered by relative path.  Symlinks to
// files are included; symlinked directories are not followed.

class DocumentSet {
  // The documents of one invocation, ordered by NSID.  Immutable once built.

public:
  DocumentSet() = default;
  DocumentSet(kj::Array<LexiconDocument> documents, kj::Array<bool> imported);
  // `documents` must already be ordered by NSID; `imported` runs parallel to it.
  KJ_DISALLOW_COPY(DocumentSet);
  DocumentSet(DocumentSet&&) = default;
  DocumentSet& operator=(DocumentSet&&) = default;

  kj::ArrayPtr<const LexiconDocument> getDocuments() const { return documents; }

  kj::Maybe<const LexiconDocument&> find(kj::StringPtr nsid) const;

  bool isImported(const LexiconDocument& document) const;
  // True if the document came from an import path rather than the input tree.  Imported
  // documents are resolution targets only and are never generated.

  uint getImportedCount() const { return importedCount; }

private:
  kj::Array<LexiconDocument> documents;
  kj::Array<bool> imported;
  uint importedCount = 0;
};

class Loader {
  // Reads lexicon documents from an input tree plus any number of import paths.

public:
  Loader();
  KJ_DISALLOW_COPY_AND_MOVE(Loader);

  void addImportPath(const kj::ReadableDirectory& dir);
  // Adds a directory whose documents may be referenced but are not generated.  An import
  // document whose NSID is also declared in the input tree (or in an earlier import path) is
  // shadowed rather than reported as a duplicate.

  DocumentSet load(const kj::ReadableDirectory& root);
  // Loads every `*.json` file under `root` and the import paths.  Throws MALFORMED_DOCUMENT on
  // a file that is not a valid lexicon, and DUPLICATE_DOCUMENT if two files of the input tree
  // (or of one import path) declare the same NSID.

private:
  kj::Vector<const kj::ReadableDirectory*> importPath;

  kj::Array<LexiconDocument> loadTree(const kj::ReadableDirectory& dir);
};

}  // namespace lexgen

LEXGEN_END_HEADER
