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

#include "loader.h"
#include "error.h"
#include <kj/debug.h>
#include <algorithm>

namespace lexgen {

namespace {

void collectLexiconFiles(const kj::ReadableDirectory& dir, kj::PathPtr prefix,
                         kj::Vector<SourceFile>& results) {
  for (auto& entry: dir.listEntries()) {
    if (entry.type == kj::FsNode::Type::DIRECTORY) {
      collectLexiconFiles(*dir.openSubdir(kj::Path(entry.name)), prefix.append(entry.name),
                          results);
    } else if (entry.type == kj::FsNode::Type::FILE ||
               entry.type == kj::FsNode::Type::SYMLINK) {
      if (entry.name.endsWith(".json")) {
        auto path = prefix.append(entry.name);
        auto name = path.toString();
        results.add(SourceFile { kj::mv(path), kj::mv(name) });
      }
    }
  }
}

void sortByNsid(kj::Array<LexiconDocument>& documents) {
  std::sort(documents.begin(), documents.end(),
      [](const LexiconDocument& a, const LexiconDocument& b) {
    return a.nsid.asPtr() < b.nsid.asPtr();
  });
}

void checkForDuplicates(kj::ArrayPtr<const LexiconDocument> sortedDocuments) {
  for (size_t i = 1; i < sortedDocuments.size(); i++) {
    auto& previous = sortedDocuments[i - 1];
    auto& current = sortedDocuments[i];
    if (previous.nsid == current.nsid) {
      auto nsid = current.nsid.asPtr();
      auto first = previous.sourceName.asPtr();
      auto second = current.sourceName.asPtr();
      LEXGEN_FAIL(DUPLICATE_DOCUMENT, "NSID declared by two files", nsid, first, second);
    }
  }
}

}  // namespace

kj::Array<SourceFile> listLexiconFiles(const kj::ReadableDirectory& root) {
  kj::Vector<SourceFile> results;
  collectLexiconFiles(root, kj::Path(nullptr), results);

  auto sorted = results.releaseAsArray();
  std::sort(sorted.begin(), sorted.end(), [](const SourceFile& a, const SourceFile& b) {
    return a.name.asPtr() < b.name.asPtr();
  });
  return sorted;
}

// =======================================================================================

DocumentSet::DocumentSet(kj::Array<LexiconDocument> documentsParam, kj::Array<bool> importedParam)
    : documents(kj::mv(documentsParam)), imported(kj::mv(importedParam)) {
  KJ_REQUIRE(documents.size() == imported.size());
  for (bool i: imported) {
    if (i) ++importedCount;
  }
}

kj::Maybe<const LexiconDocument&> DocumentSet::find(kj::StringPtr nsid) const {
  auto iter = std::lower_bound(documents.begin(), documents.end(), nsid,
      [](const LexiconDocument& document, kj::StringPtr key) {
    return document.nsid.asPtr() < key;
  });
  if (iter != documents.end() && iter->nsid == nsid) {
    return *iter;
  }
  return kj::none;
}

bool DocumentSet::isImported(const LexiconDocument& document) const {
  KJ_REQUIRE(&document >= documents.begin() && &document < documents.end(),
             "document does not belong to this set", document.nsid);
  return imported[&document - documents.begin()];
}

// =======================================================================================

Loader::Loader() {}

void Loader::addImportPath(const kj::ReadableDirectory& dir) {
  importPath.add(&dir);
}

kj::Array<LexiconDocument> Loader::loadTree(const kj::ReadableDirectory& dir) {
  auto files = listLexiconFiles(dir);

  auto documents = KJ_MAP(file, files) {
    auto text = dir.openFile(file.path)->readAllText();
    return parseLexicon(file.name, text);
  };

  sortByNsid(documents);
  checkForDuplicates(documents);
  return documents;
}

DocumentSet Loader::load(const kj::ReadableDirectory& root) {
  auto inputs = loadTree(root);

  kj::Vector<LexiconDocument> merged(inputs.size());
  kj::Vector<bool> imported(inputs.size());
  for (auto& document: inputs) {
    merged.add(kj::mv(document));
    imported.add(false);
  }

  for (auto dir: importPath) {
    for (auto& document: loadTree(*dir)) {
      bool shadowed = false;
      for (auto& existing: merged) {
        if (existing.nsid == document.nsid) {
          shadowed = true;
          break;
        }
      }
      if (shadowed) {
        KJ_LOG(INFO, "import shadowed by an earlier declaration", document.nsid,
               document.sourceName);
      } else {
        merged.add(kj::mv(document));
        imported.add(true);
      }
    }
  }

  // Order the merged set by NSID, carrying the import flags along.
  auto order = kj::heapArray<size_t>(merged.size());
  for (size_t i = 0; i < order.size(); i++) order[i] = i;
  std::sort(order.begin(), order.end(), [&](size_t a, size_t b) {
    return merged[a].nsid.asPtr() < merged[b].nsid.asPtr();
  });

  auto documents = KJ_MAP(i, order) { return kj::mv(merged[i]); };
  auto flags = KJ_MAP(i, order) { return imported[i]; };

  KJ_LOG(INFO, "loaded lexicons", inputs.size(), documents.size() - inputs.size());

  return DocumentSet(kj::mv(documents), kj::mv(flags));
}

}  // namespace lexgen
