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

#include "cache.h"
#include "hash.h"
#include <kj/debug.h>
#include <algorithm>
#include <stdlib.h>

namespace lexgen {

namespace {

void collectFiles(const kj::ReadableDirectory& dir, kj::PathPtr prefix,
                  kj::Vector<kj::Path>& results) {
  for (auto& entry: dir.listEntries()) {
    if (entry.type == kj::FsNode::Type::DIRECTORY) {
      collectFiles(*dir.openSubdir(kj::Path(entry.name)), prefix.append(entry.name), results);
    } else {
      results.add(prefix.append(entry.name));
    }
  }
}

bool isDigest(kj::StringPtr digest) {
  if (digest.size() != DIGEST_BYTES * 2) return false;
  for (char c: digest) {
    if (!(('0' <= c && c <= '9') || ('a' <= c && c <= 'f'))) return false;
  }
  return true;
}

}  // namespace

OutputCache::OutputCache(const kj::Directory& root): root(root) {}

kj::Path OutputCache::entryPath(kj::StringPtr digest) {
  KJ_REQUIRE(isDigest(digest), "not a lexicon digest", digest);
  return kj::Path(digest);
}

kj::Maybe<kj::Array<kj::Path>> OutputCache::find(kj::StringPtr digest) const {
  auto entry = root.tryOpenSubdir(entryPath(digest));
  KJ_IF_SOME(dir, entry) {
    kj::Vector<kj::Path> files;
    collectFiles(*dir, kj::Path(nullptr), files);
    auto result = files.releaseAsArray();
    std::sort(result.begin(), result.end());
    return kj::mv(result);
  }
  return kj::none;
}

void OutputCache::store(kj::StringPtr digest, kj::ArrayPtr<const OutputFile> files) const {
  auto replacer = root.replaceSubdir(entryPath(digest),
      kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
  auto& entry = replacer->get();
  for (auto& file: files) {
    entry.openFile(file.path, kj::WriteMode::CREATE | kj::WriteMode::CREATE_PARENT)
        ->writeAll(file.content);
  }
  replacer->commit();

  KJ_LOG(INFO, "stored cache entry", digest, files.size());
}

void OutputCache::store(kj::StringPtr digest, const kj::ReadableDirectory& outputDir,
                        kj::ArrayPtr<const kj::Path> files) const {
  auto contents = KJ_MAP(path, files) {
    return OutputFile { path.clone(), outputDir.openFile(path)->readAllText() };
  };
  store(digest, contents);
}

kj::Array<kj::Path> OutputCache::restore(kj::StringPtr digest,
                                         const kj::Directory& outputDir) const {
  auto found = find(digest);
  KJ_IF_SOME(files, found) {
    auto entry = root.openSubdir(entryPath(digest));
    auto contents = KJ_MAP(path, files) {
      return OutputFile { path.clone(), entry->openFile(path)->readAllText() };
    };

    KJ_LOG(INFO, "restored cache entry", digest, contents.size());
    return writeFiles(outputDir, contents);
  }
  KJ_FAIL_REQUIRE("no cache entry", digest);
}

kj::Maybe<kj::Path> defaultCacheRoot() {
  const char* xdg = getenv("XDG_CACHE_HOME");
  if (xdg != nullptr && *xdg == '/') {
    return kj::Path::parse(xdg + 1).append("lexgen");
  }

  const char* home = getenv("HOME");
  if (home != nullptr && *home == '/') {
    return kj::Path::parse(home + 1).append(kj::Path({".cache", "lexgen"}));
  }

  return kj::none;
}

}  // namespace lexgen
