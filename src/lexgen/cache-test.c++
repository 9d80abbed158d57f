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
#include "test-util.h"

namespace lexgen {
namespace {

using _::newTestDirectory;
using _::readFile;
using _::writeFile;

const kj::StringPtr DIGEST = "0123456789abcdef";

KJ_TEST("store, find and restore") {
  auto root = newTestDirectory();
  OutputCache cache(*root);

  KJ_EXPECT(cache.find(DIGEST) == kj::none);

  auto files = kj::arr(
      OutputFile { kj::Path("models.py"), kj::str("x = 1\n") },
      OutputFile { kj::Path({"extra", "notes.txt"}), kj::str("notes\n") });
  cache.store(DIGEST, files);

  KJ_EXPECT(readFile(*root, "0123456789abcdef/models.py") == "x = 1\n");

  auto found = cache.find(DIGEST);
  auto& paths = KJ_ASSERT_NONNULL(found);
  KJ_ASSERT(paths.size() == 2);
  KJ_EXPECT(paths[0] == kj::Path({"extra", "notes.txt"}));
  KJ_EXPECT(paths[1] == kj::Path("models.py"));

  auto output = newTestDirectory();
  auto restored = cache.restore(DIGEST, *output);
  KJ_EXPECT(restored.size() == 2);
  KJ_EXPECT(readFile(*output, "models.py") == "x = 1\n");
  KJ_EXPECT(readFile(*output, "extra/notes.txt") == "notes\n");
}

KJ_TEST("storing replaces the whole entry") {
  auto root = newTestDirectory();
  OutputCache cache(*root);

  auto oldFiles = kj::arr(OutputFile { kj::Path("old.py"), kj::str("old") });
  cache.store(DIGEST, oldFiles);
  auto newFiles = kj::arr(OutputFile { kj::Path("models.py"), kj::str("new") });
  cache.store(DIGEST, newFiles);

  auto found = cache.find(DIGEST);
  auto& paths = KJ_ASSERT_NONNULL(found);
  KJ_ASSERT(paths.size() == 1);
  KJ_EXPECT(paths[0] == kj::Path("models.py"));
}

KJ_TEST("an empty entry is a hit") {
  auto root = newTestDirectory();
  OutputCache cache(*root);

  cache.store(DIGEST, nullptr);
  auto found = cache.find(DIGEST);
  KJ_EXPECT(KJ_ASSERT_NONNULL(found).size() == 0);
}

KJ_TEST("store from an output directory") {
  auto root = newTestDirectory();
  OutputCache cache(*root);

  auto output = newTestDirectory();
  writeFile(*output, "models.py", "y = 2\n");
  writeFile(*output, "unrelated.txt", "not part of the entry");

  auto paths = kj::arr(kj::Path("models.py"));
  cache.store(DIGEST, *output, paths);

  auto found = cache.find(DIGEST);
  KJ_EXPECT(KJ_ASSERT_NONNULL(found).size() == 1);
  KJ_EXPECT(readFile(*root, "0123456789abcdef/models.py") == "y = 2\n");
}

KJ_TEST("digests are validated") {
  auto root = newTestDirectory();
  OutputCache cache(*root);

  KJ_EXPECT_THROW_MESSAGE("not a lexicon digest", cache.find("../escape"));
  KJ_EXPECT_THROW_MESSAGE("not a lexicon digest", cache.find("0123456789ABCDEF"));
  KJ_EXPECT_THROW_MESSAGE("no cache entry", cache.restore(DIGEST, *newTestDirectory()));
}

}  // namespace
}  // namespace lexgen
