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

#include "hash.h"
#include "test-util.h"

namespace lexgen {
namespace {

using _::newTestDirectory;
using _::writeFile;

KJ_TEST("digest format hasn't changed") {
  // These change whenever the version does.
  KJ_ASSERT(kj::StringPtr(LEXGEN_VERSION_STRING) == "0.3.1");

  auto dir = newTestDirectory();
  KJ_EXPECT(hashLexicons(*dir) == "2ee6b1f6d00857d5");

  writeFile(*dir, "a.json", "{}");
  KJ_EXPECT(hashLexicons(*dir) == "217ad81d4600aef1");
  KJ_EXPECT(hashLexicons(*dir, "app.test"_kj) == "75c7596dab5e1ef6");
}

KJ_TEST("digest is stable and content-sensitive") {
  auto dir = newTestDirectory();
  writeFile(*dir, "app/test/a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {}})");
  writeFile(*dir, "app/test/b.json", R"({"lexicon": 1, "id": "app.test.b", "defs": {}})");
  writeFile(*dir, "notes.txt", "ignored");

  auto digest = hashLexicons(*dir);
  KJ_EXPECT(digest.size() == DIGEST_BYTES * 2);
  KJ_EXPECT(hashLexicons(*dir) == digest);

  // Files that are not lexicons do not count.
  writeFile(*dir, "notes.txt", "changed");
  KJ_EXPECT(hashLexicons(*dir) == digest);

  // One more byte in one file does.
  writeFile(*dir, "app/test/b.json", R"({"lexicon": 1, "id": "app.test.b", "defs": {}} )");
  auto changed = hashLexicons(*dir);
  KJ_EXPECT(changed != digest);

  // So does moving a file.
  dir->remove(kj::Path({"app", "test", "b.json"}));
  writeFile(*dir, "app/b.json", R"({"lexicon": 1, "id": "app.test.b", "defs": {}} )");
  KJ_EXPECT(hashLexicons(*dir) != changed);
}

KJ_TEST("digest covers options") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", "{}");
  auto imports = newTestDirectory();
  writeFile(*imports, "b.json", "{}");

  auto plain = hashLexicons(*dir);
  auto prefixed = hashLexicons(*dir, "app"_kj);
  KJ_EXPECT(prefixed != plain);
  KJ_EXPECT(hashLexicons(*dir, "app.test"_kj) != prefixed);

  // An empty prefix is still a prefix.
  KJ_EXPECT(hashLexicons(*dir, ""_kj) != plain);

  const kj::ReadableDirectory* importDirs[] = { imports.get() };
  auto withImports = hashLexicons(*dir, kj::none, importDirs);
  KJ_EXPECT(withImports != plain);

  // File boundaries are framed: content cannot migrate between trees unnoticed.
  auto merged = newTestDirectory();
  writeFile(*merged, "a.json", "{}");
  writeFile(*merged, "b.json", "{}");
  KJ_EXPECT(hashLexicons(*merged) != withImports);
}

KJ_TEST("hashing does not parse") {
  auto dir = newTestDirectory();
  writeFile(*dir, "broken.json", "{ not json");
  KJ_EXPECT(hashLexicons(*dir).size() == DIGEST_BYTES * 2);
}

}  // namespace
}  // namespace lexgen
