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
#include "test-util.h"

namespace lexgen {
namespace {

using _::newTestDirectory;
using _::writeFile;

kj::String lexicon(kj::StringPtr nsid, kj::StringPtr description = "x") {
  return kj::str(R"({"lexicon": 1, "id": ")", nsid, R"(", "description": ")", description,
                 R"(", "defs": {"main": {"type": "token"}}})");
}

KJ_TEST("list lexicon files") {
  auto dir = newTestDirectory();
  writeFile(*dir, "b/post.json", "{}");
  writeFile(*dir, "a/z/like.json", "{}");
  writeFile(*dir, "a/readme.md", "not a lexicon");
  writeFile(*dir, "top.json", "{}");

  auto files = listLexiconFiles(*dir);
  KJ_ASSERT(files.size() == 3);
  KJ_EXPECT(files[0].name == "a/z/like.json");
  KJ_EXPECT(files[1].name == "b/post.json");
  KJ_EXPECT(files[2].name == "top.json");
  KJ_EXPECT(files[1].path == kj::Path({"b", "post.json"}));
}

KJ_TEST("load orders documents by NSID") {
  auto dir = newTestDirectory();
  writeFile(*dir, "1.json", lexicon("com.example.zeta"));
  writeFile(*dir, "2.json", lexicon("com.example.alpha"));
  writeFile(*dir, "sub/3.json", lexicon("app.test.mid"));

  Loader loader;
  auto documents = loader.load(*dir);
  auto list = documents.getDocuments();
  KJ_ASSERT(list.size() == 3);
  KJ_EXPECT(list[0].nsid == "app.test.mid");
  KJ_EXPECT(list[0].sourceName == "sub/3.json");
  KJ_EXPECT(list[1].nsid == "com.example.alpha");
  KJ_EXPECT(list[2].nsid == "com.example.zeta");
  KJ_EXPECT(documents.getImportedCount() == 0);

  KJ_EXPECT(KJ_ASSERT_NONNULL(documents.find("com.example.alpha")).sourceName == "2.json");
  KJ_EXPECT(documents.find("com.example.beta") == kj::none);
}

KJ_TEST("empty tree loads nothing") {
  auto dir = newTestDirectory();
  Loader loader;
  KJ_EXPECT(loader.load(*dir).getDocuments().size() == 0);
}

KJ_TEST("duplicate NSID in one tree") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", lexicon("app.test.same"));
  writeFile(*dir, "b.json", lexicon("app.test.same"));

  Loader loader;
  LEXGEN_EXPECT_ERROR(DUPLICATE_DOCUMENT, loader.load(*dir));
}

KJ_TEST("malformed file fails the load") {
  auto dir = newTestDirectory();
  writeFile(*dir, "good.json", lexicon("app.test.good"));
  writeFile(*dir, "bad.json", "{\"lexicon\": 1");

  Loader loader;
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, loader.load(*dir));
}

KJ_TEST("import paths") {
  auto input = newTestDirectory();
  writeFile(*input, "mine.json", lexicon("app.test.mine", "input"));
  writeFile(*input, "shared.json", lexicon("com.shared.thing", "input"));

  auto imports = newTestDirectory();
  writeFile(*imports, "shared.json", lexicon("com.shared.thing", "import"));
  writeFile(*imports, "other.json", lexicon("com.shared.other", "import"));

  Loader loader;
  loader.addImportPath(*imports);
  auto documents = loader.load(*input);

  auto list = documents.getDocuments();
  KJ_ASSERT(list.size() == 3);
  KJ_EXPECT(documents.getImportedCount() == 1);

  auto& mine = KJ_ASSERT_NONNULL(documents.find("app.test.mine"));
  KJ_EXPECT(!documents.isImported(mine));

  // The input tree's declaration wins over the import.
  auto& shared = KJ_ASSERT_NONNULL(documents.find("com.shared.thing"));
  KJ_EXPECT(!documents.isImported(shared));
  KJ_EXPECT(KJ_ASSERT_NONNULL(shared.description) == "input");

  auto& other = KJ_ASSERT_NONNULL(documents.find("com.shared.other"));
  KJ_EXPECT(documents.isImported(other));
}

}  // namespace
}  // namespace lexgen
