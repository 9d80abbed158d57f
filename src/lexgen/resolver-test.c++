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

#include "resolver.h"
#include "test-util.h"

namespace lexgen {
namespace {

using _::newTestDirectory;
using _::writeFile;

DocumentSet load(const kj::ReadableDirectory& dir) {
  Loader loader;
  return loader.load(dir);
}

KJ_TEST("parse refs") {
  {
    auto parsed = parseRef("app.test.a", "#local");
    auto& key = KJ_ASSERT_NONNULL(parsed);
    KJ_EXPECT(key.nsid == "app.test.a");
    KJ_EXPECT(key.name == "local");
  }
  {
    auto parsed = parseRef("app.test.a", "app.test.b#view");
    auto& key = KJ_ASSERT_NONNULL(parsed);
    KJ_EXPECT(key.nsid == "app.test.b");
    KJ_EXPECT(key.name == "view");
  }
  {
    auto parsed = parseRef("app.test.a", "app.test.b");
    auto& key = KJ_ASSERT_NONNULL(parsed);
    KJ_EXPECT(key.nsid == "app.test.b");
    KJ_EXPECT(key.name == "main");
  }

  KJ_EXPECT(parseRef("app.test.a", "") == kj::none);
  KJ_EXPECT(parseRef("app.test.a", "#") == kj::none);
  KJ_EXPECT(parseRef("app.test.a", "nodots#x") == kj::none);
  KJ_EXPECT(parseRef("app.test.a", "app.test.b#1x") == kj::none);
}

KJ_TEST("type tags") {
  KJ_EXPECT(SymbolKey({kj::str("app.test.a"), kj::str("main")}).getTypeTag() == "app.test.a");
  KJ_EXPECT(SymbolKey({kj::str("app.test.a"), kj::str("view")}).getTypeTag() ==
            "app.test.a#view");
  KJ_EXPECT(kj::str(SymbolKey({kj::str("app.test.a"), kj::str("view")})) == "app.test.a#view");
}

KJ_TEST("prefix matching") {
  KJ_EXPECT(matchesPrefix("app.bsky.feed.post", "app.bsky"));
  KJ_EXPECT(matchesPrefix("app.bsky.feed.post", "app.bsky."));
  KJ_EXPECT(matchesPrefix("app.bsky.feed.post", "app.bsky.feed.post"));
  KJ_EXPECT(matchesPrefix("app.bsky.feed.post", ""));
  KJ_EXPECT(!matchesPrefix("app.bskyx.post", "app.bsky"));
  KJ_EXPECT(!matchesPrefix("app.bsky", "app.bsky.feed"));
  KJ_EXPECT(!matchesPrefix("com.example.a", "app"));
}

KJ_TEST("resolve references across documents") {
  auto dir = newTestDirectory();
  writeFile(*dir, "post.json", R"({"lexicon": 1, "id": "app.test.post", "defs": {
    "main": {"type": "object", "properties": {
      "author": {"type": "ref", "ref": "app.test.actor#view"},
      "reply": {"type": "ref", "ref": "#replyRef"},
      "embed": {"type": "union", "refs": ["app.test.actor", "#replyRef"]}
    }},
    "replyRef": {"type": "object", "properties": {}}
  }})");
  writeFile(*dir, "actor.json", R"({"lexicon": 1, "id": "app.test.actor", "defs": {
    "main": {"type": "token"},
    "view": {"type": "object", "properties": {"name": {"type": "string"}}}
  }})");

  auto documents = load(*dir);
  auto symbols = resolve(documents);

  KJ_EXPECT(symbols.getGeneratedDocuments().size() == 2);
  KJ_EXPECT(symbols.getPrefix() == kj::none);

  auto& view = symbols.resolve("app.test.post", "app.test.actor#view");
  KJ_EXPECT(view.key.nsid == "app.test.actor");
  KJ_EXPECT(view.definition->which() == Definition::Kind::OBJECT);
  KJ_EXPECT(view.generated);

  auto deps = symbols.getDependencies(SymbolKey { kj::str("app.test.post"), kj::str("main") });
  KJ_ASSERT(deps.size() == 3, deps.size());
  KJ_EXPECT(kj::str(deps[0]) == "app.test.actor");
  KJ_EXPECT(kj::str(deps[1]) == "app.test.actor#view");
  KJ_EXPECT(kj::str(deps[2]) == "app.test.post#replyRef");

  KJ_EXPECT(symbols.getCycles().size() == 0);

  LEXGEN_EXPECT_ERROR(UNRESOLVED_REFERENCE, symbols.resolve("app.test.post", "#missing"));
  LEXGEN_EXPECT_ERROR(UNRESOLVED_REFERENCE, symbols.resolve("app.test.post", "bad ref"));
}

KJ_TEST("unresolved reference") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "array", "items": {"type": "ref", "ref": "app.test.nowhere#x"}}
  }})");

  auto documents = load(*dir);
  LEXGEN_EXPECT_ERROR(UNRESOLVED_REFERENCE, resolve(documents));
}

KJ_TEST("prefix selects generated documents") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "ref", "ref": "com.other.b"}
  }})");
  writeFile(*dir, "b.json", R"({"lexicon": 1, "id": "com.other.b", "defs": {
    "main": {"type": "ref", "ref": "com.other.nowhere"}
  }})");

  auto documents = load(*dir);

  // Refs in documents outside the prefix are not checked.
  auto symbols = resolve(documents, "app.test"_kj);
  KJ_ASSERT(symbols.getGeneratedDocuments().size() == 1);
  KJ_EXPECT(symbols.getGeneratedDocuments()[0]->nsid == "app.test.a");
  auto prefix = symbols.getPrefix();
  KJ_EXPECT(KJ_ASSERT_NONNULL(prefix) == "app.test");

  auto& b = symbols.resolve("app.test.a", "com.other.b");
  KJ_EXPECT(!b.generated);

  auto none = resolve(documents, "org.nothing"_kj);
  KJ_EXPECT(none.getGeneratedDocuments().size() == 0);
}

KJ_TEST("cycles") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.a", "defs": {
    "main": {"type": "object", "properties": {"b": {"type": "ref", "ref": "app.b"}}}
  }})");
  writeFile(*dir, "b.json", R"({"lexicon": 1, "id": "app.b", "defs": {
    "main": {"type": "object", "properties": {"a": {"type": "ref", "ref": "app.a"}}},
    "node": {"type": "object", "properties": {
      "children": {"type": "array", "items": {"type": "ref", "ref": "#node"}}
    }},
    "leaf": {"type": "string"}
  }})");

  auto documents = load(*dir);
  auto symbols = resolve(documents);

  auto cycles = symbols.getCycles();
  KJ_ASSERT(cycles.size() == 2, cycles.size());

  bool sawPair = false;
  bool sawSelf = false;
  for (auto& cycle: cycles) {
    if (cycle.size() == 2) {
      KJ_EXPECT(kj::str(cycle[0]) == "app.a");
      KJ_EXPECT(kj::str(cycle[1]) == "app.b");
      sawPair = true;
    } else if (cycle.size() == 1) {
      KJ_EXPECT(kj::str(cycle[0]) == "app.b#node");
      sawSelf = true;
    }
  }
  KJ_EXPECT(sawPair);
  KJ_EXPECT(sawSelf);

  KJ_EXPECT(symbols.isCyclic(SymbolKey { kj::str("app.a"), kj::str("main") }));
  KJ_EXPECT(symbols.isCyclic(SymbolKey { kj::str("app.b"), kj::str("node") }));
  KJ_EXPECT(!symbols.isCyclic(SymbolKey { kj::str("app.b"), kj::str("leaf") }));
}

}  // namespace
}  // namespace lexgen
