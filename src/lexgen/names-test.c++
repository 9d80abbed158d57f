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

#include "names.h"
#include "test-util.h"

namespace lexgen {
namespace {

SymbolKey key(kj::StringPtr nsid, kj::StringPtr name) {
  return SymbolKey { kj::str(nsid), kj::str(name) };
}

GeneratedUnit structUnit(SymbolKey key, kj::ArrayPtr<const kj::StringPtr> properties) {
  auto fields = KJ_MAP(property, properties) {
    return UnitField {
      .jsonName = kj::str(property),
      .type = kj::heap<ResolvedType>(ResolvedType::Scalar { .kind = ScalarKind::TEXT }),
      .required = true,
      .nullable = false,
    };
  };
  auto typeTag = key.getTypeTag();
  return GeneratedUnit {
    .key = kj::mv(key),
    .document = nullptr,
    .kind = GeneratedUnit::Kind::STRUCT,
    .fields = kj::mv(fields),
    .typeTag = kj::mv(typeTag),
  };
}

KJ_TEST("split identifiers into words") {
  auto words = splitWords("getTimeline");
  KJ_ASSERT(words.size() == 2);
  KJ_EXPECT(words[0] == "get");
  KJ_EXPECT(words[1] == "Timeline");

  words = splitWords("HTMLParser");
  KJ_ASSERT(words.size() == 2);
  KJ_EXPECT(words[0] == "HTML");
  KJ_EXPECT(words[1] == "Parser");

  words = splitWords("app.bsky-feed_post2x");
  KJ_ASSERT(words.size() == 4);
  KJ_EXPECT(words[3] == "post2x");

  KJ_EXPECT(splitWords("...").size() == 0);
}

KJ_TEST("case conversion") {
  KJ_EXPECT(toPascalCase("getTimeline") == "GetTimeline");
  KJ_EXPECT(toPascalCase("post_view") == "PostView");
  KJ_EXPECT(toPascalCase("DID") == "Did");
  KJ_EXPECT(toSnakeCase("createdAt") == "created_at");
  KJ_EXPECT(toSnakeCase("replyCount") == "reply_count");
  KJ_EXPECT(toSnakeCase("uri") == "uri");
  KJ_EXPECT(toSnakeCase("HTMLBody") == "html_body");
}

KJ_TEST("unit names") {
  KJ_EXPECT(unitName(key("app.test.thing", "main")) == "AppTestThing");
  KJ_EXPECT(unitName(key("app.bsky.feed.defs", "postView")) == "AppBskyFeedDefsPostView");
  KJ_EXPECT(unitName(key("app.bsky.feed.getTimeline", "main.output")) ==
            "AppBskyFeedGetTimelineOutput");
  KJ_EXPECT(unitName(key("app.test.a", "main.point")) == "AppTestAPoint");
  KJ_EXPECT(unitName(key("app.test.a", "view.item")) == "AppTestAViewItem");
  KJ_EXPECT(unitName(key("9app.test", "main")) == "_9appTest");
}

KJ_TEST("field names") {
  KJ_EXPECT(fieldName("createdAt") == "created_at");
  KJ_EXPECT(fieldName("text") == "text");
  KJ_EXPECT(fieldName("from") == "from_");
  KJ_EXPECT(fieldName("class") == "class_");
  KJ_EXPECT(fieldName("json") == "json_");
  KJ_EXPECT(fieldName("modelConfig") == "model_config_");
  KJ_EXPECT(fieldName("list") == "list_");
  KJ_EXPECT(fieldName("$type") == "type");
  KJ_EXPECT(fieldName("3d") == "field_3d");
  KJ_EXPECT(fieldName("$") == "field");
}

KJ_TEST("allocate names") {
  kj::StringPtr postFields[] = {"text", "createdAt"};
  auto units = kj::arr(
      structUnit(key("app.test.post", "main"), postFields),
      structUnit(key("app.test.post", "view"), nullptr));

  auto table = allocate(units);
  KJ_EXPECT(table.getName(units[0].key) == "AppTestPost");
  KJ_EXPECT(table.getName(units[1].key) == "AppTestPostView");

  auto fields = table.getFieldNames(units[0].key);
  KJ_ASSERT(fields.size() == 2);
  KJ_EXPECT(fields[0] == "text");
  KJ_EXPECT(fields[1] == "created_at");
}

KJ_TEST("unit name collisions") {
  // `app.test.fooBar` and `app.test.foo#bar` both become AppTestFooBar.
  auto units = kj::arr(
      structUnit(key("app.test.fooBar", "main"), nullptr),
      structUnit(key("app.test.foo", "bar"), nullptr));
  LEXGEN_EXPECT_ERROR(NAME_COLLISION, allocate(units));
}

KJ_TEST("field name collisions") {
  kj::StringPtr clashing[] = {"createdAt", "created_at"};
  auto units = kj::arr(structUnit(key("app.test.a", "main"), clashing));
  LEXGEN_EXPECT_ERROR(NAME_COLLISION, allocate(units));

  // The discriminator attribute is taken on union variants.
  kj::StringPtr discriminator[] = {"lexType"};
  auto variant = kj::arr(structUnit(key("app.test.b", "main"), discriminator));
  variant[0].unionVariant = true;
  LEXGEN_EXPECT_ERROR(NAME_COLLISION, allocate(variant));

  variant[0].unionVariant = false;
  allocate(variant);
}

}  // namespace
}  // namespace lexgen
