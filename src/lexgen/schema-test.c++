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

#include "schema.h"
#include "test-util.h"

namespace lexgen {
namespace {

LexiconDocument parse(kj::StringPtr text) {
  return parseLexicon("test.json", text);
}

KJ_TEST("parse record") {
  auto doc = parse(R"({
    "lexicon": 1,
    "id": "app.test.thing",
    "revision": 3,
    "description": "A thing.",
    "defs": {
      "main": {
        "type": "record",
        "key": "tid",
        "record": {
          "type": "object",
          "required": ["title"],
          "nullable": ["count"],
          "properties": {
            "title": {"type": "string", "maxLength": 100},
            "count": {"type": "integer", "minimum": 0, "default": 1}
          }
        }
      }
    }
  })");

  KJ_EXPECT(doc.nsid == "app.test.thing");
  KJ_EXPECT(doc.sourceName == "test.json");
  KJ_EXPECT(KJ_ASSERT_NONNULL(doc.revision) == 3);
  KJ_EXPECT(KJ_ASSERT_NONNULL(doc.description) == "A thing.");
  KJ_ASSERT(doc.defs.size() == 1);

  auto& main = KJ_ASSERT_NONNULL(doc.findDef("main"));
  KJ_ASSERT(main.which() == Definition::Kind::RECORD);
  KJ_EXPECT(main.isPrimary());
  KJ_EXPECT(main.getRecord().key == "tid");

  auto& object = main.getRecord().record->getObject();
  KJ_ASSERT(object.properties.size() == 2);
  KJ_EXPECT(object.properties[0].name == "title");
  KJ_EXPECT(object.properties[1].name == "count");
  KJ_EXPECT(object.isRequired("title"));
  KJ_EXPECT(!object.isRequired("count"));
  KJ_EXPECT(object.isNullable("count"));

  auto& title = object.properties[0].type->getString();
  KJ_EXPECT(KJ_ASSERT_NONNULL(title.maxLength) == 100);
  KJ_EXPECT(title.minLength == kj::none);

  auto& count = object.properties[1].type->getInteger();
  KJ_EXPECT(KJ_ASSERT_NONNULL(count.minimum) == 0);
  KJ_EXPECT(KJ_ASSERT_NONNULL(count.defaultValue) == 1);

  KJ_EXPECT(doc.findDef("other") == kj::none);
}

KJ_TEST("parse query with parameters and output") {
  auto doc = parse(R"({
    "lexicon": 1,
    "id": "app.test.getThings",
    "defs": {
      "main": {
        "type": "query",
        "parameters": {
          "type": "params",
          "properties": {"limit": {"type": "integer", "minimum": 1, "maximum": 100}}
        },
        "output": {
          "encoding": "application/json",
          "schema": {
            "type": "object",
            "required": ["things"],
            "properties": {
              "things": {"type": "array", "items": {"type": "ref", "ref": "app.test.thing"}}
            }
          }
        },
        "errors": [{"name": "NotFound"}]
      }
    }
  })");

  auto& main = KJ_ASSERT_NONNULL(doc.findDef("main"));
  KJ_ASSERT(main.which() == Definition::Kind::QUERY);
  auto& method = main.getMethod();
  auto& params = KJ_ASSERT_NONNULL(method.parameters)->getObject();
  KJ_EXPECT(params.isParams);
  KJ_EXPECT(method.input == kj::none);

  auto& output = KJ_ASSERT_NONNULL(method.output);
  KJ_EXPECT(KJ_ASSERT_NONNULL(output.encoding) == "application/json");
  auto& schema = *KJ_ASSERT_NONNULL(output.schema);
  auto& items = *schema.getObject().properties[0].type->getArray().items;
  KJ_EXPECT(items.getRef().target == "app.test.thing");

  KJ_ASSERT(method.errors.size() == 1);
  KJ_EXPECT(method.errors[0] == "NotFound");
}

KJ_TEST("parse scalar kinds") {
  auto doc = parse(R"({
    "lexicon": 1,
    "id": "app.test.defs",
    "defs": {
      "label": {"type": "string", "knownValues": ["a", "b"], "format": "handle"},
      "color": {"type": "string", "enum": ["red", "green"]},
      "flag": {"type": "boolean", "const": true},
      "raw": {"type": "bytes", "minLength": 1, "maxLength": 8},
      "link": {"type": "cid-link"},
      "image": {"type": "blob", "accept": ["image/*"], "maxSize": 1000000},
      "anything": {"type": "unknown"},
      "marker": {"type": "token", "description": "A marker."},
      "choice": {"type": "union", "refs": ["#label", "app.test.other#x"], "closed": true}
    }
  })");

  KJ_ASSERT(doc.defs.size() == 9);
  KJ_EXPECT(doc.defs[0].name == "label");
  KJ_EXPECT(doc.defs[8].name == "choice");

  auto& label = KJ_ASSERT_NONNULL(doc.findDef("label")).getString();
  KJ_EXPECT(label.knownValues.size() == 2);
  KJ_EXPECT(KJ_ASSERT_NONNULL(label.format) == "handle");

  auto& color = KJ_ASSERT_NONNULL(doc.findDef("color")).getString();
  KJ_EXPECT(color.enumValues.size() == 2);
  KJ_EXPECT(color.enumValues[1] == "green");

  KJ_EXPECT(KJ_ASSERT_NONNULL(KJ_ASSERT_NONNULL(doc.findDef("flag")).getBoolean().constValue));
  KJ_EXPECT(KJ_ASSERT_NONNULL(KJ_ASSERT_NONNULL(doc.findDef("raw")).getBytes().maxLength) == 8);
  KJ_EXPECT(KJ_ASSERT_NONNULL(doc.findDef("link")).which() == Definition::Kind::CID_LINK);
  KJ_EXPECT(KJ_ASSERT_NONNULL(doc.findDef("image")).getBlob().accept[0] == "image/*");
  KJ_EXPECT(KJ_ASSERT_NONNULL(doc.findDef("anything")).which() == Definition::Kind::UNKNOWN);

  auto& marker = KJ_ASSERT_NONNULL(doc.findDef("marker"));
  KJ_EXPECT(marker.which() == Definition::Kind::TOKEN);
  auto description = marker.getDescription();
  KJ_EXPECT(KJ_ASSERT_NONNULL(description) == "A marker.");

  auto& choice = KJ_ASSERT_NONNULL(doc.findDef("choice")).getUnion();
  KJ_EXPECT(choice.closed);
  KJ_ASSERT(choice.refs.size() == 2);
  KJ_EXPECT(choice.refs[0] == "#label");
}

KJ_TEST("malformed documents") {
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, parse("{not json"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, parse("[1, 2]"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, parse(R"({"id": "app.test.a", "defs": {}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 2, "id": "app.test.a", "defs": {}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, parse(R"({"lexicon": 1, "defs": {}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 1, "id": "nodots", "defs": {}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, parse(R"({"lexicon": 1, "id": "app.test.a"})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "string",
                "maxLength": "ten"}}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "object",
                "required": ["missing"], "properties": {}}}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "string",
                "maxLength": -1}}})"));
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "procedure",
                "input": {"schema": {"type": "object", "properties": {}}}}}})"));
}

KJ_TEST("unsupported definitions") {
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "float"}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"other": {"type": "record",
                "key": "tid", "record": {"type": "object", "properties": {}}}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "string",
                "minLength": 5, "maxLength": 2}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "object",
                "properties": {"t": {"type": "token"}}}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "query",
                "output": {"encoding": "application/json", "schema": {"type": "string"}}}}})"));
}

KJ_TEST("parameters hold only scalars and arrays of scalars") {
  auto doc = parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "query",
    "parameters": {"type": "params", "properties": {
      "tags": {"type": "array", "items": {"type": "string"}},
      "all": {"type": "boolean"},
      "extra": {"type": "unknown"}
    }}}}})");
  auto& main = KJ_ASSERT_NONNULL(doc.findDef("main"));
  auto& params = KJ_ASSERT_NONNULL(main.getMethod().parameters)->getObject();
  KJ_ASSERT(params.properties.size() == 3);
  KJ_EXPECT(params.properties[0].type->getArray().items->which() == Definition::Kind::STRING);

  // An inline object named like the output body would otherwise share its generated name.
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "query",
        "parameters": {"type": "params", "properties": {
          "output": {"type": "object", "properties": {"x": {"type": "string"}}}
        }},
        "output": {"encoding": "application/json",
                   "schema": {"type": "object", "properties": {}}}}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "procedure",
        "parameters": {"type": "params", "properties": {
          "items": {"type": "array", "items": {"type": "object", "properties": {}}}
        }}}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "query",
        "parameters": {"type": "params", "properties": {
          "grid": {"type": "array", "items": {"type": "array", "items": {"type": "integer"}}}
        }}}}})"));
  LEXGEN_EXPECT_ERROR(UNSUPPORTED_KIND,
      parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "subscription",
        "parameters": {"type": "params", "properties": {
          "link": {"type": "cid-link"}
        }}}}})"));

  // Arrays of objects stay legal outside of parameters.
  parse(R"({"lexicon": 1, "id": "app.test.a", "defs": {"main": {"type": "object",
    "properties": {"items": {"type": "array", "items": {"type": "object", "properties": {}}}}
  }}})");
}

KJ_TEST("NSID and def name syntax") {
  KJ_EXPECT(isValidNsid("app.bsky.feed.post"));
  KJ_EXPECT(isValidNsid("com.example-site.fooBar"));
  KJ_EXPECT(!isValidNsid("app"));
  KJ_EXPECT(!isValidNsid("app..post"));
  KJ_EXPECT(!isValidNsid("app.bsky.9post"));
  KJ_EXPECT(!isValidNsid("app.-bsky.post"));
  KJ_EXPECT(!isValidNsid(""));

  KJ_EXPECT(isValidDefName("main"));
  KJ_EXPECT(isValidDefName("postView2"));
  KJ_EXPECT(isValidDefName("with_underscore"));
  KJ_EXPECT(!isValidDefName("2fast"));
  KJ_EXPECT(!isValidDefName("main.output"));
  KJ_EXPECT(!isValidDefName(""));
}

}  // namespace
}  // namespace lexgen
