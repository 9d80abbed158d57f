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

#include "types.h"
#include "test-util.h"

namespace lexgen {
namespace {

using _::newTestDirectory;
using _::writeFile;

struct Fixture {
  // Loads and resolves one in-memory tree.

  kj::Own<const kj::Directory> dir = newTestDirectory();
  DocumentSet documents;

  const SymbolTable& resolve(kj::Maybe<kj::StringPtr> prefix = kj::none) {
    Loader loader;
    documents = loader.load(*dir);
    symbols = lexgen::resolve(documents, prefix);
    return KJ_ASSERT_NONNULL(symbols);
  }

  kj::Maybe<SymbolTable> symbols;
};

const GeneratedUnit& findUnit(kj::ArrayPtr<const GeneratedUnit> units, kj::StringPtr key) {
  for (auto& unit: units) {
    if (kj::str(unit.key) == key) return unit;
  }
  KJ_FAIL_ASSERT("no such unit", key);
}

KJ_TEST("record becomes a struct with fields in declaration order") {
  Fixture fixture;
  writeFile(*fixture.dir, "thing.json", R"({"lexicon": 1, "id": "app.test.thing", "defs": {
    "main": {"type": "record", "key": "tid", "description": "A thing.", "record": {
      "type": "object",
      "required": ["title"],
      "properties": {
        "title": {"type": "string", "maxLength": 100},
        "count": {"type": "integer"}
      }
    }}
  }})");

  auto units = synthesizeAll(fixture.resolve());
  KJ_ASSERT(units.size() == 1);

  auto& unit = units[0];
  KJ_EXPECT(unit.kind == GeneratedUnit::Kind::STRUCT);
  KJ_EXPECT(kj::str(unit.key) == "app.test.thing");
  KJ_EXPECT(unit.typeTag == "app.test.thing");
  KJ_EXPECT(KJ_ASSERT_NONNULL(unit.description) == "A thing.");
  KJ_EXPECT(!unit.unionVariant);
  KJ_EXPECT(unit.dependencies.size() == 0);

  KJ_ASSERT(unit.fields.size() == 2);
  auto& title = unit.fields[0];
  KJ_EXPECT(title.jsonName == "title");
  KJ_EXPECT(title.required);
  KJ_EXPECT(!title.nullable);
  KJ_ASSERT(title.type->which() == ResolvedType::Kind::SCALAR);
  KJ_EXPECT(title.type->getScalar().kind == ScalarKind::TEXT);
  KJ_EXPECT(KJ_ASSERT_NONNULL(title.type->getScalar().maxLength) == 100);

  auto& count = unit.fields[1];
  KJ_EXPECT(count.jsonName == "count");
  KJ_EXPECT(!count.required);
  KJ_EXPECT(count.type->getScalar().kind == ScalarKind::INTEGER);
}

KJ_TEST("methods produce parameter and body units") {
  Fixture fixture;
  writeFile(*fixture.dir, "get.json", R"({"lexicon": 1, "id": "app.test.getThing", "defs": {
    "main": {
      "type": "query",
      "parameters": {"type": "params", "properties": {"id": {"type": "string"}}},
      "output": {"encoding": "application/json", "schema": {
        "type": "object",
        "properties": {"thing": {"type": "ref", "ref": "#view"}}
      }}
    },
    "view": {"type": "object", "properties": {"name": {"type": "string"}}}
  }})");
  writeFile(*fixture.dir, "put.json", R"({"lexicon": 1, "id": "app.test.putThing", "defs": {
    "main": {
      "type": "procedure",
      "input": {"encoding": "application/json", "schema": {"type": "ref",
                                                           "ref": "app.test.getThing#view"}}
    }
  }})");

  auto units = synthesizeAll(fixture.resolve());
  KJ_ASSERT(units.size() == 5, units.size());

  // Declaration order, nested units after their parent.
  KJ_EXPECT(kj::str(units[0].key) == "app.test.getThing");
  KJ_EXPECT(kj::str(units[1].key) == "app.test.getThing#main.output");
  KJ_EXPECT(kj::str(units[2].key) == "app.test.getThing#view");
  KJ_EXPECT(kj::str(units[3].key) == "app.test.putThing");
  KJ_EXPECT(kj::str(units[4].key) == "app.test.putThing#main.input");

  KJ_EXPECT(units[0].fields.size() == 1);
  KJ_EXPECT(units[3].kind == GeneratedUnit::Kind::STRUCT);
  KJ_EXPECT(units[3].fields.size() == 0);

  auto& output = units[1];
  KJ_EXPECT(output.kind == GeneratedUnit::Kind::STRUCT);
  KJ_ASSERT(output.dependencies.size() == 1);
  KJ_EXPECT(kj::str(output.dependencies[0]) == "app.test.getThing#view");

  auto& input = units[4];
  KJ_EXPECT(input.kind == GeneratedUnit::Kind::ALIAS);
  auto& type = *KJ_ASSERT_NONNULL(input.aliasType);
  KJ_ASSERT(type.which() == ResolvedType::Kind::NAMED);
  KJ_EXPECT(kj::str(type.getNamed().target) == "app.test.getThing#view");

  for (size_t i = 0; i < units.size(); i++) {
    for (size_t j = i + 1; j < units.size(); j++) {
      KJ_EXPECT(!(units[i].key == units[j].key));
    }
  }
}

KJ_TEST("inline objects, enums, nullable and defaults") {
  Fixture fixture;
  writeFile(*fixture.dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "nullable": ["note"], "properties": {
      "kind": {"type": "string", "enum": ["x", "y"]},
      "version": {"type": "integer", "const": 2},
      "note": {"type": "string"},
      "size": {"type": "integer", "default": 10},
      "point": {"type": "object", "properties": {"x": {"type": "integer"}}},
      "tags": {"type": "array", "items": {"type": "string"}, "maxLength": 5}
    }}
  }})");

  auto units = synthesizeAll(fixture.resolve());
  KJ_ASSERT(units.size() == 2, units.size());

  auto& main = units[0];
  KJ_ASSERT(main.fields.size() == 6);

  auto& kind = *main.fields[0].type;
  KJ_ASSERT(kind.which() == ResolvedType::Kind::ENUM);
  KJ_ASSERT(kind.getEnum().values.size() == 2);
  KJ_EXPECT(kind.getEnum().values[1].get<kj::String>() == "y");

  auto& version = *main.fields[1].type;
  KJ_ASSERT(version.which() == ResolvedType::Kind::ENUM);
  KJ_ASSERT(version.getEnum().values.size() == 1);
  KJ_EXPECT(version.getEnum().values[0].get<int64_t>() == 2);

  auto& note = main.fields[2];
  KJ_EXPECT(note.nullable);
  KJ_ASSERT(note.type->which() == ResolvedType::Kind::OPTIONAL);
  KJ_EXPECT(note.type->getOptional().inner->which() == ResolvedType::Kind::SCALAR);

  auto& size = main.fields[3];
  KJ_EXPECT(KJ_ASSERT_NONNULL(size.defaultValue).get<int64_t>() == 10);

  auto& point = *main.fields[4].type;
  KJ_ASSERT(point.which() == ResolvedType::Kind::NAMED);
  KJ_EXPECT(kj::str(point.getNamed().target) == "app.test.a#main.point");
  KJ_EXPECT(kj::str(units[1].key) == "app.test.a#main.point");
  KJ_EXPECT(units[1].typeTag == "app.test.a#main.point");

  auto& tags = *main.fields[5].type;
  KJ_ASSERT(tags.which() == ResolvedType::Kind::LIST);
  KJ_EXPECT(KJ_ASSERT_NONNULL(tags.getList().maxLength) == 5);

  KJ_ASSERT(main.dependencies.size() == 1);
  KJ_EXPECT(kj::str(main.dependencies[0]) == "app.test.a#main.point");
}

KJ_TEST("unions mark their variants") {
  Fixture fixture;
  writeFile(*fixture.dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {
      "embed": {"type": "union", "refs": ["#image", "#video"]}
    }},
    "image": {"type": "object", "properties": {}},
    "video": {"type": "object", "properties": {}},
    "other": {"type": "object", "properties": {}},
    "marker": {"type": "token"}
  }})");

  auto units = synthesizeAll(fixture.resolve());
  KJ_EXPECT(findUnit(units, "app.test.a#image").unionVariant);
  KJ_EXPECT(findUnit(units, "app.test.a#video").unionVariant);
  KJ_EXPECT(!findUnit(units, "app.test.a#other").unionVariant);
  KJ_EXPECT(!findUnit(units, "app.test.a").unionVariant);

  auto& marker = findUnit(units, "app.test.a#marker");
  KJ_EXPECT(marker.kind == GeneratedUnit::Kind::TOKEN);
  KJ_EXPECT(marker.typeTag == "app.test.a#marker");

  auto& embed = *findUnit(units, "app.test.a").fields[0].type;
  KJ_ASSERT(embed.which() == ResolvedType::Kind::UNION);
  KJ_EXPECT(!embed.getUnion().closed);
  KJ_EXPECT(embed.getUnion().variants.size() == 2);
}

KJ_TEST("references outside the prefix become opaque units") {
  Fixture fixture;
  writeFile(*fixture.dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {
      "b": {"type": "ref", "ref": "com.other.b#view"},
      "again": {"type": "array", "items": {"type": "ref", "ref": "com.other.b#view"}}
    }}
  }})");
  writeFile(*fixture.dir, "b.json", R"({"lexicon": 1, "id": "com.other.b", "defs": {
    "view": {"type": "object", "description": "Elsewhere.", "properties": {}}
  }})");

  auto units = synthesizeAll(fixture.resolve("app.test"_kj));
  KJ_ASSERT(units.size() == 2, units.size());

  auto& field = *units[0].fields[0].type;
  KJ_ASSERT(field.which() == ResolvedType::Kind::UNRESOLVED);
  KJ_EXPECT(kj::str(field.getUnresolved().target) == "com.other.b#view");

  auto& opaque = units[1];
  KJ_EXPECT(opaque.kind == GeneratedUnit::Kind::OPAQUE);
  KJ_EXPECT(kj::str(opaque.key) == "com.other.b#view");
  KJ_EXPECT(KJ_ASSERT_NONNULL(opaque.description) == "Elsewhere.");
}

KJ_TEST("opaque units remember whether the target is an object") {
  Fixture fixture;
  writeFile(*fixture.dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {
      "label": {"type": "ref", "ref": "com.other.defs#labelValue"},
      "view": {"type": "ref", "ref": "com.other.defs#view"},
      "post": {"type": "ref", "ref": "com.other.post"}
    }}
  }})");
  writeFile(*fixture.dir, "defs.json", R"({"lexicon": 1, "id": "com.other.defs", "defs": {
    "labelValue": {"type": "string", "knownValues": ["spam", "nudity"]},
    "view": {"type": "object", "properties": {}}
  }})");
  writeFile(*fixture.dir, "post.json", R"({"lexicon": 1, "id": "com.other.post", "defs": {
    "main": {"type": "record", "key": "tid", "record": {"type": "object", "properties": {}}}
  }})");

  auto units = synthesizeAll(fixture.resolve("app.test"_kj));
  KJ_ASSERT(units.size() == 4, units.size());

  auto& label = findUnit(units, "com.other.defs#labelValue");
  KJ_EXPECT(label.kind == GeneratedUnit::Kind::OPAQUE);
  KJ_EXPECT(!label.opaqueObject);
  KJ_EXPECT(findUnit(units, "com.other.defs#view").opaqueObject);
  KJ_EXPECT(findUnit(units, "com.other.post").opaqueObject);
}

}  // namespace
}  // namespace lexgen
