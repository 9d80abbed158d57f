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
#include "error.h"
#include <capnp/compat/json.h>
#include <capnp/message.h>
#include <kj/debug.h>
#include <kj/vector.h>
#include <math.h>

namespace lexgen {

bool ObjectType::isRequired(kj::StringPtr name) const {
  for (auto& r: required) {
    if (r == name) return true;
  }
  return false;
}

bool ObjectType::isNullable(kj::StringPtr name) const {
  for (auto& n: nullable) {
    if (n == name) return true;
  }
  return false;
}

// =======================================================================================

Definition::Definition(Kind kind, kj::Maybe<kj::String> description, Payload payload)
    : kind(kind), description(kj::mv(description)), payload(kj::mv(payload)) {}

kj::Maybe<kj::StringPtr> Definition::getDescription() const {
  KJ_IF_SOME(d, description) {
    return d.asPtr();
  }
  return kj::none;
}

bool Definition::isPrimary() const {
  switch (kind) {
    case Kind::RECORD:
    case Kind::QUERY:
    case Kind::PROCEDURE:
    case Kind::SUBSCRIPTION:
      return true;
    case Kind::OBJECT:
    case Kind::ARRAY:
    case Kind::STRING:
    case Kind::INTEGER:
    case Kind::BOOLEAN:
    case Kind::BYTES:
    case Kind::CID_LINK:
    case Kind::BLOB:
    case Kind::UNION:
    case Kind::TOKEN:
    case Kind::UNKNOWN:
    case Kind::REF:
      return false;
  }
  KJ_UNREACHABLE;
}

const StringType& Definition::getString() const {
  KJ_REQUIRE(kind == Kind::STRING, kind);
  return payload.get<StringType>();
}

const IntegerType& Definition::getInteger() const {
  KJ_REQUIRE(kind == Kind::INTEGER, kind);
  return payload.get<IntegerType>();
}

const BooleanType& Definition::getBoolean() const {
  KJ_REQUIRE(kind == Kind::BOOLEAN, kind);
  return payload.get<BooleanType>();
}

const BytesType& Definition::getBytes() const {
  KJ_REQUIRE(kind == Kind::BYTES, kind);
  return payload.get<BytesType>();
}

const BlobType& Definition::getBlob() const {
  KJ_REQUIRE(kind == Kind::BLOB, kind);
  return payload.get<BlobType>();
}

const ArrayType& Definition::getArray() const {
  KJ_REQUIRE(kind == Kind::ARRAY, kind);
  return payload.get<ArrayType>();
}

const ObjectType& Definition::getObject() const {
  KJ_REQUIRE(kind == Kind::OBJECT, kind);
  return payload.get<ObjectType>();
}

const UnionType& Definition::getUnion() const {
  KJ_REQUIRE(kind == Kind::UNION, kind);
  return payload.get<UnionType>();
}

const RefType& Definition::getRef() const {
  KJ_REQUIRE(kind == Kind::REF, kind);
  return payload.get<RefType>();
}

const RecordType& Definition::getRecord() const {
  KJ_REQUIRE(kind == Kind::RECORD, kind);
  return payload.get<RecordType>();
}

const MethodType& Definition::getMethod() const {
  KJ_REQUIRE(kind == Kind::QUERY || kind == Kind::PROCEDURE || kind == Kind::SUBSCRIPTION,
             kind);
  return payload.get<MethodType>();
}

kj::StringPtr KJ_STRINGIFY(Definition::Kind kind) {
  switch (kind) {
    case Definition::Kind::RECORD: return "record";
    case Definition::Kind::QUERY: return "query";
    case Definition::Kind::PROCEDURE: return "procedure";
    case Definition::Kind::SUBSCRIPTION: return "subscription";
    case Definition::Kind::OBJECT: return "object";
    case Definition::Kind::ARRAY: return "array";
    case Definition::Kind::STRING: return "string";
    case Definition::Kind::INTEGER: return "integer";
    case Definition::Kind::BOOLEAN: return "boolean";
    case Definition::Kind::BYTES: return "bytes";
    case Definition::Kind::CID_LINK: return "cid-link";
    case Definition::Kind::BLOB: return "blob";
    case Definition::Kind::UNION: return "union";
    case Definition::Kind::TOKEN: return "token";
    case Definition::Kind::UNKNOWN: return "unknown";
    case Definition::Kind::REF: return "ref";
  }
  KJ_UNREACHABLE;
}

kj::Maybe<const Definition&> LexiconDocument::findDef(kj::StringPtr name) const {
  for (auto& def: defs) {
    if (def.name == name) return *def.definition;
  }
  return kj::none;
}

// =======================================================================================

namespace {

bool isAsciiLetter(char c) {
  return ('a' <= c && c <= 'z') || ('A' <= c && c <= 'Z');
}

bool isAsciiDigit(char c) {
  return '0' <= c && c <= '9';
}

}  // namespace

bool isValidNsid(kj::StringPtr nsid) {
  if (nsid.size() == 0 || nsid.size() > 317) return false;

  uint segments = 0;
  size_t start = 0;
  for (;;) {
    size_t end = start;
    while (end < nsid.size() && nsid[end] != '.') ++end;

    auto segment = nsid.slice(start, end);
    if (segment.size() == 0 || segment.size() > 63) return false;
    if (segment[0] == '-' || segment[segment.size() - 1] == '-') return false;
    for (char c: segment) {
      if (!isAsciiLetter(c) && !isAsciiDigit(c) && c != '-') return false;
    }
    ++segments;

    if (end == nsid.size()) {
      // The name segment must not start with a digit.
      if (!isAsciiLetter(segment[0])) return false;
      break;
    }
    start = end + 1;
  }

  return segments >= 2;
}

bool isValidDefName(kj::StringPtr name) {
  if (name.size() == 0 || !isAsciiLetter(name[0])) return false;
  for (char c: name) {
    if (!isAsciiLetter(c) && !isAsciiDigit(c) && c != '_') return false;
  }
  return true;
}

// =======================================================================================

namespace {

typedef capnp::JsonValue::Reader JsonReader;

enum class Position {
  // Where a definition appears.  Several kinds are only legal in some positions.

  MAIN_DEF,
  OTHER_DEF,
  PARAMETERS,
  RECORD_BODY,
  PARAMETER,
  // A property of a method's parameters.
  PARAMETER_ITEMS,
  // The items of an array-valued parameter.
  NESTED
  // Object property, array items, or body schema.
};

class DocumentParser {
public:
  explicit DocumentParser(kj::StringPtr file): file(file) {}

  LexiconDocument parseDocument(JsonReader root);

private:
  kj::StringPtr file;
  kj::StringPtr nsid = "(unknown)";

  kj::Own<Definition> parseDefinition(JsonReader value, kj::StringPtr path, Position position);

  StringType parseString(JsonReader value, kj::StringPtr path);
  IntegerType parseInteger(JsonReader value, kj::StringPtr path);
  BooleanType parseBoolean(JsonReader value, kj::StringPtr path);
  BytesType parseBytes(JsonReader value, kj::StringPtr path);
  BlobType parseBlob(JsonReader value, kj::StringPtr path);
  ArrayType parseArray(JsonReader value, kj::StringPtr path, Position position);
  ObjectType parseObject(JsonReader value, kj::StringPtr path, bool isParams);
  UnionType parseUnion(JsonReader value, kj::StringPtr path);
  RefType parseRef(JsonReader value, kj::StringPtr path);
  RecordType parseRecord(JsonReader value, kj::StringPtr path);
  MethodType parseMethod(JsonReader value, kj::StringPtr path, Definition::Kind kind);
  kj::Maybe<Body> parseBody(JsonReader value, kj::StringPtr key, kj::StringPtr path,
                            bool isMessage);

  // JSON helpers.  `path` is the dotted location inside the document, used for error context.
  kj::Maybe<JsonReader> findField(JsonReader object, kj::StringPtr key);
  JsonReader requireField(JsonReader object, kj::StringPtr key, kj::StringPtr path);
  void requireObject(JsonReader value, kj::StringPtr path);
  kj::String expectString(JsonReader value, kj::StringPtr path);
  int64_t expectInteger(JsonReader value, kj::StringPtr path);
  bool expectBoolean(JsonReader value, kj::StringPtr path);
  kj::Array<kj::String> expectStringArray(JsonReader value, kj::StringPtr path);

  kj::Maybe<kj::String> optionalString(JsonReader object, kj::StringPtr key,
                                       kj::StringPtr path);
  kj::Maybe<int64_t> optionalInteger(JsonReader object, kj::StringPtr key, kj::StringPtr path);
  kj::Maybe<uint64_t> optionalCount(JsonReader object, kj::StringPtr key, kj::StringPtr path);
  kj::Maybe<bool> optionalBoolean(JsonReader object, kj::StringPtr key, kj::StringPtr path);
  kj::Array<kj::String> optionalStringArray(JsonReader object, kj::StringPtr key,
                                            kj::StringPtr path);

  void checkRange(kj::Maybe<uint64_t> low, kj::Maybe<uint64_t> high, kj::StringPtr lowName,
                  kj::StringPtr path);
};

LexiconDocument DocumentParser::parseDocument(JsonReader root) {
  LEXGEN_REQUIRE(root.isObject(), MALFORMED_DOCUMENT,
      "lexicon document must be a JSON object", file);

  auto versionField = findField(root, "lexicon");
  KJ_IF_SOME(version, versionField) {
    LEXGEN_REQUIRE(version.isNumber() && version.getNumber() == 1, MALFORMED_DOCUMENT,
        "unsupported lexicon version; expected 1", file);
  } else {
    LEXGEN_FAIL(MALFORMED_DOCUMENT, "missing lexicon version marker", file);
  }

  auto id = expectString(requireField(root, "id", "(document)"), "id");
  LEXGEN_REQUIRE(isValidNsid(id), MALFORMED_DOCUMENT, "invalid NSID", file, id);
  nsid = id;

  LexiconDocument result {
    .nsid = kj::mv(id),
    .sourceName = kj::str(file),
    .description = optionalString(root, "description", "(document)"),
    .revision = optionalCount(root, "revision", "(document)"),
    .defs = nullptr,
  };

  auto defsValue = requireField(root, "defs", "(document)");
  requireObject(defsValue, "defs");

  kj::Vector<NamedDef> defs;
  for (auto field: defsValue.getObject()) {
    kj::StringPtr def = field.getName();
    LEXGEN_REQUIRE(isValidDefName(def), MALFORMED_DOCUMENT, "invalid def name", file, nsid, def);
    for (auto& previous: defs) {
      LEXGEN_REQUIRE(previous.name != def, MALFORMED_DOCUMENT,
          "def declared twice", file, nsid, def);
    }

    auto position = def == "main" ? Position::MAIN_DEF : Position::OTHER_DEF;
    defs.add(NamedDef { kj::str(def), parseDefinition(field.getValue(), def, position) });
  }
  result.defs = defs.releaseAsArray();

  return result;
}

kj::Own<Definition> DocumentParser::parseDefinition(
    JsonReader value, kj::StringPtr path, Position position) {
  typedef Definition::Kind Kind;

  requireObject(value, path);
  auto type = expectString(requireField(value, "type", path), kj::str(path, ".type"));
  auto description = optionalString(value, "description", path);

  auto make = [&](Kind kind, Definition::Payload payload) {
    return kj::heap<Definition>(kind, kj::mv(description), kj::mv(payload));
  };

  bool isPrimaryType = type == "record" || type == "query" || type == "procedure" ||
                       type == "subscription";
  LEXGEN_REQUIRE(!isPrimaryType || position == Position::MAIN_DEF, UNSUPPORTED_KIND,
      "record, query, procedure and subscription may only be a document's main def",
      file, nsid, path, type);
  LEXGEN_REQUIRE(type != "token" ||
                 position == Position::MAIN_DEF || position == Position::OTHER_DEF,
      UNSUPPORTED_KIND, "token may only appear as a def", file, nsid, path);
  LEXGEN_REQUIRE((type == "params") == (position == Position::PARAMETERS), UNSUPPORTED_KIND,
      "params appears only as, and exactly as, the parameters of a method",
      file, nsid, path, type);
  LEXGEN_REQUIRE(position != Position::RECORD_BODY || type == "object", UNSUPPORTED_KIND,
      "a record's body must be an object", file, nsid, path, type);

  bool isParameterScalar = type == "boolean" || type == "integer" || type == "string" ||
                           type == "unknown";
  LEXGEN_REQUIRE(position != Position::PARAMETER || isParameterScalar || type == "array",
      UNSUPPORTED_KIND, "a parameter must be a boolean, integer, string, unknown or array",
      file, nsid, path, type);
  LEXGEN_REQUIRE(position != Position::PARAMETER_ITEMS || isParameterScalar, UNSUPPORTED_KIND,
      "array parameter items must be boolean, integer, string or unknown",
      file, nsid, path, type);

  if (type == "record") {
    return make(Kind::RECORD, parseRecord(value, path));
  } else if (type == "query") {
    return make(Kind::QUERY, parseMethod(value, path, Kind::QUERY));
  } else if (type == "procedure") {
    return make(Kind::PROCEDURE, parseMethod(value, path, Kind::PROCEDURE));
  } else if (type == "subscription") {
    return make(Kind::SUBSCRIPTION, parseMethod(value, path, Kind::SUBSCRIPTION));
  } else if (type == "object") {
    return make(Kind::OBJECT, parseObject(value, path, false));
  } else if (type == "params") {
    return make(Kind::OBJECT, parseObject(value, path, true));
  } else if (type == "array") {
    return make(Kind::ARRAY, parseArray(value, path, position));
  } else if (type == "string") {
    return make(Kind::STRING, parseString(value, path));
  } else if (type == "integer") {
    return make(Kind::INTEGER, parseInteger(value, path));
  } else if (type == "boolean") {
    return make(Kind::BOOLEAN, parseBoolean(value, path));
  } else if (type == "bytes") {
    return make(Kind::BYTES, parseBytes(value, path));
  } else if (type == "cid-link") {
    return make(Kind::CID_LINK, NoConstraints());
  } else if (type == "blob") {
    return make(Kind::BLOB, parseBlob(value, path));
  } else if (type == "union") {
    return make(Kind::UNION, parseUnion(value, path));
  } else if (type == "token") {
    return make(Kind::TOKEN, NoConstraints());
  } else if (type == "unknown") {
    return make(Kind::UNKNOWN, NoConstraints());
  } else if (type == "ref") {
    return make(Kind::REF, parseRef(value, path));
  } else {
    LEXGEN_FAIL(UNSUPPORTED_KIND, "unrecognized definition type", file, nsid, path, type);
  }
}

StringType DocumentParser::parseString(JsonReader value, kj::StringPtr path) {
  StringType result {
    .format = optionalString(value, "format", path),
    .minLength = optionalCount(value, "minLength", path),
    .maxLength = optionalCount(value, "maxLength", path),
    .minGraphemes = optionalCount(value, "minGraphemes", path),
    .maxGraphemes = optionalCount(value, "maxGraphemes", path),
    .enumValues = optionalStringArray(value, "enum", path),
    .knownValues = optionalStringArray(value, "knownValues", path),
    .constValue = optionalString(value, "const", path),
    .defaultValue = optionalString(value, "default", path),
  };
  checkRange(result.minLength, result.maxLength, "minLength", path);
  checkRange(result.minGraphemes, result.maxGraphemes, "minGraphemes", path);
  return result;
}

IntegerType DocumentParser::parseInteger(JsonReader value, kj::StringPtr path) {
  kj::Vector<int64_t> enumValues;
  auto listField = findField(value, "enum");
  KJ_IF_SOME(list, listField) {
    LEXGEN_REQUIRE(list.isArray(), MALFORMED_DOCUMENT,
        "integer enum must be an array", file, nsid, path);
    for (auto element: list.getArray()) {
      enumValues.add(expectInteger(element, kj::str(path, ".enum")));
    }
  }

  IntegerType result {
    .minimum = optionalInteger(value, "minimum", path),
    .maximum = optionalInteger(value, "maximum", path),
    .enumValues = enumValues.releaseAsArray(),
    .constValue = optionalInteger(value, "const", path),
    .defaultValue = optionalInteger(value, "default", path),
  };

  KJ_IF_SOME(minimum, result.minimum) {
    KJ_IF_SOME(maximum, result.maximum) {
      LEXGEN_REQUIRE(minimum <= maximum, UNSUPPORTED_KIND,
          "integer minimum exceeds maximum", file, nsid, path, minimum, maximum);
    }
  }
  return result;
}

BooleanType DocumentParser::parseBoolean(JsonReader value, kj::StringPtr path) {
  return BooleanType {
    .constValue = optionalBoolean(value, "const", path),
    .defaultValue = optionalBoolean(value, "default", path),
  };
}

BytesType DocumentParser::parseBytes(JsonReader value, kj::StringPtr path) {
  BytesType result {
    .minLength = optionalCount(value, "minLength", path),
    .maxLength = optionalCount(value, "maxLength", path),
  };
  checkRange(result.minLength, result.maxLength, "minLength", path);
  return result;
}

BlobType DocumentParser::parseBlob(JsonReader value, kj::StringPtr path) {
  return BlobType {
    .accept = optionalStringArray(value, "accept", path),
    .maxSize = optionalCount(value, "maxSize", path),
  };
}

ArrayType DocumentParser::parseArray(JsonReader value, kj::StringPtr path, Position position) {
  auto itemsPath = kj::str(path, ".items");
  auto itemsPosition = position == Position::PARAMETER ? Position::PARAMETER_ITEMS
                                                       : Position::NESTED;
  ArrayType result {
    .items = parseDefinition(requireField(value, "items", path), itemsPath, itemsPosition),
    .minLength = optionalCount(value, "minLength", path),
    .maxLength = optionalCount(value, "maxLength", path),
  };
  checkRange(result.minLength, result.maxLength, "minLength", path);
  return result;
}

ObjectType DocumentParser::parseObject(JsonReader value, kj::StringPtr path, bool isParams) {
  kj::Vector<Property> properties;
  auto mapField = findField(value, "properties");
  KJ_IF_SOME(map, mapField) {
    requireObject(map, kj::str(path, ".properties"));
    for (auto field: map.getObject()) {
      kj::StringPtr property = field.getName();
      LEXGEN_REQUIRE(property.size() > 0, MALFORMED_DOCUMENT,
          "empty property name", file, nsid, path);
      for (auto& previous: properties) {
        LEXGEN_REQUIRE(previous.name != property, MALFORMED_DOCUMENT,
            "property declared twice", file, nsid, path, property);
      }
      properties.add(Property {
        kj::str(property),
        parseDefinition(field.getValue(), kj::str(path, ".", property),
                        isParams ? Position::PARAMETER : Position::NESTED)
      });
    }
  }

  ObjectType result {
    .properties = properties.releaseAsArray(),
    .required = optionalStringArray(value, "required", path),
    .nullable = optionalStringArray(value, "nullable", path),
    .isParams = isParams,
  };

  for (auto& name: result.required) {
    bool declared = false;
    for (auto& property: result.properties) {
      if (property.name == name) { declared = true; break; }
    }
    LEXGEN_REQUIRE(declared, MALFORMED_DOCUMENT,
        "required property is not declared", file, nsid, path, name);
  }

  return result;
}

UnionType DocumentParser::parseUnion(JsonReader value, kj::StringPtr path) {
  return UnionType {
    .refs = expectStringArray(requireField(value, "refs", path), kj::str(path, ".refs")),
    .closed = optionalBoolean(value, "closed", path).orDefault(false),
  };
}

RefType DocumentParser::parseRef(JsonReader value, kj::StringPtr path) {
  return RefType { expectString(requireField(value, "ref", path), kj::str(path, ".ref")) };
}

RecordType DocumentParser::parseRecord(JsonReader value, kj::StringPtr path) {
  auto bodyPath = kj::str(path, ".record");
  auto key = kj::str("any");
  auto keyField = optionalString(value, "key", path);
  KJ_IF_SOME(k, keyField) {
    key = kj::mv(k);
  }
  return RecordType {
    .key = kj::mv(key),
    .record = parseDefinition(requireField(value, "record", path), bodyPath,
                              Position::RECORD_BODY),
  };
}

MethodType DocumentParser::parseMethod(
    JsonReader value, kj::StringPtr path, Definition::Kind kind) {
  typedef Definition::Kind Kind;

  MethodType result;

  auto parametersField = findField(value, "parameters");
  KJ_IF_SOME(parameters, parametersField) {
    result.parameters = parseDefinition(parameters, kj::str(path, ".parameters"),
                                        Position::PARAMETERS);
  }

  if (kind == Kind::PROCEDURE) {
    result.input = parseBody(value, "input", path, false);
  } else {
    LEXGEN_REQUIRE(findField(value, "input") == kj::none, UNSUPPORTED_KIND,
        "only procedures take an input body", file, nsid, path);
  }

  if (kind == Kind::SUBSCRIPTION) {
    result.message = parseBody(value, "message", path, true);
    LEXGEN_REQUIRE(findField(value, "output") == kj::none, UNSUPPORTED_KIND,
        "subscriptions have a message, not an output", file, nsid, path);
  } else {
    result.output = parseBody(value, "output", path, false);
  }

  kj::Vector<kj::String> errors;
  auto listField = findField(value, "errors");
  KJ_IF_SOME(list, listField) {
    LEXGEN_REQUIRE(list.isArray(), MALFORMED_DOCUMENT,
        "errors must be an array", file, nsid, path);
    for (auto error: list.getArray()) {
      auto errorPath = kj::str(path, ".errors");
      requireObject(error, errorPath);
      errors.add(expectString(requireField(error, "name", errorPath), errorPath));
    }
  }
  result.errors = errors.releaseAsArray();

  return result;
}

kj::Maybe<Body> DocumentParser::parseBody(
    JsonReader value, kj::StringPtr key, kj::StringPtr path, bool isMessage) {
  auto bodyField = findField(value, key);
  KJ_IF_SOME(body, bodyField) {
    auto bodyPath = kj::str(path, ".", key);
    requireObject(body, bodyPath);

    Body result {
      .encoding = optionalString(body, "encoding", bodyPath),
      .description = optionalString(body, "description", bodyPath),
      .schema = kj::none,
    };
    LEXGEN_REQUIRE(isMessage || result.encoding != kj::none, MALFORMED_DOCUMENT,
        "body is missing its encoding", file, nsid, bodyPath);

    auto schemaField = findField(body, "schema");
    KJ_IF_SOME(schema, schemaField) {
      auto schemaPath = kj::str(bodyPath, ".schema");
      auto definition = parseDefinition(schema, schemaPath, Position::NESTED);
      switch (definition->which()) {
        case Definition::Kind::OBJECT:
        case Definition::Kind::REF:
        case Definition::Kind::UNION:
          break;
        case Definition::Kind::RECORD:
        case Definition::Kind::QUERY:
        case Definition::Kind::PROCEDURE:
        case Definition::Kind::SUBSCRIPTION:
        case Definition::Kind::ARRAY:
        case Definition::Kind::STRING:
        case Definition::Kind::INTEGER:
        case Definition::Kind::BOOLEAN:
        case Definition::Kind::BYTES:
        case Definition::Kind::CID_LINK:
        case Definition::Kind::BLOB:
        case Definition::Kind::TOKEN:
        case Definition::Kind::UNKNOWN: {
          auto kind = definition->which();
          LEXGEN_FAIL(UNSUPPORTED_KIND, "a body schema must be an object, ref or union",
                      file, nsid, schemaPath, kind);
        }
      }
      LEXGEN_REQUIRE(!isMessage || definition->which() == Definition::Kind::UNION,
          UNSUPPORTED_KIND, "a subscription message schema must be a union",
          file, nsid, schemaPath);
      result.schema = kj::mv(definition);
    }

    return kj::mv(result);
  }
  return kj::none;
}

// ---------------------------------------------------------------------------------------

kj::Maybe<JsonReader> DocumentParser::findField(JsonReader object, kj::StringPtr key) {
  for (auto field: object.getObject()) {
    if (field.getName() == key) return field.getValue();
  }
  return kj::none;
}

JsonReader DocumentParser::requireField(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    return value;
  }
  LEXGEN_FAIL(MALFORMED_DOCUMENT, "missing required field", file, nsid, path, key);
}

void DocumentParser::requireObject(JsonReader value, kj::StringPtr path) {
  LEXGEN_REQUIRE(value.isObject(), MALFORMED_DOCUMENT,
      "expected a JSON object", file, nsid, path);
}

kj::String DocumentParser::expectString(JsonReader value, kj::StringPtr path) {
  LEXGEN_REQUIRE(value.isString(), MALFORMED_DOCUMENT,
      "expected a string", file, nsid, path);
  return kj::str(value.getString());
}

int64_t DocumentParser::expectInteger(JsonReader value, kj::StringPtr path) {
  LEXGEN_REQUIRE(value.isNumber(), MALFORMED_DOCUMENT,
      "expected an integer", file, nsid, path);
  double number = value.getNumber();

  // Doubles represent every integer up to 2^53 exactly; anything larger was rounded by the
  // JSON decoder already.
  constexpr double LIMIT = 9007199254740992.0;
  LEXGEN_REQUIRE(isfinite(number) && floor(number) == number &&
                 -LIMIT <= number && number <= LIMIT,
      MALFORMED_DOCUMENT, "expected an integer", file, nsid, path, number);
  return static_cast<int64_t>(number);
}

bool DocumentParser::expectBoolean(JsonReader value, kj::StringPtr path) {
  LEXGEN_REQUIRE(value.isBoolean(), MALFORMED_DOCUMENT,
      "expected a boolean", file, nsid, path);
  return value.getBoolean();
}

kj::Array<kj::String> DocumentParser::expectStringArray(JsonReader value, kj::StringPtr path) {
  LEXGEN_REQUIRE(value.isArray(), MALFORMED_DOCUMENT,
      "expected an array of strings", file, nsid, path);
  return KJ_MAP(element, value.getArray()) { return expectString(element, path); };
}

kj::Maybe<kj::String> DocumentParser::optionalString(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    return expectString(value, kj::str(path, ".", key));
  }
  return kj::none;
}

kj::Maybe<int64_t> DocumentParser::optionalInteger(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    return expectInteger(value, kj::str(path, ".", key));
  }
  return kj::none;
}

kj::Maybe<uint64_t> DocumentParser::optionalCount(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    auto fieldPath = kj::str(path, ".", key);
    int64_t count = expectInteger(value, fieldPath);
    LEXGEN_REQUIRE(count >= 0, MALFORMED_DOCUMENT,
        "expected a non-negative integer", file, nsid, fieldPath, count);
    return static_cast<uint64_t>(count);
  }
  return kj::none;
}

kj::Maybe<bool> DocumentParser::optionalBoolean(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    return expectBoolean(value, kj::str(path, ".", key));
  }
  return kj::none;
}

kj::Array<kj::String> DocumentParser::optionalStringArray(
    JsonReader object, kj::StringPtr key, kj::StringPtr path) {
  auto valueField = findField(object, key);
  KJ_IF_SOME(value, valueField) {
    return expectStringArray(value, kj::str(path, ".", key));
  }
  return nullptr;
}

void DocumentParser::checkRange(kj::Maybe<uint64_t> low, kj::Maybe<uint64_t> high,
                                kj::StringPtr lowName, kj::StringPtr path) {
  KJ_IF_SOME(l, low) {
    KJ_IF_SOME(h, high) {
      LEXGEN_REQUIRE(l <= h, UNSUPPORTED_KIND,
          "lower bound exceeds upper bound", file, nsid, path, lowName, l, h);
    }
  }
}

}  // namespace

LexiconDocument parseLexicon(kj::StringPtr sourceName, kj::ArrayPtr<const char> text) {
  capnp::MallocMessageBuilder message;
  auto root = message.initRoot<capnp::JsonValue>();

  capnp::JsonCodec codec;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
    codec.decodeRaw(text, root);
  })) {
    auto file = sourceName;
    auto reason = exception.getDescription();
    LEXGEN_FAIL(MALFORMED_DOCUMENT, "not valid JSON", file, reason);
  }

  return DocumentParser(sourceName).parseDocument(root.asReader());
}

}  // namespace lexgen
