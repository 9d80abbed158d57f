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
#include "error.h"
#include <kj/debug.h>
#include <kj/map.h>
#include <algorithm>

namespace lexgen {

ResolvedType::ResolvedType(Scalar&& scalar): kind(Kind::SCALAR), payload(kj::mv(scalar)) {}
ResolvedType::ResolvedType(Optional&& optional)
    : kind(Kind::OPTIONAL), payload(kj::mv(optional)) {}
ResolvedType::ResolvedType(List&& list): kind(Kind::LIST), payload(kj::mv(list)) {}
ResolvedType::ResolvedType(Enum&& enumType): kind(Kind::ENUM), payload(kj::mv(enumType)) {}
ResolvedType::ResolvedType(Named&& named): kind(Kind::NAMED), payload(kj::mv(named)) {}
ResolvedType::ResolvedType(Union&& unionType): kind(Kind::UNION), payload(kj::mv(unionType)) {}
ResolvedType::ResolvedType(Unresolved&& unresolved)
    : kind(Kind::UNRESOLVED), payload(kj::mv(unresolved)) {}

const ResolvedType::Scalar& ResolvedType::getScalar() const {
  KJ_REQUIRE(kind == Kind::SCALAR);
  return payload.get<Scalar>();
}

const ResolvedType::Optional& ResolvedType::getOptional() const {
  KJ_REQUIRE(kind == Kind::OPTIONAL);
  return payload.get<Optional>();
}

const ResolvedType::List& ResolvedType::getList() const {
  KJ_REQUIRE(kind == Kind::LIST);
  return payload.get<List>();
}

const ResolvedType::Enum& ResolvedType::getEnum() const {
  KJ_REQUIRE(kind == Kind::ENUM);
  return payload.get<Enum>();
}

const ResolvedType::Named& ResolvedType::getNamed() const {
  KJ_REQUIRE(kind == Kind::NAMED);
  return payload.get<Named>();
}

const ResolvedType::Union& ResolvedType::getUnion() const {
  KJ_REQUIRE(kind == Kind::UNION);
  return payload.get<Union>();
}

const ResolvedType::Unresolved& ResolvedType::getUnresolved() const {
  KJ_REQUIRE(kind == Kind::UNRESOLVED);
  return payload.get<Unresolved>();
}

void ResolvedType::collectTargets(kj::Vector<SymbolKey>& targets) const {
  switch (kind) {
    case Kind::SCALAR:
    case Kind::ENUM:
      return;
    case Kind::OPTIONAL:
      getOptional().inner->collectTargets(targets);
      return;
    case Kind::LIST:
      getList().element->collectTargets(targets);
      return;
    case Kind::NAMED:
      targets.add(getNamed().target.clone());
      return;
    case Kind::UNION:
      for (auto& variant: getUnion().variants) {
        variant->collectTargets(targets);
      }
      return;
    case Kind::UNRESOLVED:
      targets.add(getUnresolved().target.clone());
      return;
  }
  KJ_UNREACHABLE;
}

// =======================================================================================

namespace {

kj::Maybe<kj::String> cloneMaybe(const kj::Maybe<kj::String>& value) {
  KJ_IF_SOME(v, value) {
    return kj::str(v);
  }
  return kj::none;
}

kj::Maybe<kj::String> cloneMaybe(kj::Maybe<kj::StringPtr> value) {
  KJ_IF_SOME(v, value) {
    return kj::str(v);
  }
  return kj::none;
}

bool isObjectLike(Definition::Kind kind) {
  switch (kind) {
    case Definition::Kind::RECORD:
    case Definition::Kind::QUERY:
    case Definition::Kind::PROCEDURE:
    case Definition::Kind::SUBSCRIPTION:
    case Definition::Kind::OBJECT:
      return true;
    case Definition::Kind::ARRAY:
    case Definition::Kind::STRING:
    case Definition::Kind::INTEGER:
    case Definition::Kind::BOOLEAN:
    case Definition::Kind::BYTES:
    case Definition::Kind::CID_LINK:
    case Definition::Kind::BLOB:
    case Definition::Kind::UNION:
    case Definition::Kind::TOKEN:
    case Definition::Kind::UNKNOWN:
    case Definition::Kind::REF:
      return false;
  }
  KJ_UNREACHABLE;
}

kj::Array<SymbolKey> distinctSorted(kj::Vector<SymbolKey>&& keys) {
  std::sort(keys.begin(), keys.end());
  kj::Vector<SymbolKey> result(keys.size());
  for (auto& key: keys) {
    if (result.size() == 0 || !(result.back() == key)) {
      result.add(kj::mv(key));
    }
  }
  return result.releaseAsArray();
}

void collectUnionVariants(const ResolvedType& type, kj::Vector<SymbolKey>& variants) {
  switch (type.which()) {
    case ResolvedType::Kind::SCALAR:
    case ResolvedType::Kind::ENUM:
    case ResolvedType::Kind::NAMED:
    case ResolvedType::Kind::UNRESOLVED:
      return;
    case ResolvedType::Kind::OPTIONAL:
      collectUnionVariants(*type.getOptional().inner, variants);
      return;
    case ResolvedType::Kind::LIST:
      collectUnionVariants(*type.getList().element, variants);
      return;
    case ResolvedType::Kind::UNION:
      for (auto& variant: type.getUnion().variants) {
        variant->collectTargets(variants);
      }
      return;
  }
  KJ_UNREACHABLE;
}

class Synthesizer {
public:
  Synthesizer(const SymbolTable& symbols, const LexiconDocument& document)
      : symbols(symbols), document(document) {}

  kj::Array<GeneratedUnit> run() {
    for (auto& def: document.defs) {
      addDef(def);
    }
    return units.releaseAsArray();
  }

private:
  const SymbolTable& symbols;
  const LexiconDocument& document;
  kj::Vector<GeneratedUnit> units;

  SymbolKey keyFor(kj::StringPtr name) {
    return SymbolKey { kj::str(document.nsid), kj::str(name) };
  }

  void addDef(const NamedDef& def) {
    typedef Definition::Kind Kind;
    auto key = keyFor(def.name);
    auto& definition = *def.definition;

    switch (definition.which()) {
      case Kind::RECORD: {
        auto& record = *definition.getRecord().record;
        auto description = definition.getDescription();
        if (description == kj::none) description = record.getDescription();
        addStruct(kj::mv(key), record.getObject(), description);
        return;
      }

      case Kind::QUERY:
      case Kind::PROCEDURE:
      case Kind::SUBSCRIPTION: {
        auto& method = definition.getMethod();
        KJ_IF_SOME(parameters, method.parameters) {
          addStruct(key.clone(), parameters->getObject(), definition.getDescription());
        } else {
          addStruct(key.clone(), ObjectType(), definition.getDescription());
        }
        addBody(key, "input", method.input);
        addBody(key, "output", method.output);
        addBody(key, "message", method.message);
        return;
      }

      case Kind::OBJECT:
        addStruct(kj::mv(key), definition.getObject(), definition.getDescription());
        return;

      case Kind::TOKEN:
        addUnit(GeneratedUnit {
          .key = kj::mv(key),
          .document = &document,
          .kind = GeneratedUnit::Kind::TOKEN,
          .description = cloneMaybe(definition.getDescription()),
        });
        return;

      case Kind::ARRAY:
      case Kind::STRING:
      case Kind::INTEGER:
      case Kind::BOOLEAN:
      case Kind::BYTES:
      case Kind::CID_LINK:
      case Kind::BLOB:
      case Kind::UNION:
      case Kind::UNKNOWN:
      case Kind::REF: {
        auto type = synthesizeType(definition, key.nested("item"));
        addAlias(kj::mv(key), kj::mv(type), definition.getDescription());
        return;
      }
    }
    KJ_UNREACHABLE;
  }

  void addBody(const SymbolKey& mainKey, kj::StringPtr name, const kj::Maybe<Body>& body) {
    KJ_IF_SOME(b, body) {
      KJ_IF_SOME(schema, b.schema) {
        auto key = mainKey.nested(name);
        kj::Maybe<kj::StringPtr> description = schema->getDescription();
        KJ_IF_SOME(d, b.description) {
          description = d.asPtr();
        }

        if (schema->which() == Definition::Kind::OBJECT) {
          addStruct(kj::mv(key), schema->getObject(), description);
        } else {
          auto type = synthesizeType(*schema, key.nested("item"));
          addAlias(kj::mv(key), kj::mv(type), description);
        }
      }
    }
  }

  void addStruct(SymbolKey key, const ObjectType& object,
                 kj::Maybe<kj::StringPtr> description) {
    // Reserve the slot first so that nested units land after their parent.
    size_t index = units.size();
    units.add(GeneratedUnit {
      .key = key.clone(),
      .document = &document,
      .kind = GeneratedUnit::Kind::STRUCT,
      .description = cloneMaybe(description),
    });

    kj::Vector<SymbolKey> targets;
    auto fields = KJ_MAP(property, object.properties) {
      auto& definition = *property.type;
      auto type = synthesizeType(definition, key.nested(property.name));
      bool nullable = object.isNullable(property.name);
      if (nullable) {
        type = kj::heap<ResolvedType>(ResolvedType::Optional { kj::mv(type) });
      }
      type->collectTargets(targets);

      return UnitField {
        .jsonName = kj::str(property.name),
        .type = kj::mv(type),
        .required = object.isRequired(property.name),
        .nullable = nullable,
        .defaultValue = defaultOf(definition),
        .description = cloneMaybe(definition.getDescription()),
      };
    };

    auto& unit = units[index];
    unit.fields = kj::mv(fields);
    unit.typeTag = unit.key.getTypeTag();
    unit.dependencies = distinctSorted(kj::mv(targets));
  }

  void addAlias(SymbolKey key, kj::Own<ResolvedType> type,
                kj::Maybe<kj::StringPtr> description) {
    kj::Vector<SymbolKey> targets;
    type->collectTargets(targets);
    addUnit(GeneratedUnit {
      .key = kj::mv(key),
      .document = &document,
      .kind = GeneratedUnit::Kind::ALIAS,
      .description = cloneMaybe(description),
      .aliasType = kj::mv(type),
      .dependencies = distinctSorted(kj::mv(targets)),
    });
  }

  void addUnit(GeneratedUnit&& unit) {
    unit.typeTag = unit.key.getTypeTag();
    units.add(kj::mv(unit));
  }

  kj::Own<ResolvedType> reference(kj::StringPtr ref) {
    auto& symbol = symbols.resolve(document.nsid, ref);
    if (symbol.generated) {
      return kj::heap<ResolvedType>(ResolvedType::Named { symbol.key.clone() });
    } else {
      return kj::heap<ResolvedType>(ResolvedType::Unresolved { symbol.key.clone() });
    }
  }

  kj::Own<ResolvedType> synthesizeType(const Definition& definition, const SymbolKey& inlineKey) {
    // `inlineKey` names the struct unit created if `definition` is (or contains) an inline
    // object.

    typedef Definition::Kind Kind;
    typedef ResolvedType::Scalar Scalar;

    switch (definition.which()) {
      case Kind::STRING: {
        auto& s = definition.getString();
        KJ_IF_SOME(c, s.constValue) {
          return enumOf(kj::arr<Literal>(kj::str(c)));
        }
        if (s.enumValues.size() > 0) {
          return enumOf(KJ_MAP(v, s.enumValues) -> Literal { return kj::str(v); });
        }
        return kj::heap<ResolvedType>(Scalar {
          .kind = ScalarKind::TEXT,
          .format = cloneMaybe(s.format),
          .minLength = s.minLength,
          .maxLength = s.maxLength,
          .minGraphemes = s.minGraphemes,
          .maxGraphemes = s.maxGraphemes,
          .knownValues = KJ_MAP(v, s.knownValues) { return kj::str(v); },
        });
      }

      case Kind::INTEGER: {
        auto& i = definition.getInteger();
        KJ_IF_SOME(c, i.constValue) {
          return enumOf(kj::arr<Literal>(c));
        }
        if (i.enumValues.size() > 0) {
          return enumOf(KJ_MAP(v, i.enumValues) -> Literal { return v; });
        }
        return kj::heap<ResolvedType>(Scalar {
          .kind = ScalarKind::INTEGER,
          .minimum = i.minimum,
          .maximum = i.maximum,
        });
      }

      case Kind::BOOLEAN:
        KJ_IF_SOME(c, definition.getBoolean().constValue) {
          return enumOf(kj::arr<Literal>(c));
        }
        return kj::heap<ResolvedType>(Scalar { .kind = ScalarKind::BOOLEAN });

      case Kind::BYTES: {
        auto& b = definition.getBytes();
        return kj::heap<ResolvedType>(Scalar {
          .kind = ScalarKind::BYTES,
          .minLength = b.minLength,
          .maxLength = b.maxLength,
        });
      }

      case Kind::CID_LINK:
        return kj::heap<ResolvedType>(Scalar { .kind = ScalarKind::CID_LINK });
      case Kind::BLOB:
        return kj::heap<ResolvedType>(Scalar { .kind = ScalarKind::BLOB });
      case Kind::UNKNOWN:
        return kj::heap<ResolvedType>(Scalar { .kind = ScalarKind::UNKNOWN });

      case Kind::ARRAY: {
        auto& a = definition.getArray();
        return kj::heap<ResolvedType>(ResolvedType::List {
          .element = synthesizeType(*a.items, inlineKey),
          .minLength = a.minLength,
          .maxLength = a.maxLength,
        });
      }

      case Kind::OBJECT:
        addStruct(inlineKey.clone(), definition.getObject(), definition.getDescription());
        return kj::heap<ResolvedType>(ResolvedType::Named { inlineKey.clone() });

      case Kind::UNION: {
        auto& u = definition.getUnion();
        return kj::heap<ResolvedType>(ResolvedType::Union {
          .variants = KJ_MAP(ref, u.refs) { return reference(ref); },
          .closed = u.closed,
        });
      }

      case Kind::REF:
        return reference(definition.getRef().target);

      case Kind::RECORD:
      case Kind::QUERY:
      case Kind::PROCEDURE:
      case Kind::SUBSCRIPTION:
      case Kind::TOKEN: {
        auto nsid = document.nsid.asPtr();
        auto def = inlineKey.name.asPtr();
        auto kind = definition.which();
        LEXGEN_FAIL(UNSUPPORTED_KIND, "definition kind not allowed inside another definition",
                    nsid, def, kind);
      }
    }
    KJ_UNREACHABLE;
  }

  static kj::Own<ResolvedType> enumOf(kj::Array<Literal> values) {
    return kj::heap<ResolvedType>(ResolvedType::Enum { kj::mv(values) });
  }

  static kj::Maybe<Literal> defaultOf(const Definition& definition) {
    // Only scalar kinds can declare a default.
    if (definition.which() == Definition::Kind::STRING) {
      KJ_IF_SOME(d, definition.getString().defaultValue) {
        return Literal(kj::str(d));
      }
    } else if (definition.which() == Definition::Kind::INTEGER) {
      KJ_IF_SOME(d, definition.getInteger().defaultValue) {
        return Literal(d);
      }
    } else if (definition.which() == Definition::Kind::BOOLEAN) {
      KJ_IF_SOME(d, definition.getBoolean().defaultValue) {
        return Literal(d);
      }
    }
    return kj::none;
  }
};

}  // namespace

kj::Array<GeneratedUnit> synthesize(const SymbolTable& symbols,
                                    const LexiconDocument& document) {
  return Synthesizer(symbols, document).run();
}

kj::Array<GeneratedUnit> synthesizeAll(const SymbolTable& symbols) {
  kj::Vector<GeneratedUnit> units;
  for (auto document: symbols.getGeneratedDocuments()) {
    for (auto& unit: synthesize(symbols, *document)) {
      units.add(kj::mv(unit));
    }
  }

  // Every target that is a declared symbol but not generated needs a placeholder.  Nested
  // keys like `main.output` are not symbols and are always generated.
  kj::Vector<SymbolKey> placeholders;
  kj::Vector<SymbolKey> variants;
  for (auto& unit: units) {
    for (auto& dep: unit.dependencies) {
      KJ_IF_SOME(symbol, symbols.find(dep)) {
        if (!symbol.generated) placeholders.add(dep.clone());
      }
    }
    for (auto& field: unit.fields) {
      collectUnionVariants(*field.type, variants);
    }
    KJ_IF_SOME(type, unit.aliasType) {
      collectUnionVariants(*type, variants);
    }
  }

  auto opaque = distinctSorted(kj::mv(placeholders));
  for (auto& key: opaque) {
    auto& symbol = KJ_ASSERT_NONNULL(symbols.find(key));
    auto typeTag = key.getTypeTag();
    units.add(GeneratedUnit {
      .key = kj::mv(key),
      .document = symbol.document,
      .kind = GeneratedUnit::Kind::OPAQUE,
      .description = cloneMaybe(symbol.definition->getDescription()),
      .typeTag = kj::mv(typeTag),
      .opaqueObject = isObjectLike(symbol.definition->which()),
    });
  }

  kj::TreeMap<SymbolKey, size_t> index;
  for (size_t i = 0; i < units.size(); i++) {
    index.insert(units[i].key.clone(), i);
  }
  for (auto& variant: variants) {
    KJ_IF_SOME(i, index.find(variant)) {
      units[i].unionVariant = true;
    }
  }

  KJ_LOG(INFO, "synthesized units", units.size(), opaque.size());

  return units.releaseAsArray();
}

}  // namespace lexgen
