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

#pragma once

#include "resolver.h"
#include <kj/one-of.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

enum class ScalarKind: uint8_t {
  TEXT,
  INTEGER,
  BOOLEAN,
  BYTES,
  BLOB,
  // Blob descriptor object (`$type: blob`, ref, mimeType, size).
  CID_LINK,
  // Opaque content-address reference, rendered as text.
  UNKNOWN
  // Any JSON value.
};

typedef kj::OneOf<kj::String, int64_t, bool> Literal;
// A constant appearing in a schema: a `const`, a `default`, or an `enum` member.

class ResolvedType {
  // The type of a field or alias after references have been resolved.  Struct shapes are not
  // types; they are GeneratedUnits, referred to by NAMED.

public:
  enum class Kind: uint8_t {
    SCALAR,
    OPTIONAL,
    LIST,
    ENUM,
    NAMED,
    UNION,
    UNRESOLVED
  };

  struct Scalar {
    ScalarKind kind;
    kj::Maybe<kj::String> format;
    kj::Maybe<uint64_t> minLength;
    kj::Maybe<uint64_t> maxLength;
    // Bytes for BYTES, UTF-8 bytes for TEXT.
    kj::Maybe<uint64_t> minGraphemes;
    kj::Maybe<uint64_t> maxGraphemes;
    kj::Maybe<int64_t> minimum;
    kj::Maybe<int64_t> maximum;
    kj::Array<kj::String> knownValues;
  };

  struct Optional {
    // Nullable: the value may be an explicit null.
    kj::Own<ResolvedType> inner;
  };

  struct List {
    kj::Own<ResolvedType> element;
    kj::Maybe<uint64_t> minLength;
    kj::Maybe<uint64_t> maxLength;
  };

  struct Enum {
    kj::Array<Literal> values;
    // All of the same alternative.  A `const` is a single-value enum.
  };

  struct Named {
    SymbolKey target;
    // Key of a GeneratedUnit of the same run.
  };

  struct Union {
    kj::Array<kj::Own<ResolvedType>> variants;
    // Each NAMED or UNRESOLVED, in declaration order.
    bool closed;
  };

  struct Unresolved {
    SymbolKey target;
    // A def that exists but is not generated (imported or filtered out).  Backed by an OPAQUE
    // unit.
  };

  explicit ResolvedType(Scalar&& scalar);
  explicit ResolvedType(Optional&& optional);
  explicit ResolvedType(List&& list);
  explicit ResolvedType(Enum&& enumType);
  explicit ResolvedType(Named&& named);
  explicit ResolvedType(Union&& unionType);
  explicit ResolvedType(Unresolved&& unresolved);
  KJ_DISALLOW_COPY_AND_MOVE(ResolvedType);

  Kind which() const { return kind; }

  const Scalar& getScalar() const;
  const Optional& getOptional() const;
  const List& getList() const;
  const Enum& getEnum() const;
  const Named& getNamed() const;
  const Union& getUnion() const;
  const Unresolved& getUnresolved() const;

  void collectTargets(kj::Vector<SymbolKey>& targets) const;
  // Appends the key of every unit this type mentions, NAMED and UNRESOLVED alike.

private:
  Kind kind;
  kj::OneOf<Scalar, Optional, List, Enum, Named, Union, Unresolved> payload;
};

struct UnitField {
  kj::String jsonName;
  kj::Own<ResolvedType> type;
  // Wrapped in OPTIONAL if the property is nullable.

  bool required;
  bool nullable;
  kj::Maybe<Literal> defaultValue;
  kj::Maybe<kj::String> description;
};

struct GeneratedUnit {
  // One named type in the output.

  enum class Kind: uint8_t {
    STRUCT,
    // A model class with fields.
    ALIAS,
    // A name for a non-object type (string with constraints, array, union, ...).
    TOKEN,
    // A named constant whose only value is its own type tag.
    OPAQUE
    // Placeholder for a referenced def that is not generated.  Accepts any JSON object when the
    // target is object-like (see `opaqueObject`), and any value otherwise.
  };

  SymbolKey key;
  const LexiconDocument* document;
  Kind kind;
  kj::Maybe<kj::String> description;

  kj::Array<UnitField> fields;
  // STRUCT only.  In declared property order.

  kj::Maybe<kj::Own<ResolvedType>> aliasType;
  // ALIAS only.

  kj::String typeTag;
  // The `$type` value of this unit's objects.

  bool unionVariant = false;
  // Whether some union in the run lists this unit.  Variant structs carry a discriminator field.

  kj::Array<SymbolKey> dependencies;
  // Distinct units mentioned by the field or alias types, ordered.

  bool opaqueObject = false;
  // OPAQUE only.  The target is an object, record, query, procedure or subscription.
};

kj::Array<GeneratedUnit> synthesize(const SymbolTable& symbols,
                                    const LexiconDocument& document);
// Units for one generated document, in def declaration order with nested units following the
// unit they were found in.  Throws UNSUPPORTED_KIND for definitions that cannot be expressed.
// Union variants are not marked; see synthesizeAll().

kj::Array<GeneratedUnit> synthesizeAll(const SymbolTable& symbols);
// Units of every generated document, followed by one OPAQUE unit per distinct unresolved
// target (ordered by key), with `unionVariant` set across the whole run.

}  // namespace lexgen

LEXGEN_END_HEADER
