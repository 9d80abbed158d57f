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

#include "common.h"
#include <kj/array.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/string.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

class Definition;

struct NoConstraints {};
// Payload of the kinds that carry nothing besides a description: cid-link, token, unknown.

struct StringType {
  kj::Maybe<kj::String> format;
  kj::Maybe<uint64_t> minLength;
  kj::Maybe<uint64_t> maxLength;
  kj::Maybe<uint64_t> minGraphemes;
  kj::Maybe<uint64_t> maxGraphemes;
  kj::Array<kj::String> enumValues;
  // Closed set of allowed values.  Empty if not constrained.
  kj::Array<kj::String> knownValues;
  // Open set of suggested values.  Informational only.
  kj::Maybe<kj::String> constValue;
  kj::Maybe<kj::String> defaultValue;
};

struct IntegerType {
  kj::Maybe<int64_t> minimum;
  kj::Maybe<int64_t> maximum;
  kj::Array<int64_t> enumValues;
  kj::Maybe<int64_t> constValue;
  kj::Maybe<int64_t> defaultValue;
};

struct BooleanType {
  kj::Maybe<bool> constValue;
  kj::Maybe<bool> defaultValue;
};

struct BytesType {
  kj::Maybe<uint64_t> minLength;
  kj::Maybe<uint64_t> maxLength;
};

struct BlobType {
  kj::Array<kj::String> accept;
  // MIME type patterns.
  kj::Maybe<uint64_t> maxSize;
};

struct ArrayType {
  kj::Own<Definition> items;
  kj::Maybe<uint64_t> minLength;
  kj::Maybe<uint64_t> maxLength;
};

struct Property {
  kj::String name;
  kj::Own<Definition> type;
};

struct ObjectType {
  kj::Array<Property> properties;
  // In declaration order.  Generated field order follows this order exactly.

  kj::Array<kj::String> required;
  kj::Array<kj::String> nullable;

  bool isParams = false;
  // Declared as `params` (the parameters of a query, procedure or subscription) rather than
  // `object`.  Otherwise identical.

  bool isRequired(kj::StringPtr name) const;
  bool isNullable(kj::StringPtr name) const;
};

struct UnionType {
  kj::Array<kj::String> refs;
  // Raw ref strings, in declaration order.

  bool closed = false;
  // A closed union admits only the listed variants; an open one also admits unknown `$type`s.
};

struct RefType {
  kj::String target;
  // Raw ref string: `#def`, `nsid#def`, or `nsid`.
};

struct Body {
  // The input or output of a procedure / query, or the message of a subscription.

  kj::Maybe<kj::String> encoding;
  kj::Maybe<kj::String> description;
  kj::Maybe<kj::Own<Definition>> schema;
  // Absent for bodies that are not JSON (e.g. `*/*` blobs).
};

struct RecordType {
  kj::String key;
  // Record key type, e.g. `tid`, `literal:self`, `any`.

  kj::Own<Definition> record;
  // Always of kind OBJECT.
};

struct MethodType {
  // Shared payload of QUERY, PROCEDURE and SUBSCRIPTION.

  kj::Maybe<kj::Own<Definition>> parameters;
  // Always of kind OBJECT (with isParams set).

  kj::Maybe<Body> input;
  // Procedures only.
  kj::Maybe<Body> output;
  // Queries and procedures.
  kj::Maybe<Body> message;
  // Subscriptions only.

  kj::Array<kj::String> errors;
  // Names of declared errors.
};

class Definition {
  // A typed sub-schema: the value of a def, a property, an array's items, or a body schema.
  //
  // This is a closed sum type.  Code that dispatches on which() uses a `switch` with no default
  // case, so adding a kind is a compile error (-Werror=switch) everywhere it matters.

public:
  enum class Kind: uint8_t {
    RECORD,
    QUERY,
    PROCEDURE,
    SUBSCRIPTION,
    OBJECT,
    ARRAY,
    STRING,
    INTEGER,
    BOOLEAN,
    BYTES,
    CID_LINK,
    BLOB,
    UNION,
    TOKEN,
    UNKNOWN,
    REF
  };

  typedef kj::OneOf<NoConstraints, StringType, IntegerType, BooleanType, BytesType, BlobType,
                    ArrayType, ObjectType, UnionType, RefType, RecordType, MethodType> Payload;

  Definition(Kind kind, kj::Maybe<kj::String> description, Payload payload);
  KJ_DISALLOW_COPY_AND_MOVE(Definition);

  Kind which() const { return kind; }
  kj::Maybe<kj::StringPtr> getDescription() const;

  bool isPrimary() const;
  // True for RECORD, QUERY, PROCEDURE and SUBSCRIPTION, which may only appear as a document's
  // `main` def.

  const StringType& getString() const;
  const IntegerType& getInteger() const;
  const BooleanType& getBoolean() const;
  const BytesType& getBytes() const;
  const BlobType& getBlob() const;
  const ArrayType& getArray() const;
  const ObjectType& getObject() const;
  const UnionType& getUnion() const;
  const RefType& getRef() const;
  const RecordType& getRecord() const;
  const MethodType& getMethod() const;
  // Each getter requires which() to be the matching kind.  getMethod() accepts QUERY,
  // PROCEDURE and SUBSCRIPTION.

private:
  Kind kind;
  kj::Maybe<kj::String> description;
  Payload payload;
};

kj::StringPtr KJ_STRINGIFY(Definition::Kind kind);
// The lexicon `type` string for the kind, e.g. "cid-link".

struct NamedDef {
  kj::String name;
  kj::Own<Definition> definition;
};

struct LexiconDocument {
  // One parsed schema file.

  kj::String nsid;
  kj::String sourceName;
  // Path of the file relative to the root it was loaded from.

  kj::Maybe<kj::String> description;
  kj::Maybe<uint64_t> revision;

  kj::Array<NamedDef> defs;
  // In declaration order.

  kj::Maybe<const Definition&> findDef(kj::StringPtr name) const;
};

LexiconDocument parseLexicon(kj::StringPtr sourceName, kj::ArrayPtr<const char> text);
// Parses the text of one schema file.  `sourceName` is used only for error context.  Throws
// MALFORMED_DOCUMENT or UNSUPPORTED_KIND.

bool isValidNsid(kj::StringPtr nsid);
// At least two dot-separated segments of letters, digits and inner hyphens; the final segment
// starts with a letter.

bool isValidDefName(kj::StringPtr name);
// A letter followed by letters, digits or underscores.

}  // namespace lexgen

LEXGEN_END_HEADER
