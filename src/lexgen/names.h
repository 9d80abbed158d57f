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

#include "types.h"
#include <kj/map.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

kj::Array<kj::String> splitWords(kj::StringPtr text);
// Splits an identifier into words at `.`, `_`, `-` and other punctuation, at lower-to-upper
// transitions (`getTimeline` -> get, Timeline) and at the end of an acronym (`HTMLParser` ->
// HTML, Parser).  Digits stay attached to the word they follow.

kj::String toPascalCase(kj::StringPtr text);
// Each word with its first letter upper-cased and the rest lower-cased, concatenated.

kj::String toSnakeCase(kj::StringPtr text);
// Each word lower-cased, joined with `_`.

kj::String unitName(const SymbolKey& key);
// The class name for a unit: every NSID segment, then every segment of the def name except a
// leading `main`, PascalCased and concatenated.  `app.bsky.feed.post` -> AppBskyFeedPost,
// `app.bsky.feed.defs#postView` -> AppBskyFeedDefsPostView, `...getTimeline#main.output` ->
// ...GetTimelineOutput.

kj::String fieldName(kj::StringPtr jsonName);
// The attribute name for a property: snake_cased, with a trailing `_` if the result is a
// Python keyword or shadows a BaseModel attribute.

extern const kj::StringPtr DISCRIMINATOR_FIELD;
// Attribute carrying `$type` on structs used as union variants.

class NameTable {
  // Output identifiers of one run.  Built by allocate(); immutable afterwards.

public:
  NameTable(NameTable&&) = default;
  KJ_DISALLOW_COPY(NameTable);

  kj::StringPtr getName(const SymbolKey& key) const;
  // Requires that `key` belongs to a unit passed to allocate().

  kj::ArrayPtr<const kj::String> getFieldNames(const SymbolKey& key) const;
  // Parallel to the unit's `fields`.

private:
  NameTable() = default;

  struct Entry {
    kj::String name;
    kj::Array<kj::String> fieldNames;
  };
  kj::TreeMap<SymbolKey, Entry> entries;

  friend NameTable allocate(kj::ArrayPtr<const GeneratedUnit> units);
};

NameTable allocate(kj::ArrayPtr<const GeneratedUnit> units);
// Assigns every unit a class name and every struct field an attribute name.  Throws
// NAME_COLLISION if two units get the same name, if a unit's name equals an identifier the
// generated module imports, or if two fields of one struct get the same attribute name.

}  // namespace lexgen

LEXGEN_END_HEADER
