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

#include "loader.h"
#include <kj/function.h>
#include <kj/hash.h>
#include <kj/map.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

struct SymbolKey {
  // Canonical address of a referenceable node: a document's NSID plus a def name.  Units
  // synthesized for anonymous nested schemas extend the def name with a dotted path (e.g.
  // `main.output`); since def names cannot contain dots these never collide with real defs.

  kj::String nsid;
  kj::String name;

  SymbolKey clone() const { return SymbolKey { kj::str(nsid), kj::str(name) }; }

  SymbolKey nested(kj::StringPtr child) const {
    return SymbolKey { kj::str(nsid), kj::str(name, '.', child) };
  }

  kj::String getTypeTag() const;
  // The value of `$type` for objects of this def: the bare NSID for `main`, otherwise
  // `nsid#name`.

  inline bool operator==(const SymbolKey& other) const {
    return nsid == other.nsid && name == other.name;
  }
  inline bool operator<(const SymbolKey& other) const {
    if (nsid != other.nsid) return nsid.asPtr() < other.nsid.asPtr();
    return name.asPtr() < other.name.asPtr();
  }
  inline uint hashCode() const { return kj::hashCode(nsid, name); }
};

kj::String KJ_STRINGIFY(const SymbolKey& key);

struct Symbol {
  SymbolKey key;
  const LexiconDocument* document;
  const Definition* definition;

  bool generated;
  // Whether code is generated for this symbol.  False for symbols of imported documents and of
  // documents excluded by the prefix filter; references to those become opaque placeholders.
};

kj::Maybe<SymbolKey> parseRef(kj::StringPtr fromNsid, kj::StringPtr ref);
// Splits a ref string as written in document `fromNsid` into a key.  `#name` is local,
// `nsid#name` is cross-document, a bare `nsid` means that document's `main`.  Returns none if
// the string is syntactically invalid.

bool matchesPrefix(kj::StringPtr nsid, kj::StringPtr prefix);
// True if `nsid` is `prefix` or lies beneath it on a segment boundary, so `app.bsky` matches
// `app.bsky.feed.post` but not `app.bskyx.post`.  A trailing dot on the prefix is ignored and
// an empty prefix matches everything.

class SymbolTable;

SymbolTable resolve(const DocumentSet& documents, kj::Maybe<kj::StringPtr> prefix = kj::none);
// Builds the symbol table, selects the documents matching `prefix`, and resolves every ref in
// them.  Throws UNRESOLVED_REFERENCE on the first ref that does not resolve.  Refs inside
// documents that are not generated are not checked.

class SymbolTable {
  // Cross-document symbol table for one invocation.  Built by resolve(); immutable afterwards
  // and passed explicitly to every later stage.
  //
  // The table points into the DocumentSet it was built from, which must outlive it.

public:
  SymbolTable(SymbolTable&&) = default;
  KJ_DISALLOW_COPY(SymbolTable);

  kj::Maybe<const Symbol&> find(const SymbolKey& key) const;

  const Symbol& resolve(kj::StringPtr fromNsid, kj::StringPtr ref) const;
  // Resolves a ref string appearing in document `fromNsid`.  Throws UNRESOLVED_REFERENCE if
  // the string is malformed or names a missing document or def.

  kj::ArrayPtr<const LexiconDocument* const> getGeneratedDocuments() const {
    return generatedDocuments;
  }
  // Documents selected for generation, ordered by NSID.

  kj::ArrayPtr<const SymbolKey> getDependencies(const SymbolKey& key) const;
  // Distinct defs referenced by the given generated def, ordered.  Empty for symbols that are
  // not generated.

  kj::ArrayPtr<const kj::Array<SymbolKey>> getCycles() const { return cycles; }
  // Every group of generated defs that reference each other (directly or transitively),
  // including defs that reference themselves.  Cycles are legal; the emitter breaks them with
  // forward references.

  bool isCyclic(const SymbolKey& key) const;

  kj::Maybe<kj::StringPtr> getPrefix() const;

private:
  SymbolTable() = default;

  kj::TreeMap<SymbolKey, Symbol> symbols;
  kj::Array<const LexiconDocument*> generatedDocuments;
  kj::TreeMap<SymbolKey, kj::Array<SymbolKey>> dependencies;
  kj::Array<kj::Array<SymbolKey>> cycles;
  kj::Maybe<kj::String> prefix;

  friend SymbolTable resolve(const DocumentSet& documents, kj::Maybe<kj::StringPtr> prefix);
};

void forEachRef(const Definition& definition, kj::FunctionParam<void(kj::StringPtr)> callback);
// Calls `callback` with every ref string reachable from `definition` (ref targets and union
// members, in declaration order), not descending into other defs.

}  // namespace lexgen

LEXGEN_END_HEADER
