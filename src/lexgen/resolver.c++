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
#include "error.h"
#include <kj/debug.h>
#include <algorithm>
#include <string.h>

namespace lexgen {

kj::String SymbolKey::getTypeTag() const {
  if (name == "main") {
    return kj::str(nsid);
  } else {
    return kj::str(nsid, '#', name);
  }
}

kj::String KJ_STRINGIFY(const SymbolKey& key) {
  return key.getTypeTag();
}

kj::Maybe<SymbolKey> parseRef(kj::StringPtr fromNsid, kj::StringPtr ref) {
  if (ref.size() == 0) return kj::none;

  auto separator = ref.findFirst('#');
  KJ_IF_SOME(hash, separator) {
    auto nsid = hash == 0 ? kj::str(fromNsid) : kj::heapString(ref.begin(), hash);
    auto name = kj::str(ref.slice(hash + 1));
    if (!isValidNsid(nsid) || !isValidDefName(name)) return kj::none;
    return SymbolKey { kj::mv(nsid), kj::mv(name) };
  } else {
    if (!isValidNsid(ref)) return kj::none;
    return SymbolKey { kj::str(ref), kj::str("main") };
  }
}

bool matchesPrefix(kj::StringPtr nsid, kj::StringPtr prefix) {
  size_t size = prefix.size();
  while (size > 0 && prefix[size - 1] == '.') --size;
  if (size == 0) return true;

  if (nsid.size() < size || memcmp(nsid.begin(), prefix.begin(), size) != 0) return false;
  return nsid.size() == size || nsid[size] == '.';
}

void forEachRef(const Definition& definition, kj::FunctionParam<void(kj::StringPtr)> callback) {
  // Recursion goes through a plain reference so that the FunctionParam is only wrapped once.
  struct Walker {
    kj::FunctionParam<void(kj::StringPtr)>& callback;

    void walkBody(const kj::Maybe<Body>& body) {
      KJ_IF_SOME(b, body) {
        KJ_IF_SOME(schema, b.schema) {
          walk(*schema);
        }
      }
    }

    void walk(const Definition& def) {
      switch (def.which()) {
        case Definition::Kind::RECORD:
          walk(*def.getRecord().record);
          return;
        case Definition::Kind::QUERY:
        case Definition::Kind::PROCEDURE:
        case Definition::Kind::SUBSCRIPTION: {
          auto& method = def.getMethod();
          KJ_IF_SOME(parameters, method.parameters) {
            walk(*parameters);
          }
          walkBody(method.input);
          walkBody(method.output);
          walkBody(method.message);
          return;
        }
        case Definition::Kind::OBJECT:
          for (auto& property: def.getObject().properties) {
            walk(*property.type);
          }
          return;
        case Definition::Kind::ARRAY:
          walk(*def.getArray().items);
          return;
        case Definition::Kind::UNION:
          for (auto& ref: def.getUnion().refs) {
            callback(ref);
          }
          return;
        case Definition::Kind::REF:
          callback(def.getRef().target);
          return;
        case Definition::Kind::STRING:
        case Definition::Kind::INTEGER:
        case Definition::Kind::BOOLEAN:
        case Definition::Kind::BYTES:
        case Definition::Kind::CID_LINK:
        case Definition::Kind::BLOB:
        case Definition::Kind::TOKEN:
        case Definition::Kind::UNKNOWN:
          return;
      }
      KJ_UNREACHABLE;
    }
  };

  Walker { callback }.walk(definition);
}

// =======================================================================================

namespace {

kj::Maybe<const Symbol&> lookup(const kj::TreeMap<SymbolKey, Symbol>& symbols,
                                kj::StringPtr fromNsid, kj::StringPtr ref) {
  auto parsed = parseRef(fromNsid, ref);
  KJ_IF_SOME(key, parsed) {
    return symbols.find(key);
  }
  return kj::none;
}

class CycleFinder {
  // Tarjan's strongly-connected-components algorithm over a graph whose nodes are numbered
  // 0..n-1.  Reports only the components that actually contain a cycle.

public:
  explicit CycleFinder(kj::ArrayPtr<const kj::Vector<uint>> edges)
      : edges(edges), states(kj::heapArray<NodeState>(edges.size())) {
    for (auto& state: states) state = NodeState();
  }

  kj::Array<kj::Array<uint>> run() {
    for (uint i = 0; i < edges.size(); i++) {
      if (states[i].index == UNVISITED) visit(i);
    }

    auto result = components.releaseAsArray();
    std::sort(result.begin(), result.end(),
        [](const kj::Array<uint>& a, const kj::Array<uint>& b) { return a[0] < b[0]; });
    return result;
  }

private:
  static constexpr uint UNVISITED = kj::maxValue;

  struct NodeState {
    uint index = UNVISITED;
    uint lowLink = 0;
    bool onStack = false;
  };

  kj::ArrayPtr<const kj::Vector<uint>> edges;
  kj::Array<NodeState> states;
  kj::Vector<uint> stack;
  kj::Vector<kj::Array<uint>> components;
  uint counter = 0;

  void visit(uint v) {
    auto& state = states[v];
    state.index = counter;
    state.lowLink = counter;
    ++counter;
    stack.add(v);
    state.onStack = true;

    bool selfLoop = false;
    for (uint w: edges[v]) {
      if (w == v) selfLoop = true;
      if (states[w].index == UNVISITED) {
        visit(w);
        states[v].lowLink = kj::min(states[v].lowLink, states[w].lowLink);
      } else if (states[w].onStack) {
        states[v].lowLink = kj::min(states[v].lowLink, states[w].index);
      }
    }

    if (states[v].lowLink != states[v].index) return;

    kj::Vector<uint> component;
    for (;;) {
      uint w = stack.back();
      stack.removeLast();
      states[w].onStack = false;
      component.add(w);
      if (w == v) break;
    }

    if (component.size() > 1 || selfLoop) {
      auto members = component.releaseAsArray();
      std::sort(members.begin(), members.end());
      components.add(kj::mv(members));
    }
  }
};

}  // namespace

kj::Maybe<const Symbol&> SymbolTable::find(const SymbolKey& key) const {
  return symbols.find(key);
}

const Symbol& SymbolTable::resolve(kj::StringPtr fromNsid, kj::StringPtr ref) const {
  KJ_IF_SOME(symbol, lookup(symbols, fromNsid, ref)) {
    return symbol;
  }
  LEXGEN_FAIL(UNRESOLVED_REFERENCE, "reference target not found", fromNsid, ref);
}

kj::ArrayPtr<const SymbolKey> SymbolTable::getDependencies(const SymbolKey& key) const {
  KJ_IF_SOME(deps, dependencies.find(key)) {
    return deps;
  }
  return nullptr;
}

bool SymbolTable::isCyclic(const SymbolKey& key) const {
  for (auto& cycle: cycles) {
    for (auto& member: cycle) {
      if (member == key) return true;
    }
  }
  return false;
}

kj::Maybe<kj::StringPtr> SymbolTable::getPrefix() const {
  KJ_IF_SOME(p, prefix) {
    return p.asPtr();
  }
  return kj::none;
}

SymbolTable resolve(const DocumentSet& documents, kj::Maybe<kj::StringPtr> prefix) {
  SymbolTable table;
  kj::StringPtr filter;
  KJ_IF_SOME(p, prefix) {
    filter = p;
    table.prefix = kj::str(p);
  }

  // Pass 1: declare every def of every document, generated or not.
  kj::Vector<const LexiconDocument*> generated;
  for (auto& document: documents.getDocuments()) {
    bool isGenerated = !documents.isImported(document) && matchesPrefix(document.nsid, filter);
    if (isGenerated) generated.add(&document);

    for (auto& def: document.defs) {
      SymbolKey key { kj::str(document.nsid), kj::str(def.name) };
      Symbol symbol { key.clone(), &document, def.definition.get(), isGenerated };
      table.symbols.insert(kj::mv(key), kj::mv(symbol));
    }
  }
  table.generatedDocuments = generated.releaseAsArray();

  // Pass 2: resolve every ref inside the generated documents and record def-level edges.
  for (auto document: table.generatedDocuments) {
    for (auto& def: document->defs) {
      kj::Vector<SymbolKey> targets;
      forEachRef(*def.definition, [&](kj::StringPtr ref) {
        KJ_IF_SOME(symbol, lookup(table.symbols, document->nsid, ref)) {
          targets.add(symbol.key.clone());
        } else {
          auto nsid = document->nsid.asPtr();
          auto name = def.name.asPtr();
          LEXGEN_FAIL(UNRESOLVED_REFERENCE, "reference target not found", nsid, name, ref);
        }
      });

      std::sort(targets.begin(), targets.end());
      kj::Vector<SymbolKey> distinct(targets.size());
      for (auto& target: targets) {
        if (distinct.size() == 0 || !(distinct.back() == target)) {
          distinct.add(kj::mv(target));
        }
      }

      table.dependencies.insert(SymbolKey { kj::str(document->nsid), kj::str(def.name) },
                                distinct.releaseAsArray());
    }
  }

  // Pass 3: find cycles among generated defs.  Edges to symbols that are not generated lead
  // nowhere and are left out of the graph.
  kj::Vector<const SymbolKey*> nodes;
  kj::TreeMap<SymbolKey, uint> nodeIndex;
  for (auto& entry: table.dependencies) {
    nodeIndex.insert(entry.key.clone(), nodes.size());
    nodes.add(&entry.key);
  }

  kj::Vector<kj::Vector<uint>> edges(nodes.size());
  for (auto& entry: table.dependencies) {
    kj::Vector<uint> out;
    for (auto& target: entry.value) {
      KJ_IF_SOME(index, nodeIndex.find(target)) {
        out.add(index);
      }
    }
    edges.add(kj::mv(out));
  }

  auto components = CycleFinder(edges).run();
  table.cycles = KJ_MAP(component, components) {
    return KJ_MAP(index, component) { return nodes[index]->clone(); };
  };

  if (table.generatedDocuments.size() == 0) {
    KJ_LOG(INFO, "prefix filter matched no documents", filter);
  }
  KJ_LOG(INFO, "resolved references", table.symbols.size(), table.generatedDocuments.size(),
         table.cycles.size());

  return table;
}

}  // namespace lexgen
