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
#include "error.h"
#include <kj/debug.h>

namespace lexgen {

namespace {

bool isUpper(char c) { return 'A' <= c && c <= 'Z'; }
bool isLower(char c) { return 'a' <= c && c <= 'z'; }
bool isDigit(char c) { return '0' <= c && c <= '9'; }

char toUpper(char c) { return isLower(c) ? c - 'a' + 'A' : c; }
char toLower(char c) { return isUpper(c) ? c - 'A' + 'a' : c; }

const kj::StringPtr PYTHON_KEYWORDS[] = {
  "and", "as", "assert", "async", "await", "break", "class", "continue", "def", "del", "elif",
  "else", "except", "finally", "for", "from", "global", "if", "import", "in", "is", "lambda",
  "nonlocal", "not", "or", "pass", "raise", "return", "try", "while", "with", "yield",
};

const kj::StringPtr SHADOWED_ATTRIBUTES[] = {
  // BaseModel attributes.
  "construct", "copy", "dict", "from_orm", "json", "model_computed_fields", "model_config",
  "model_construct", "model_copy", "model_dump", "model_dump_json", "model_extra",
  "model_fields", "model_fields_set", "model_json_schema", "model_parametrized_name",
  "model_post_init", "model_rebuild", "model_validate", "model_validate_json",
  "model_validate_strings", "parse_file", "parse_obj", "parse_raw", "schema", "schema_json",
  "update_forward_refs", "validate",

  // Builtins used in annotations.  A field named `list` with a default would rebind `list`
  // inside the class body.
  "bool", "bytes", "int", "list", "str",
};

const kj::StringPtr MODULE_IMPORTS[] = {
  "Annotated", "Any", "BaseModel", "ConfigDict", "Field", "Literal",
};

template <size_t n>
bool contains(const kj::StringPtr (&list)[n], kj::StringPtr name) {
  for (auto& item: list) {
    if (item == name) return true;
  }
  return false;
}

}  // namespace

const kj::StringPtr DISCRIMINATOR_FIELD = "lex_type";

kj::Array<kj::String> splitWords(kj::StringPtr text) {
  kj::Vector<kj::String> words;
  kj::Vector<char> current;

  auto flush = [&]() {
    if (current.size() > 0) {
      words.add(kj::heapString(current.begin(), current.size()));
      current.clear();
    }
  };

  for (size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (!isUpper(c) && !isLower(c) && !isDigit(c)) {
      flush();
      continue;
    }

    if (current.size() > 0 && isUpper(c)) {
      char prev = current.back();
      if (isLower(prev) || isDigit(prev)) {
        flush();
      } else if (isUpper(prev) && i + 1 < text.size() && isLower(text[i + 1])) {
        flush();
      }
    }
    current.add(c);
  }
  flush();

  return words.releaseAsArray();
}

kj::String toPascalCase(kj::StringPtr text) {
  kj::Vector<char> result(text.size() + 1);
  for (auto& word: splitWords(text)) {
    result.add(toUpper(word[0]));
    for (char c: word.slice(1)) {
      result.add(toLower(c));
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String toSnakeCase(kj::StringPtr text) {
  kj::Vector<char> result(text.size() + 4);
  for (auto& word: splitWords(text)) {
    if (result.size() > 0) result.add('_');
    for (char c: word) {
      result.add(toLower(c));
    }
  }
  result.add('\0');
  return kj::String(result.releaseAsArray());
}

kj::String unitName(const SymbolKey& key) {
  kj::Vector<kj::String> parts;
  for (auto& word: splitWords(key.nsid)) {
    parts.add(toPascalCase(word));
  }

  // The def name is split on dots only, so that `getTimeline` stays one PascalCased part.
  kj::StringPtr name = key.name;
  if (name == "main") {
    name = "";
  } else if (name.startsWith("main.")) {
    name = name.slice(5);
  }
  size_t start = 0;
  for (size_t i = 0; i <= name.size(); i++) {
    if (i == name.size() || name[i] == '.') {
      if (i > start) {
        parts.add(toPascalCase(kj::heapString(name.begin() + start, i - start)));
      }
      start = i + 1;
    }
  }

  auto result = kj::strArray(parts, "");
  if (result.size() == 0 || isDigit(result[0])) {
    return kj::str('_', result);
  }
  return result;
}

kj::String fieldName(kj::StringPtr jsonName) {
  auto result = toSnakeCase(jsonName);
  if (result.size() == 0) {
    return kj::str("field");
  }
  if (isDigit(result[0])) {
    return kj::str("field_", result);
  }
  if (contains(PYTHON_KEYWORDS, result) || contains(SHADOWED_ATTRIBUTES, result)) {
    return kj::str(result, '_');
  }
  return result;
}

// =======================================================================================

kj::StringPtr NameTable::getName(const SymbolKey& key) const {
  KJ_IF_SOME(entry, entries.find(key)) {
    return entry.name;
  }
  KJ_FAIL_REQUIRE("no name allocated for unit", key);
}

kj::ArrayPtr<const kj::String> NameTable::getFieldNames(const SymbolKey& key) const {
  KJ_IF_SOME(entry, entries.find(key)) {
    return entry.fieldNames;
  }
  KJ_FAIL_REQUIRE("no name allocated for unit", key);
}

NameTable allocate(kj::ArrayPtr<const GeneratedUnit> units) {
  auto names = KJ_MAP(unit, units) { return unitName(unit.key); };

  kj::HashMap<kj::StringPtr, size_t> owners;
  for (size_t i = 0; i < units.size(); i++) {
    kj::StringPtr name = names[i];
    if (contains(MODULE_IMPORTS, name)) {
      auto key = kj::str(units[i].key);
      LEXGEN_FAIL(NAME_COLLISION, "name is reserved by the generated module", name, key);
    }
    KJ_IF_SOME(other, owners.find(name)) {
      auto first = kj::str(units[other].key);
      auto second = kj::str(units[i].key);
      LEXGEN_FAIL(NAME_COLLISION, "two definitions map to the same name", name, first, second);
    }
    owners.insert(name, i);
  }

  NameTable table;
  for (size_t i = 0; i < units.size(); i++) {
    auto& unit = units[i];

    kj::HashMap<kj::StringPtr, kj::StringPtr> used;
    if (unit.unionVariant && unit.kind == GeneratedUnit::Kind::STRUCT) {
      used.insert(DISCRIMINATOR_FIELD, "$type");
    }

    auto fieldNames = KJ_MAP(field, unit.fields) { return fieldName(field.jsonName); };
    for (size_t j = 0; j < fieldNames.size(); j++) {
      kj::StringPtr attribute = fieldNames[j];
      kj::StringPtr property = unit.fields[j].jsonName;
      KJ_IF_SOME(other, used.find(attribute)) {
        auto key = kj::str(unit.key);
        LEXGEN_FAIL(NAME_COLLISION, "two properties map to the same field name",
                    key, attribute, other, property);
      }
      used.insert(attribute, property);
    }

    table.entries.insert(unit.key.clone(), NameTable::Entry {
      kj::mv(names[i]), kj::mv(fieldNames)
    });
  }

  KJ_LOG(INFO, "allocated names", units.size());

  return table;
}

}  // namespace lexgen
