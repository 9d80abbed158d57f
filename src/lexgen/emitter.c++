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

#include "emitter.h"
#include <kj/debug.h>
#include <kj/string-tree.h>
#include <set>

namespace lexgen {

namespace {

const kj::StringPtr INDENT = "    ";
const kj::StringPtr MODULE_FILE = "models.py";

void appendEscaped(kj::Vector<char>& out, kj::ArrayPtr<const char> text) {
  static const char HEX[] = "0123456789abcdef";
  for (char c: text) {
    switch (c) {
      case '\\': out.add('\\'); out.add('\\'); break;
      case '"': out.add('\\'); out.add('"'); break;
      case '\n': out.add('\\'); out.add('n'); break;
      case '\r': out.add('\\'); out.add('r'); break;
      case '\t': out.add('\\'); out.add('t'); break;
      default:
        if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
          out.add('\\');
          out.add('x');
          out.add(HEX[(c >> 4) & 0x0f]);
          out.add(HEX[c & 0x0f]);
        } else {
          // UTF-8 sequences pass through; Python source is UTF-8.
          out.add(c);
        }
        break;
    }
  }
}

kj::String escapeComment(kj::ArrayPtr<const char> text) {
  // Control characters are hex-escaped; quotes and backslashes are left as written.
  static const char HEX[] = "0123456789abcdef";
  kj::Vector<char> out(text.size() + 1);
  for (char c: text) {
    if (static_cast<unsigned char>(c) < 0x20 || c == 0x7f) {
      out.add('\\');
      out.add('x');
      out.add(HEX[(c >> 4) & 0x0f]);
      out.add(HEX[c & 0x0f]);
    } else {
      out.add(c);
    }
  }
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

kj::String escape(kj::ArrayPtr<const char> text) {
  kj::Vector<char> out(text.size() + 1);
  appendEscaped(out, text);
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

kj::Array<kj::ArrayPtr<const char>> splitLines(kj::StringPtr text) {
  // Breaks on "\n", "\r\n" and a lone "\r", the same line ends Python's tokenizer accepts.
  kj::Vector<kj::ArrayPtr<const char>> lines;
  size_t start = 0;
  for (size_t i = 0; i <= text.size(); i++) {
    if (i == text.size() || text[i] == '\n' || text[i] == '\r') {
      lines.add(text.slice(start, i));
      if (i < text.size() && text[i] == '\r' && i + 1 < text.size() && text[i + 1] == '\n') {
        ++i;
      }
      start = i + 1;
    }
  }
  while (lines.size() > 1 && lines.back().size() == 0) {
    lines.removeLast();
  }
  return lines.releaseAsArray();
}

kj::String pythonLiteral(const Literal& literal) {
  KJ_SWITCH_ONEOF(literal) {
    KJ_CASE_ONEOF(text, kj::String) {
      return pythonString(text);
    }
    KJ_CASE_ONEOF(number, int64_t) {
      return kj::str(number);
    }
    KJ_CASE_ONEOF(flag, bool) {
      return kj::str(flag ? "True" : "False");
    }
  }
  KJ_UNREACHABLE;
}

void addConstraints(const ResolvedType& type, kj::Vector<kj::String>& args) {
  // Keyword arguments of pydantic's Field() that enforce the type's constraints.

  kj::Maybe<uint64_t> minLength;
  kj::Maybe<uint64_t> maxLength;

  switch (type.which()) {
    case ResolvedType::Kind::SCALAR: {
      auto& scalar = type.getScalar();
      switch (scalar.kind) {
        case ScalarKind::TEXT:
        case ScalarKind::BYTES:
          minLength = scalar.minLength;
          maxLength = scalar.maxLength;
          break;
        case ScalarKind::INTEGER:
          KJ_IF_SOME(minimum, scalar.minimum) {
            args.add(kj::str("ge=", minimum));
          }
          KJ_IF_SOME(maximum, scalar.maximum) {
            args.add(kj::str("le=", maximum));
          }
          break;
        case ScalarKind::BOOLEAN:
        case ScalarKind::BLOB:
        case ScalarKind::CID_LINK:
        case ScalarKind::UNKNOWN:
          break;
      }
      break;
    }
    case ResolvedType::Kind::LIST:
      minLength = type.getList().minLength;
      maxLength = type.getList().maxLength;
      break;
    case ResolvedType::Kind::OPTIONAL:
    case ResolvedType::Kind::ENUM:
    case ResolvedType::Kind::NAMED:
    case ResolvedType::Kind::UNION:
    case ResolvedType::Kind::UNRESOLVED:
      break;
  }

  KJ_IF_SOME(n, minLength) {
    args.add(kj::str("min_length=", n));
  }
  KJ_IF_SOME(n, maxLength) {
    args.add(kj::str("max_length=", n));
  }
}

class ModuleRenderer {
public:
  ModuleRenderer(kj::ArrayPtr<const GeneratedUnit> units, const NameTable& names)
      : units(units), names(names), defined(kj::heapArray<bool>(units.size())) {
    for (size_t i = 0; i < units.size(); i++) {
      defined[i] = false;
      index.insert(units[i].key.clone(), i);
    }
  }

  kj::String render() {
    kj::Vector<kj::StringTree> bodies(units.size());
    kj::Vector<kj::StringPtr> rebuilds;

    for (auto unit: orderUnits(units, names)) {
      unitHasForward = false;
      bodies.add(renderUnit(*unit));
      defined[unit - units.begin()] = true;
      if (unitHasForward && unit->kind == GeneratedUnit::Kind::STRUCT) {
        rebuilds.add(names.getName(unit->key));
      }
    }

    kj::StringTree footer;
    if (rebuilds.size() > 0) {
      auto calls = KJ_MAP(name, rebuilds) { return kj::strTree(name, ".model_rebuild()\n"); };
      footer = kj::strTree("\n\n", kj::StringTree(kj::mv(calls), ""));
    }

    return kj::strTree(
        renderHeader(), "\n\n",
        kj::StringTree(bodies.releaseAsArray(), "\n\n"),
        kj::mv(footer)).flatten();
  }

private:
  kj::ArrayPtr<const GeneratedUnit> units;
  const NameTable& names;
  kj::TreeMap<SymbolKey, size_t> index;
  kj::Array<bool> defined;

  bool inStruct = false;
  bool fieldHasForward = false;
  bool unitHasForward = false;

  bool usesAnnotated = false;
  bool usesAny = false;
  bool usesLiteral = false;
  bool usesBaseModel = false;
  bool usesConfigDict = false;
  bool usesField = false;

  const GeneratedUnit& unitFor(const SymbolKey& key) {
    KJ_IF_SOME(i, index.find(key)) {
      return units[i];
    }
    KJ_FAIL_REQUIRE("type refers to a unit that is not part of the output", key);
  }

  kj::StringTree renderHeader() {
    kj::Vector<kj::StringPtr> typing;
    if (usesAnnotated) typing.add("Annotated");
    if (usesAny) typing.add("Any");
    if (usesLiteral) typing.add("Literal");

    kj::Vector<kj::StringPtr> pydantic;
    if (usesBaseModel) pydantic.add("BaseModel");
    if (usesConfigDict) pydantic.add("ConfigDict");
    if (usesField) pydantic.add("Field");

    auto result = kj::strTree("# Code generated by lexgen ", LEXGEN_VERSION_STRING,
                              ". DO NOT EDIT.\n");
    if (typing.size() > 0) {
      result = kj::strTree(kj::mv(result), "\nfrom typing import ", kj::strArray(typing, ", "),
                           "\n");
    }
    if (pydantic.size() > 0) {
      result = kj::strTree(kj::mv(result), "\nfrom pydantic import ",
                           kj::strArray(pydantic, ", "), "\n");
    }
    return result;
  }

  kj::StringTree renderUnit(const GeneratedUnit& unit) {
    auto name = names.getName(unit.key);

    switch (unit.kind) {
      case GeneratedUnit::Kind::STRUCT:
        return renderStruct(unit, name);

      case GeneratedUnit::Kind::ALIAS:
        return kj::strTree(
            renderComment(unit), name, " = ",
            renderType(*KJ_ASSERT_NONNULL(unit.aliasType), true), "\n");

      case GeneratedUnit::Kind::TOKEN:
        usesLiteral = true;
        return kj::strTree(
            renderComment(unit), name, " = Literal[", pythonString(unit.typeTag), "]\n");

      case GeneratedUnit::Kind::OPAQUE:
        usesAny = true;
        if (unit.opaqueObject) {
          return kj::strTree(
              "# ", unit.key, " is not generated here; any object is accepted.\n",
              name, " = dict[str, Any]\n");
        } else {
          return kj::strTree(
              "# ", unit.key, " is not generated here; any value is accepted.\n",
              name, " = Any\n");
        }
    }
    KJ_UNREACHABLE;
  }

  kj::StringTree renderComment(const GeneratedUnit& unit) {
    auto result = kj::strTree("# ", unit.key, "\n");
    KJ_IF_SOME(description, unit.description) {
      auto lines = KJ_MAP(line, splitLines(description)) {
        return line.size() == 0 ? kj::strTree("#\n")
                                : kj::strTree("# ", escapeComment(line), "\n");
      };
      result = kj::strTree(kj::mv(result), kj::StringTree(kj::mv(lines), ""));
    }
    return result;
  }

  kj::StringTree renderDocstring(kj::StringPtr description) {
    auto lines = splitLines(description);
    if (lines.size() == 1) {
      return kj::strTree(INDENT, "\"\"\"", escape(lines[0]), "\"\"\"\n");
    }

    auto body = KJ_MAP(line, lines.slice(1, lines.size())) {
      return line.size() == 0 ? kj::strTree("\n") : kj::strTree(INDENT, escape(line), "\n");
    };
    return kj::strTree(INDENT, "\"\"\"", escape(lines[0]), "\n",
                       kj::StringTree(kj::mv(body), ""), INDENT, "\"\"\"\n");
  }

  kj::StringTree renderStruct(const GeneratedUnit& unit, kj::StringPtr name) {
    usesBaseModel = true;
    inStruct = true;
    KJ_DEFER(inStruct = false);

    auto attributes = names.getFieldNames(unit.key);
    kj::Vector<kj::StringTree> sections;

    KJ_IF_SOME(description, unit.description) {
      sections.add(renderDocstring(description));
    }

    bool aliased = unit.unionVariant;
    for (size_t i = 0; i < unit.fields.size(); i++) {
      if (attributes[i] != unit.fields[i].jsonName) aliased = true;
    }
    if (aliased) {
      usesConfigDict = true;
      sections.add(kj::strTree(INDENT, "model_config = ConfigDict(populate_by_name=True)\n"));
    }

    kj::Vector<kj::StringTree> lines;
    if (unit.unionVariant) {
      usesLiteral = true;
      usesField = true;
      auto tag = pythonString(unit.typeTag);
      lines.add(kj::strTree(INDENT, DISCRIMINATOR_FIELD, ": Literal[", tag, "] = Field(default=",
                            tag, ", alias=\"$type\")\n"));
    }
    for (size_t i = 0; i < unit.fields.size(); i++) {
      lines.add(renderField(unit.fields[i], attributes[i]));
    }
    if (lines.size() > 0) {
      sections.add(kj::StringTree(lines.releaseAsArray(), ""));
    }

    if (sections.size() == 0) {
      sections.add(kj::strTree(INDENT, "pass\n"));
    }

    return kj::strTree("# ", unit.key, "\n",
                       "class ", name, "(BaseModel):\n",
                       kj::StringTree(sections.releaseAsArray(), "\n"));
  }

  kj::StringTree renderField(const UnitField& field, kj::StringPtr attribute) {
    fieldHasForward = false;
    auto& type = *field.type;

    // A required, non-null scalar or list takes its constraints as Field() arguments; anywhere
    // else they are attached with Annotated.
    bool bare = field.required &&
        (type.which() == ResolvedType::Kind::SCALAR || type.which() == ResolvedType::Kind::LIST);

    auto annotation = renderType(type, !bare);
    if (!field.required && type.which() != ResolvedType::Kind::OPTIONAL) {
      annotation = kj::strTree(kj::mv(annotation), " | None");
    }

    kj::Vector<kj::String> args;
    KJ_IF_SOME(value, field.defaultValue) {
      args.add(kj::str("default=", pythonLiteral(value)));
    } else if (!field.required) {
      args.add(kj::str("default=None"));
    }
    if (attribute != field.jsonName) {
      args.add(kj::str("alias=", pythonString(field.jsonName)));
    }
    if (bare) {
      addConstraints(type, args);
    }
    KJ_IF_SOME(description, field.description) {
      args.add(kj::str("description=", pythonString(description)));
    }

    kj::StringTree text = fieldHasForward
        ? kj::strTree(pythonString(annotation.flatten()))
        : kj::mv(annotation);

    if (args.size() == 0) {
      return kj::strTree(INDENT, attribute, ": ", kj::mv(text), "\n");
    } else if (args.size() == 1 && args[0].startsWith("default=")) {
      return kj::strTree(INDENT, attribute, ": ", kj::mv(text), " = ", args[0].slice(8), "\n");
    } else {
      usesField = true;
      return kj::strTree(INDENT, attribute, ": ", kj::mv(text),
                         " = Field(", kj::strArray(args, ", "), ")\n");
    }
  }

  kj::StringTree renderReference(const SymbolKey& target) {
    auto& unit = unitFor(target);
    if (!defined[&unit - units.begin()]) {
      if (!inStruct) {
        // An alias is evaluated immediately, so it cannot name a unit defined later.  This
        // only happens in a cycle made entirely of aliases.
        usesAny = true;
        return kj::strTree("Any");
      }
      fieldHasForward = true;
      unitHasForward = true;
    }
    return kj::strTree(names.getName(target));
  }

  kj::StringTree withConstraints(kj::StringTree base, const ResolvedType& type,
                                 bool inlineConstraints) {
    if (!inlineConstraints) return base;

    kj::Vector<kj::String> args;
    addConstraints(type, args);
    if (args.size() == 0) return base;

    usesAnnotated = true;
    usesField = true;
    return kj::strTree("Annotated[", kj::mv(base), ", Field(", kj::strArray(args, ", "), ")]");
  }

  kj::StringTree renderType(const ResolvedType& type, bool inlineConstraints) {
    switch (type.which()) {
      case ResolvedType::Kind::SCALAR: {
        kj::StringPtr base;
        switch (type.getScalar().kind) {
          case ScalarKind::TEXT: base = "str"; break;
          case ScalarKind::INTEGER: base = "int"; break;
          case ScalarKind::BOOLEAN: base = "bool"; break;
          case ScalarKind::BYTES: base = "bytes"; break;
          case ScalarKind::BLOB: base = "dict[str, Any]"; usesAny = true; break;
          case ScalarKind::CID_LINK: base = "str"; break;
          case ScalarKind::UNKNOWN: base = "Any"; usesAny = true; break;
        }
        return withConstraints(kj::strTree(base), type, inlineConstraints);
      }

      case ResolvedType::Kind::OPTIONAL:
        return kj::strTree(renderType(*type.getOptional().inner, true), " | None");

      case ResolvedType::Kind::LIST:
        return withConstraints(
            kj::strTree("list[", renderType(*type.getList().element, true), "]"),
            type, inlineConstraints);

      case ResolvedType::Kind::ENUM: {
        usesLiteral = true;
        auto values = KJ_MAP(value, type.getEnum().values) { return pythonLiteral(value); };
        return kj::strTree("Literal[", kj::strArray(values, ", "), "]");
      }

      case ResolvedType::Kind::NAMED:
        return renderReference(type.getNamed().target);

      case ResolvedType::Kind::UNRESOLVED:
        return renderReference(type.getUnresolved().target);

      case ResolvedType::Kind::UNION:
        return renderUnion(type.getUnion());
    }
    KJ_UNREACHABLE;
  }

  kj::StringTree renderUnion(const ResolvedType::Union& unionType) {
    // A closed union of two or more generated structs is discriminated on `$type`.  Anything
    // else is a plain union that pydantic tries member by member; open unions also accept
    // objects of unknown types.

    bool discriminated = unionType.closed && unionType.variants.size() >= 2;
    for (auto& variant: unionType.variants) {
      if (variant->which() != ResolvedType::Kind::NAMED ||
          unitFor(variant->getNamed().target).kind != GeneratedUnit::Kind::STRUCT) {
        discriminated = false;
      }
    }

    auto members = KJ_MAP(variant, unionType.variants) { return renderType(*variant, true); };
    auto joined = kj::StringTree(kj::mv(members), " | ");

    if (discriminated) {
      usesAnnotated = true;
      usesField = true;
      return kj::strTree("Annotated[", kj::mv(joined), ", Field(discriminator=\"",
                         DISCRIMINATOR_FIELD, "\")]");
    } else if (unionType.closed) {
      if (unionType.variants.size() == 0) {
        usesAny = true;
        return kj::strTree("Any");
      }
      return joined;
    } else {
      usesAny = true;
      if (unionType.variants.size() == 0) {
        return kj::strTree("dict[str, Any]");
      }
      return kj::strTree(kj::mv(joined), " | dict[str, Any]");
    }
  }
};

}  // namespace

kj::String pythonString(kj::StringPtr text) {
  kj::Vector<char> out(text.size() + 3);
  out.add('"');
  appendEscaped(out, text);
  out.add('"');
  out.add('\0');
  return kj::String(out.releaseAsArray());
}

kj::Array<const GeneratedUnit*> orderUnits(kj::ArrayPtr<const GeneratedUnit> units,
                                           const NameTable& names) {
  kj::TreeMap<SymbolKey, size_t> index;
  for (size_t i = 0; i < units.size(); i++) {
    index.insert(units[i].key.clone(), i);
  }

  auto pending = kj::heapArray<uint>(units.size());
  auto emitted = kj::heapArray<bool>(units.size());
  auto dependents = kj::heapArray<kj::Vector<size_t>>(units.size());
  for (size_t i = 0; i < units.size(); i++) {
    pending[i] = 0;
    emitted[i] = false;
  }
  for (size_t i = 0; i < units.size(); i++) {
    for (auto& dep: units[i].dependencies) {
      KJ_IF_SOME(j, index.find(dep)) {
        // A self-reference never blocks; it is always a forward reference.
        if (j != i) {
          ++pending[i];
          dependents[j].add(i);
        }
      }
    }
  }

  std::set<std::pair<kj::StringPtr, size_t>> ready;
  for (size_t i = 0; i < units.size(); i++) {
    if (pending[i] == 0) ready.insert({ names.getName(units[i].key), i });
  }

  kj::Vector<const GeneratedUnit*> order(units.size());
  while (order.size() < units.size()) {
    size_t next;
    if (ready.empty()) {
      // Only cycles remain.  Prefer breaking at a struct, whose fields can hold forward
      // references.
      kj::Maybe<size_t> best;
      bool bestIsStruct = false;
      for (size_t i = 0; i < units.size(); i++) {
        if (emitted[i]) continue;
        bool isStruct = units[i].kind == GeneratedUnit::Kind::STRUCT;
        KJ_IF_SOME(b, best) {
          if (isStruct != bestIsStruct) {
            if (!isStruct) continue;
          } else if (!(names.getName(units[i].key) < names.getName(units[b].key))) {
            continue;
          }
        }
        best = i;
        bestIsStruct = isStruct;
      }
      next = KJ_ASSERT_NONNULL(best);
    } else {
      next = ready.begin()->second;
      ready.erase(ready.begin());
    }

    emitted[next] = true;
    order.add(&units[next]);
    for (size_t dependent: dependents[next]) {
      if (--pending[dependent] == 0 && !emitted[dependent]) {
        ready.insert({ names.getName(units[dependent].key), dependent });
      }
    }
  }

  return order.releaseAsArray();
}

kj::Array<OutputFile> render(kj::ArrayPtr<const GeneratedUnit> units, const NameTable& names) {
  if (units.size() == 0) {
    return nullptr;
  }

  return kj::arr(OutputFile {
    kj::Path(MODULE_FILE),
    ModuleRenderer(units, names).render()
  });
}

kj::Array<kj::Path> writeFiles(const kj::Directory& outputDir,
                               kj::ArrayPtr<const OutputFile> files) {
  auto paths = KJ_MAP(file, files) {
    auto replacer = outputDir.replaceFile(file.path,
        kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
    replacer->get().writeAll(file.content);
    replacer->commit();
    return file.path.clone();
  };

  KJ_LOG(INFO, "wrote output files", paths.size());
  return paths;
}

kj::Array<kj::Path> emit(kj::ArrayPtr<const GeneratedUnit> units, const NameTable& names,
                         const kj::Directory& outputDir) {
  auto files = render(units, names);
  if (files.size() == 0) {
    KJ_LOG(INFO, "nothing to generate");
    return nullptr;
  }
  return writeFiles(outputDir, files);
}

}  // namespace lexgen
