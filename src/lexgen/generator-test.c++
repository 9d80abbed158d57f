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

#include "generator.h"
#include "test-util.h"

namespace lexgen {
namespace {

using _::contains;
using _::newTestDirectory;
using _::readFile;
using _::writeFile;

void writeSampleTree(const kj::Directory& dir) {
  writeFile(dir, "app/test/thing.json", R"({"lexicon": 1, "id": "app.test.thing", "defs": {
    "main": {"type": "record", "key": "tid", "record": {
      "type": "object",
      "required": ["title"],
      "properties": {
        "title": {"type": "string", "maxLength": 100},
        "count": {"type": "integer"},
        "owner": {"type": "ref", "ref": "com.other.actor#view"}
      }
    }}
  }})");
  writeFile(dir, "app/test/getThing.json", R"({"lexicon": 1, "id": "app.test.getThing", "defs": {
    "main": {
      "type": "query",
      "parameters": {"type": "params", "required": ["uri"],
                     "properties": {"uri": {"type": "string", "format": "at-uri"}}},
      "output": {"encoding": "application/json", "schema": {
        "type": "object", "required": ["thing"],
        "properties": {"thing": {"type": "ref", "ref": "app.test.thing"}}
      }}
    }
  }})");
  writeFile(dir, "com/other/actor.json", R"({"lexicon": 1, "id": "com.other.actor", "defs": {
    "view": {"type": "object", "properties": {"handle": {"type": "string"}}}
  }})");
}

KJ_TEST("generate end to end") {
  auto input = newTestDirectory();
  writeSampleTree(*input);
  auto output = newTestDirectory();

  auto written = generate(*input, *output);
  KJ_ASSERT(written.size() == 1);
  KJ_EXPECT(written[0] == kj::Path("models.py"));

  auto text = readFile(*output, "models.py");
  KJ_EXPECT(contains(text, "class AppTestThing(BaseModel):\n"), text);
  KJ_EXPECT(contains(text, "class AppTestGetThing(BaseModel):\n    uri: str\n"), text);
  KJ_EXPECT(contains(text, "class AppTestGetThingOutput(BaseModel):\n    thing: AppTestThing\n"),
            text);
  KJ_EXPECT(contains(text, "class ComOtherActorView(BaseModel):\n"), text);
  KJ_EXPECT(strstr(text.cStr(), "class AppTestThing(") <
            strstr(text.cStr(), "class AppTestGetThingOutput("));
}

KJ_TEST("generation is idempotent") {
  auto input = newTestDirectory();
  writeSampleTree(*input);
  auto output = newTestDirectory();

  generate(*input, *output);
  auto first = readFile(*output, "models.py");
  generate(*input, *output);
  KJ_EXPECT(readFile(*output, "models.py") == first);

  auto files = compile(*input);
  KJ_ASSERT(files.size() == 1);
  KJ_EXPECT(files[0].content == first);
}

KJ_TEST("prefix filter") {
  auto input = newTestDirectory();
  writeSampleTree(*input);
  auto output = newTestDirectory();

  generate(*input, *output, "app.test"_kj);
  auto text = readFile(*output, "models.py");
  KJ_EXPECT(contains(text, "class AppTestThing(BaseModel):\n"), text);
  KJ_EXPECT(!contains(text, "class ComOtherActorView"), text);
  KJ_EXPECT(contains(text, "ComOtherActorView = dict[str, Any]\n"), text);
  KJ_EXPECT(contains(text, "    owner: ComOtherActorView | None = None\n"), text);

  // Matching nothing succeeds without writing anything.
  auto empty = newTestDirectory();
  KJ_EXPECT(generate(*input, *empty, "org.nothing"_kj).size() == 0);
  KJ_EXPECT(empty->listNames().size() == 0);
}

KJ_TEST("import paths resolve but are not generated") {
  auto input = newTestDirectory();
  writeFile(*input, "post.json", R"({"lexicon": 1, "id": "app.test.post", "defs": {
    "main": {"type": "object", "properties": {"by": {"type": "ref", "ref": "com.lib.actor"}}}
  }})");
  auto imports = newTestDirectory();
  writeFile(*imports, "actor.json", R"({"lexicon": 1, "id": "com.lib.actor", "defs": {
    "main": {"type": "object", "properties": {"name": {"type": "string"}}}
  }})");

  auto output = newTestDirectory();
  LEXGEN_EXPECT_ERROR(UNRESOLVED_REFERENCE, generate(*input, *output));
  KJ_EXPECT(output->listNames().size() == 0);

  const kj::ReadableDirectory* importDirs[] = { imports.get() };
  generate(*input, *output, kj::none, importDirs);
  auto text = readFile(*output, "models.py");
  KJ_EXPECT(contains(text, "ComLibActor = dict[str, Any]\n"), text);
  KJ_EXPECT(!contains(text, "class ComLibActor"), text);
}

KJ_TEST("filtered-out string defs accept any value") {
  auto input = newTestDirectory();
  writeFile(*input, "post.json", R"({"lexicon": 1, "id": "app.test.post", "defs": {
    "main": {"type": "object", "required": ["reason"], "properties": {
      "reason": {"type": "ref", "ref": "com.other.defs#reasonType"}
    }}
  }})");
  writeFile(*input, "defs.json", R"({"lexicon": 1, "id": "com.other.defs", "defs": {
    "reasonType": {"type": "string", "knownValues": ["spam", "other"]}
  }})");

  auto output = newTestDirectory();
  generate(*input, *output, "app.test"_kj);
  auto text = readFile(*output, "models.py");
  KJ_EXPECT(contains(text,
      "# com.other.defs#reasonType is not generated here; any value is accepted.\n"
      "ComOtherDefsReasonType = Any\n"), text);
  KJ_EXPECT(contains(text, "    reason: ComOtherDefsReasonType\n"), text);
  KJ_EXPECT(!contains(text, "ComOtherDefsReasonType = dict"), text);
}

KJ_TEST("records that reference each other") {
  auto input = newTestDirectory();
  writeFile(*input, "app/a.json", R"({"lexicon": 1, "id": "app.a", "defs": {
    "main": {"type": "record", "key": "tid", "record": {"type": "object", "properties": {
      "b": {"type": "ref", "ref": "app.b#record"}
    }}}
  }})");
  writeFile(*input, "app/b.json", R"({"lexicon": 1, "id": "app.b", "defs": {
    "record": {"type": "object", "properties": {
      "a": {"type": "ref", "ref": "app.a"}
    }}
  }})");

  auto output = newTestDirectory();
  generate(*input, *output);
  auto text = readFile(*output, "models.py");

  KJ_EXPECT(contains(text,
      "# app.a\n"
      "class AppA(BaseModel):\n"
      "    b: \"AppBRecord | None\" = None\n"
      "\n"
      "\n"
      "# app.b#record\n"
      "class AppBRecord(BaseModel):\n"
      "    a: AppA | None = None\n"), text);
  KJ_EXPECT(contains(text, "\n\nAppA.model_rebuild()\n"), text);
  KJ_EXPECT(!contains(text, "AppBRecord.model_rebuild()"), text);
}

KJ_TEST("errors leave the output untouched") {
  auto input = newTestDirectory();
  writeSampleTree(*input);
  auto output = newTestDirectory();
  generate(*input, *output);
  auto before = readFile(*output, "models.py");

  writeFile(*input, "app/test/broken.json", R"({"lexicon": 1, "id": "app.test.broken"})");
  LEXGEN_EXPECT_ERROR(MALFORMED_DOCUMENT, generate(*input, *output));
  KJ_EXPECT(readFile(*output, "models.py") == before);
}

KJ_TEST("input must be a directory") {
  auto fs = kj::newDiskFilesystem();
  LEXGEN_EXPECT_ERROR(NOT_A_DIRECTORY,
      openLexiconDirectory(*fs, "/nonexistent/lexgen-test-input"));
  LEXGEN_EXPECT_ERROR(NOT_A_DIRECTORY, openLexiconDirectory(*fs, "/dev/null"));

  GenerateOptions options;
  options.importPaths.add(kj::str("/nonexistent/lexgen-test-import"));
  LEXGEN_EXPECT_ERROR(NOT_A_DIRECTORY, hashLexicons("/", options));
}

}  // namespace
}  // namespace lexgen
