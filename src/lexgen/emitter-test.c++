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
#include "test-util.h"

namespace lexgen {
namespace {

using _::contains;
using _::newTestDirectory;
using _::writeFile;

kj::String renderTree(const kj::ReadableDirectory& dir) {
  Loader loader;
  auto documents = loader.load(dir);
  auto symbols = resolve(documents);
  auto units = synthesizeAll(symbols);
  auto names = allocate(units);
  auto files = render(units, names);
  KJ_ASSERT(files.size() == 1);
  KJ_EXPECT(files[0].path == kj::Path("models.py"));
  return kj::mv(files[0].content);
}

KJ_TEST("python string literals") {
  KJ_EXPECT(pythonString("plain") == "\"plain\"");
  KJ_EXPECT(pythonString("say \"hi\"\n") == "\"say \\\"hi\\\"\\n\"");
  KJ_EXPECT(pythonString("back\\slash\ttab") == "\"back\\\\slash\\ttab\"");
  KJ_EXPECT(pythonString("\x01") == "\"\\x01\"");
  KJ_EXPECT(pythonString("caf\xc3\xa9") == "\"caf\xc3\xa9\"");
}

KJ_TEST("render a record") {
  auto dir = newTestDirectory();
  writeFile(*dir, "thing.json", R"({"lexicon": 1, "id": "app.test.thing", "defs": {
    "main": {"type": "record", "key": "tid", "record": {
      "type": "object",
      "required": ["title"],
      "properties": {
        "title": {"type": "string", "maxLength": 100},
        "count": {"type": "integer"}
      }
    }}
  }})");

  KJ_EXPECT(renderTree(*dir) == kj::str(
      "# Code generated by lexgen ", LEXGEN_VERSION_STRING, ". DO NOT EDIT.\n"
      "\n"
      "from pydantic import BaseModel, Field\n"
      "\n"
      "\n"
      "# app.test.thing\n"
      "class AppTestThing(BaseModel):\n"
      "    title: str = Field(max_length=100)\n"
      "    count: int | None = None\n"));
}

KJ_TEST("render field details") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {
      "type": "object",
      "description": "First line.\n\nMore detail.",
      "required": ["createdAt", "langs"],
      "nullable": ["parent"],
      "properties": {
        "createdAt": {"type": "string", "format": "datetime", "description": "When."},
        "langs": {"type": "array", "items": {"type": "string", "maxLength": 8},
                  "maxLength": 3},
        "parent": {"type": "ref", "ref": "#ref"},
        "mode": {"type": "string", "enum": ["fast", "slow"], "default": "fast"},
        "score": {"type": "integer", "minimum": 0, "maximum": 10},
        "from": {"type": "boolean"}
      }
    },
    "ref": {"type": "object", "properties": {"uri": {"type": "string"}}},
    "label": {"type": "string", "minLength": 1, "description": "A label."},
    "flag": {"type": "token", "description": "A flag."}
  }})");

  auto text = renderTree(*dir);

  KJ_EXPECT(contains(text, "from typing import Annotated, Literal\n"), text);
  KJ_EXPECT(contains(text, "from pydantic import BaseModel, ConfigDict, Field\n"), text);
  KJ_EXPECT(contains(text,
      "class AppTestA(BaseModel):\n"
      "    \"\"\"First line.\n"
      "\n"
      "    More detail.\n"
      "    \"\"\"\n"
      "\n"
      "    model_config = ConfigDict(populate_by_name=True)\n"
      "\n"
      "    created_at: str = Field(alias=\"createdAt\", description=\"When.\")\n"
      "    langs: list[Annotated[str, Field(max_length=8)]] = Field(max_length=3)\n"
      "    parent: AppTestARef | None = None\n"
      "    mode: Literal[\"fast\", \"slow\"] | None = \"fast\"\n"
      "    score: Annotated[int, Field(ge=0, le=10)] | None = None\n"
      "    from_: bool | None = Field(default=None, alias=\"from\")\n"), text);

  // Dependencies come first.
  KJ_EXPECT(contains(text, "# app.test.a#ref\nclass AppTestARef(BaseModel):\n"
                           "    uri: str | None = None\n"), text);
  KJ_EXPECT(strstr(text.cStr(), "class AppTestARef") < strstr(text.cStr(), "class AppTestA("));

  KJ_EXPECT(contains(text,
      "# app.test.a#label\n"
      "# A label.\n"
      "AppTestALabel = Annotated[str, Field(min_length=1)]\n"), text);
  KJ_EXPECT(contains(text,
      "# app.test.a#flag\n"
      "# A flag.\n"
      "AppTestAFlag = Literal[\"app.test.a#flag\"]\n"), text);
}

KJ_TEST("render unions") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "required": ["closed", "open"], "properties": {
      "closed": {"type": "union", "refs": ["#image", "#video"], "closed": true},
      "open": {"type": "union", "refs": ["#image"]}
    }},
    "image": {"type": "object", "properties": {}},
    "video": {"type": "object", "properties": {}}
  }})");

  auto text = renderTree(*dir);

  KJ_EXPECT(contains(text,
      "    closed: Annotated[AppTestAImage | AppTestAVideo, "
      "Field(discriminator=\"lex_type\")]\n"), text);
  KJ_EXPECT(contains(text, "    open: AppTestAImage | dict[str, Any]\n"), text);
  KJ_EXPECT(contains(text,
      "class AppTestAImage(BaseModel):\n"
      "    model_config = ConfigDict(populate_by_name=True)\n"
      "\n"
      "    lex_type: Literal[\"app.test.a#image\"] = "
      "Field(default=\"app.test.a#image\", alias=\"$type\")\n"), text);
}

KJ_TEST("cycles become forward references") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.a", "defs": {
    "main": {"type": "object", "properties": {"b": {"type": "ref", "ref": "app.b"}}}
  }})");
  writeFile(*dir, "b.json", R"({"lexicon": 1, "id": "app.b", "defs": {
    "main": {"type": "object", "properties": {"a": {"type": "ref", "ref": "app.a"}}},
    "node": {"type": "object", "required": ["children"], "properties": {
      "children": {"type": "array", "items": {"type": "ref", "ref": "#node"}}
    }}
  }})");

  auto text = renderTree(*dir);

  KJ_EXPECT(contains(text, "class AppA(BaseModel):\n    b: \"AppB | None\" = None\n"), text);
  KJ_EXPECT(contains(text, "class AppB(BaseModel):\n    a: AppA | None = None\n"), text);
  KJ_EXPECT(contains(text, "    children: \"list[AppBNode]\"\n"), text);
  KJ_EXPECT(contains(text, "\n\nAppBNode.model_rebuild()\nAppA.model_rebuild()\n"), text);
  KJ_EXPECT(!contains(text, "AppB.model_rebuild()"), text);
}

KJ_TEST("empty struct and empty output") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {}}
  }})");
  KJ_EXPECT(contains(renderTree(*dir), "class AppTestA(BaseModel):\n    pass\n"));

  auto names = allocate(nullptr);
  KJ_EXPECT(render(nullptr, names).size() == 0);

  auto out = newTestDirectory();
  KJ_EXPECT(emit(nullptr, names, *out).size() == 0);
  KJ_EXPECT(out->listNames().size() == 0);
}

KJ_TEST("output does not depend on file layout") {
  auto first = newTestDirectory();
  writeFile(*first, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {"b": {"type": "ref", "ref": "app.test.b"}}}
  }})");
  writeFile(*first, "b.json", R"({"lexicon": 1, "id": "app.test.b", "defs": {
    "main": {"type": "string"}
  }})");

  auto second = newTestDirectory();
  writeFile(*second, "z/first.json", R"({"lexicon": 1, "id": "app.test.b", "defs": {
    "main": {"type": "string"}
  }})");
  writeFile(*second, "a/second.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "main": {"type": "object", "properties": {"b": {"type": "ref", "ref": "app.test.b"}}}
  }})");

  auto text = renderTree(*first);
  KJ_EXPECT(text == renderTree(*first));
  KJ_EXPECT(text == renderTree(*second));
}

KJ_TEST("line breaks and control characters in comments") {
  auto dir = newTestDirectory();
  writeFile(*dir, "a.json", R"({"lexicon": 1, "id": "app.test.a", "defs": {
    "label": {"type": "string", "description": "Line one\rimport os\u0000tail"},
    "flag": {"type": "token", "description": "First\r\nsecond\u0007"}
  }})");

  auto text = renderTree(*dir);

  KJ_EXPECT(contains(text, "# app.test.a#label\n# Line one\n# import os\\x00tail\n"), text);
  KJ_EXPECT(contains(text, "# app.test.a#flag\n# First\n# second\\x07\n"), text);
  KJ_EXPECT(!contains(text, "\nimport os"), text);
  KJ_EXPECT(!contains(text, "\r"), text);
  KJ_EXPECT(strlen(text.cStr()) == text.size());
}

KJ_TEST("write files") {
  auto out = newTestDirectory();
  auto files = kj::arr(OutputFile { kj::Path({"pkg", "models.py"}), kj::str("x = 1\n") });
  auto written = writeFiles(*out, files);
  KJ_ASSERT(written.size() == 1);
  KJ_EXPECT(written[0] == kj::Path({"pkg", "models.py"}));
  KJ_EXPECT(_::readFile(*out, "pkg/models.py") == "x = 1\n");

  files[0].content = kj::str("x = 2\n");
  writeFiles(*out, files);
  KJ_EXPECT(_::readFile(*out, "pkg/models.py") == "x = 2\n");
}

}  // namespace
}  // namespace lexgen
