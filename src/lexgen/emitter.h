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

#include "names.h"
#include <kj/filesystem.h>

LEXGEN_BEGIN_HEADER

namespace lexgen {

struct OutputFile {
  kj::Path path;
  // Relative to the output directory.
  kj::String content;
};

kj::Array<const GeneratedUnit*> orderUnits(kj::ArrayPtr<const GeneratedUnit> units,
                                           const NameTable& names);
// Orders units so that every unit comes after the units it depends on, breaking ties by name.
// When only cycles remain, the alphabetically first remaining struct (or, failing that, unit)
// goes next; its references to units not yet emitted become forward references.

kj::Array<OutputFile> render(kj::ArrayPtr<const GeneratedUnit> units, const NameTable& names);
// Renders the whole output in memory.  One file, `models.py`, or none at all if `units` is
// empty.  The result depends only on the units and names, never on traversal order or time.

kj::Array<kj::Path> writeFiles(const kj::Directory& outputDir,
                               kj::ArrayPtr<const OutputFile> files);
// Writes each file atomically: the new content replaces the old only once fully written.
// Parent directories are created as needed.

kj::Array<kj::Path> emit(kj::ArrayPtr<const GeneratedUnit> units, const NameTable& names,
                         const kj::Directory& outputDir);
// render() then writeFiles().  Returns the written paths, relative to `outputDir`.

kj::String pythonString(kj::StringPtr text);
// A double-quoted Python string literal with the given value.

}  // namespace lexgen

LEXGEN_END_HEADER
