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

#include "emitter.h"
#include "hash.h"

LEXGEN_BEGIN_HEADER

namespace lexgen {

struct GenerateOptions {
  // Everything that affects a run besides the input and output directories.

  kj::Maybe<kj::String> prefix;
  // Generate only documents whose NSID is this prefix or lies beneath it.  Documents outside
  // the prefix still resolve references.

  kj::Vector<kj::String> importPaths;
  // Directories of documents that may be referenced but are never generated.  Relative paths
  // are interpreted against the current directory.

  kj::Maybe<kj::StringPtr> getPrefix() const;
};

kj::Array<OutputFile> compile(const kj::ReadableDirectory& input,
                              kj::Maybe<kj::StringPtr> prefix = kj::none,
                              kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs = nullptr);
// Runs load, resolve, synthesize, allocate and render, without touching any output.  Throws
// on the first error.

kj::Array<kj::Path> generate(const kj::ReadableDirectory& input, const kj::Directory& output,
                             kj::Maybe<kj::StringPtr> prefix = kj::none,
                             kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs = nullptr);
// compile() then writeFiles().  Returns the written paths relative to `output`; empty (and
// nothing written) if no document matches the prefix.

kj::Own<const kj::ReadableDirectory> openLexiconDirectory(const kj::Filesystem& fs,
                                                          kj::StringPtr path);
// Opens a lexicon tree given as a native path, relative to the current directory.  Throws
// NOT_A_DIRECTORY if it does not exist or is not a directory.

class LexiconInputs {
  // The input directory and import paths of a run on the local filesystem, opened.

public:
  LexiconInputs(const kj::Filesystem& fs, kj::StringPtr inputDir,
                kj::ArrayPtr<const kj::String> importPaths);
  KJ_DISALLOW_COPY_AND_MOVE(LexiconInputs);

  const kj::ReadableDirectory& getInput() const { return *input; }
  kj::ArrayPtr<const kj::ReadableDirectory* const> getImports() const { return importPointers; }

private:
  kj::Own<const kj::ReadableDirectory> input;
  kj::Vector<kj::Own<const kj::ReadableDirectory>> imports;
  kj::Vector<const kj::ReadableDirectory*> importPointers;
};

kj::Array<kj::String> generate(kj::StringPtr inputDir, kj::StringPtr outputDir,
                               const GenerateOptions& options = {});
// Same as above on the local filesystem.  Relative paths are interpreted against the current
// directory.  The output directory is created only if there is something to write.  Returns
// absolute native paths.  Throws NOT_A_DIRECTORY if the input (or an import path) does not
// exist or is not a directory.

kj::String hashLexicons(kj::StringPtr inputDir, const GenerateOptions& options = {});
// hashLexicons() on the local filesystem, with the same directory checks as generate().

}  // namespace lexgen

LEXGEN_END_HEADER
