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
#include "error.h"
#include "loader.h"
#include <kj/debug.h>

namespace lexgen {

kj::Maybe<kj::StringPtr> GenerateOptions::getPrefix() const {
  KJ_IF_SOME(p, prefix) {
    return p.asPtr();
  }
  return kj::none;
}

kj::Array<OutputFile> compile(const kj::ReadableDirectory& input, kj::Maybe<kj::StringPtr> prefix,
                              kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs) {
  Loader loader;
  for (auto dir: importDirs) {
    loader.addImportPath(*dir);
  }

  auto documents = loader.load(input);
  auto symbols = resolve(documents, prefix);
  auto units = synthesizeAll(symbols);
  auto names = allocate(units);
  return render(units, names);
}

kj::Array<kj::Path> generate(const kj::ReadableDirectory& input, const kj::Directory& output,
                             kj::Maybe<kj::StringPtr> prefix,
                             kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs) {
  auto files = compile(input, prefix, importDirs);
  if (files.size() == 0) {
    KJ_LOG(INFO, "nothing to generate");
    return nullptr;
  }
  return writeFiles(output, files);
}

// =======================================================================================

kj::Own<const kj::ReadableDirectory> openLexiconDirectory(const kj::Filesystem& fs,
                                                          kj::StringPtr path) {
  auto resolved = fs.getCurrentPath().evalNative(path);
  const kj::ReadableDirectory& root = fs.getRoot();
  if (resolved.size() == 0) {
    return root.clone();
  }

  auto metadata = root.tryLstat(resolved);
  KJ_IF_SOME(m, metadata) {
    LEXGEN_REQUIRE(m.type == kj::FsNode::Type::DIRECTORY ||
                   m.type == kj::FsNode::Type::SYMLINK,
                   NOT_A_DIRECTORY, "lexicon path is not a directory", path);
  } else {
    LEXGEN_FAIL(NOT_A_DIRECTORY, "lexicon directory does not exist", path);
  }

  auto dir = root.tryOpenSubdir(resolved);
  KJ_IF_SOME(d, dir) {
    return kj::mv(d);
  }
  LEXGEN_FAIL(NOT_A_DIRECTORY, "lexicon directory does not exist", path);
}

LexiconInputs::LexiconInputs(const kj::Filesystem& fs, kj::StringPtr inputDir,
                             kj::ArrayPtr<const kj::String> importPaths)
    : input(openLexiconDirectory(fs, inputDir)) {
  for (auto& path: importPaths) {
    auto& dir = imports.add(openLexiconDirectory(fs, path));
    importPointers.add(dir.get());
  }
}

kj::Array<kj::String> generate(kj::StringPtr inputDir, kj::StringPtr outputDir,
                               const GenerateOptions& options) {
  auto fs = kj::newDiskFilesystem();
  LexiconInputs inputs(*fs, inputDir, options.importPaths);

  auto files = compile(inputs.getInput(), options.getPrefix(), inputs.getImports());
  if (files.size() == 0) {
    KJ_LOG(INFO, "nothing to generate", inputDir);
    return nullptr;
  }

  auto outputPath = fs->getCurrentPath().evalNative(outputDir);
  auto output = outputPath.size() == 0 ? fs->getRoot().clone() : fs->getRoot().openSubdir(
      outputPath, kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);

  auto written = writeFiles(*output, files);
  return KJ_MAP(path, written) { return outputPath.append(path).toNativeString(true); };
}

kj::String hashLexicons(kj::StringPtr inputDir, const GenerateOptions& options) {
  auto fs = kj::newDiskFilesystem();
  LexiconInputs inputs(*fs, inputDir, options.importPaths);
  return hashLexicons(inputs.getInput(), options.getPrefix(), inputs.getImports());
}

}  // namespace lexgen
