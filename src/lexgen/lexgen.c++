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

#include "cache.h"
#include "error.h"
#include "generator.h"
#include <kj/debug.h>
#include <kj/main.h>

namespace lexgen {

static const char VERSION_STRING[] = "lexgen version " LEXGEN_VERSION_STRING;

class LexgenMain {
public:
  explicit LexgenMain(kj::ProcessContext& context)
      : context(context), disk(kj::newDiskFilesystem()) {}

  kj::MainFunc getMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Compiles lexicon schema documents into typed pydantic models.");
    builder.addSubCommand("generate", KJ_BIND_METHOD(*this, getGenerateMain),
                          "Generate models from a lexicon directory.")
           .addSubCommand("hash", KJ_BIND_METHOD(*this, getHashMain),
                          "Print the cache key of a lexicon directory.");
    addGlobalOptions(builder);
    return builder.build();
  }

  kj::MainFunc getGenerateMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Compiles every lexicon document under <lexicon-dir> (default: ./lexicons if it "
          "exists, else the current directory) into one pydantic module.  Output is cached "
          "by the content of the inputs, so regenerating an unchanged tree is a copy.");
    addGlobalOptions(builder);
    addSelectionOptions(builder);
    builder.addOptionWithArg({'o', "output"}, KJ_BIND_METHOD(*this, setOutput), "<dir>",
                             "Write generated files under <dir>.  Default: ./generated")
           .addOption({"no-cache"}, KJ_BIND_METHOD(*this, disableCache),
                      "Neither read nor populate the output cache.")
           .expectOptionalArg("<lexicon-dir>", KJ_BIND_METHOD(*this, setInput))
           .callAfterParsing(KJ_BIND_METHOD(*this, generate));
    return builder.build();
  }

  kj::MainFunc getHashMain() {
    kj::MainBuilder builder(context, VERSION_STRING,
          "Prints the 16-hex-digit digest identifying the output of `generate` over "
          "<lexicon-dir> with the same options.");
    addGlobalOptions(builder);
    addSelectionOptions(builder);
    builder.expectArg("<lexicon-dir>", KJ_BIND_METHOD(*this, setInput))
           .callAfterParsing(KJ_BIND_METHOD(*this, hash));
    return builder.build();
  }

  void addGlobalOptions(kj::MainBuilder& builder) {
    builder.addOption({'v', "verbose"}, KJ_BIND_METHOD(*this, setVerbose),
                      "Log progress to stderr.");
  }

  void addSelectionOptions(kj::MainBuilder& builder) {
    builder.addOptionWithArg({'p', "prefix"}, KJ_BIND_METHOD(*this, setPrefix), "<nsid>",
                             "Only generate documents whose NSID is <nsid> or lies beneath it.  "
                             "Other documents are still used to resolve references.")
           .addOptionWithArg({'I', "import-path"}, KJ_BIND_METHOD(*this, addImportPath), "<dir>",
                             "Resolve references against the documents under <dir> without "
                             "generating them.  May be repeated.");
  }

  // =====================================================================================

  kj::MainBuilder::Validity setVerbose() {
    kj::_::Debug::setLogLevel(kj::_::Debug::Severity::INFO);
    return true;
  }

  kj::MainBuilder::Validity setPrefix(kj::StringPtr prefix) {
    options.prefix = kj::str(prefix);
    return true;
  }

  kj::MainBuilder::Validity addImportPath(kj::StringPtr path) {
    options.importPaths.add(kj::str(path));
    return true;
  }

  kj::MainBuilder::Validity setOutput(kj::StringPtr path) {
    outputDir = path;
    return true;
  }

  kj::MainBuilder::Validity disableCache() {
    useCache = false;
    return true;
  }

  kj::MainBuilder::Validity setInput(kj::StringPtr path) {
    inputDir = path;
    return true;
  }

  // =====================================================================================

  // The process exits from outside runCatchingExceptions(), which would otherwise intercept
  // the exit.

  kj::MainBuilder::Validity generate() {
    kj::String summary;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      summary = runGenerate();
    })) {
      reportError(exception);
    }
    context.exitInfo(summary);
    KJ_CLANG_KNOWS_THIS_IS_UNREACHABLE_BUT_GCC_DOESNT;
  }

  kj::MainBuilder::Validity hash() {
    kj::String digest;
    KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
      LexiconInputs inputs(*disk, inputDir, options.importPaths);
      digest = hashLexicons(inputs.getInput(), options.getPrefix(), inputs.getImports());
    })) {
      reportError(exception);
    }
    context.exitInfo(digest);
    KJ_CLANG_KNOWS_THIS_IS_UNREACHABLE_BUT_GCC_DOESNT;
  }

private:
  kj::ProcessContext& context;
  kj::Own<kj::Filesystem> disk;

  GenerateOptions options;
  kj::StringPtr inputDir = nullptr;
  kj::StringPtr outputDir = "generated";
  bool useCache = true;

  kj::StringPtr defaultInputDir() {
    auto metadata = disk->getCurrent().tryLstat(kj::Path("lexicons"));
    KJ_IF_SOME(m, metadata) {
      if (m.type == kj::FsNode::Type::DIRECTORY || m.type == kj::FsNode::Type::SYMLINK) {
        return "lexicons";
      }
    }
    return ".";
  }

  kj::String runGenerate() {
    if (inputDir == nullptr) inputDir = defaultInputDir();

    LexiconInputs inputs(*disk, inputDir, options.importPaths);
    auto digest = hashLexicons(inputs.getInput(), options.getPrefix(), inputs.getImports());

    kj::Maybe<kj::Own<const kj::Directory>> cacheDir;
    if (useCache) {
      auto cacheRoot = defaultCacheRoot();
      KJ_IF_SOME(root, cacheRoot) {
        cacheDir = disk->getRoot().openSubdir(root,
            kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
      } else {
        KJ_LOG(WARNING, "neither XDG_CACHE_HOME nor HOME is set; not caching");
      }
    }

    auto outputPath = disk->getCurrentPath().evalNative(outputDir);
    kj::Array<kj::Path> written;
    bool hit = false;

    KJ_IF_SOME(dir, cacheDir) {
      OutputCache cache(*dir);
      auto found = cache.find(digest);
      KJ_IF_SOME(files, found) {
        hit = true;
        if (files.size() > 0) {
          written = cache.restore(digest, *openOutput(outputPath));
        }
      } else {
        auto files = compile(inputs.getInput(), options.getPrefix(), inputs.getImports());
        cache.store(digest, files);
        if (files.size() > 0) {
          written = writeFiles(*openOutput(outputPath), files);
        }
      }
    } else {
      auto files = compile(inputs.getInput(), options.getPrefix(), inputs.getImports());
      if (files.size() > 0) {
        written = writeFiles(*openOutput(outputPath), files);
      }
    }

    kj::Vector<kj::String> lines;
    for (auto& path: written) {
      lines.add(outputPath.append(path).toNativeString(true));
    }
    if (written.size() == 0) {
      lines.add(kj::str("no lexicons matched; nothing generated"));
    }
    lines.add(kj::str(hit ? "cache hit " : "generated ", digest));
    return kj::strArray(lines, "\n");
  }

  kj::Own<const kj::Directory> openOutput(kj::PathPtr path) {
    if (path.size() == 0) return disk->getRoot().clone();
    return disk->getRoot().openSubdir(path,
        kj::WriteMode::CREATE | kj::WriteMode::MODIFY | kj::WriteMode::CREATE_PARENT);
  }

  KJ_NORETURN(void reportError(const kj::Exception& exception)) {
    // Lexicon errors are expected failures and are reported without a stack trace.
    auto lexiconError = getErrorKind(exception);
    KJ_IF_SOME(kind, lexiconError) {
      KJ_LOG(INFO, "lexicon error", kind);
      context.exitError(kj::str("lexgen: ", exception.getDescription()));
    } else {
      context.exitError(kj::str("lexgen: ", exception));
    }
  }
};

}  // namespace lexgen

KJ_MAIN(lexgen::LexgenMain);
