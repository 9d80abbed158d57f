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

#include "hash.h"
#include "loader.h"
#include <kj/debug.h>
#include <kj/encoding.h>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace lexgen {

namespace {

kj::Exception getOpensslError() {
  // Call when an OpenSSL function returns an error code to convert that into an exception.

  kj::Vector<kj::String> lines;
  while (unsigned long long error = ERR_get_error()) {
    char message[1024];
    ERR_error_string_n(error, message, sizeof(message));
    lines.add(kj::heapString(message));
  }
  kj::String message = kj::strArray(lines, "\n");
  return KJ_EXCEPTION(FAILED, "OpenSSL error", message);
}

KJ_NORETURN(void throwOpensslError());
void throwOpensslError() {
  kj::throwFatalException(getOpensslError());
}

class Sha256 {
public:
  Sha256(): context(EVP_MD_CTX_new()) {
    if (context == nullptr) throwOpensslError();
    if (!EVP_DigestInit_ex(context, EVP_sha256(), nullptr)) {
      EVP_MD_CTX_free(context);
      throwOpensslError();
    }
  }
  ~Sha256() noexcept(false) {
    EVP_MD_CTX_free(context);
  }
  KJ_DISALLOW_COPY_AND_MOVE(Sha256);

  void update(kj::ArrayPtr<const kj::byte> data) {
    if (!EVP_DigestUpdate(context, data.begin(), data.size())) throwOpensslError();
  }

  void updateString(kj::StringPtr text) {
    // Includes the terminating NUL.
    update(kj::arrayPtr(reinterpret_cast<const kj::byte*>(text.cStr()), text.size() + 1));
  }

  kj::Array<kj::byte> finish() {
    auto result = kj::heapArray<kj::byte>(EVP_MAX_MD_SIZE);
    unsigned int size = 0;
    if (!EVP_DigestFinal_ex(context, result.begin(), &size)) throwOpensslError();
    return kj::heapArray<kj::byte>(result.first(size));
  }

private:
  EVP_MD_CTX* context;
};

void hashTree(Sha256& hasher, const kj::ReadableDirectory& dir) {
  for (auto& file: listLexiconFiles(dir)) {
    auto content = dir.openFile(file.path)->readAllBytes();
    hasher.updateString(file.name);
    hasher.updateString(kj::str(content.size()));
    hasher.update(content);
  }
}

}  // namespace

kj::String hashLexicons(const kj::ReadableDirectory& root, kj::Maybe<kj::StringPtr> prefix,
                        kj::ArrayPtr<const kj::ReadableDirectory* const> importDirs) {
  Sha256 hasher;

  hasher.updateString(LEXGEN_VERSION_STRING);
  KJ_IF_SOME(p, prefix) {
    hasher.updateString("prefix");
    hasher.updateString(p);
  }

  hashTree(hasher, root);
  for (auto dir: importDirs) {
    hasher.updateString("import");
    hashTree(hasher, *dir);
  }

  auto digest = hasher.finish();
  return kj::encodeHex(digest.first(DIGEST_BYTES));
}

}  // namespace lexgen
