//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/crypto.h"

#if MTK_HAVE_OPENSSL

#include "mtk/utils/logging.h"
#include "mtk/utils/misc.h"
#include "mtk/utils/StringBuilder.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>

#include <cerrno>
#include <cstring>

namespace mtk {

void init_crypto() {
  static bool is_inited = [] {
    bool result = OPENSSL_init_crypto(0, nullptr) != 0;
    clear_openssl_errors("Init crypto");
    return result;
  }();
  CHECK(is_inited);
}

namespace {

class DigestContext {
 public:
  explicit DigestContext(const char *algorithm) {
    EVP_MD *evp_md = EVP_MD_fetch(nullptr, algorithm, nullptr);
    LOG_IF(FATAL, evp_md == nullptr) << "Unsupported digest " << algorithm;
    initial_ctx_ = EVP_MD_CTX_new();
    LOG_IF(FATAL, initial_ctx_ == nullptr);
    int res = EVP_DigestInit_ex(initial_ctx_, evp_md, nullptr);
    LOG_IF(FATAL, res != 1);
    EVP_MD_free(evp_md);

    ctx_ = EVP_MD_CTX_new();
    LOG_IF(FATAL, ctx_ == nullptr);
  }
  DigestContext(const DigestContext &) = delete;
  DigestContext &operator=(const DigestContext &) = delete;
  DigestContext(DigestContext &&) = delete;
  DigestContext &operator=(DigestContext &&) = delete;
  ~DigestContext() {
    EVP_MD_CTX_free(ctx_);
    EVP_MD_CTX_free(initial_ctx_);
  }

  void digest(Slice data, MutableSlice output) {
    int res = EVP_MD_CTX_copy_ex(ctx_, initial_ctx_);
    LOG_IF(FATAL, res != 1);
    res = EVP_DigestUpdate(ctx_, data.ubegin(), data.size());
    LOG_IF(FATAL, res != 1);
    res = EVP_DigestFinal_ex(ctx_, output.ubegin(), nullptr);
    LOG_IF(FATAL, res != 1);
    EVP_MD_CTX_reset(ctx_);
  }

 private:
  EVP_MD_CTX *initial_ctx_ = nullptr;
  EVP_MD_CTX *ctx_ = nullptr;
};

}  // namespace

void sha1(Slice data, unsigned char output[20]) {
  static thread_local DigestContext context("SHA1");
  context.digest(data, MutableSlice(output, 20));
}

string sha1(Slice data) {
  string result(20, '\0');
  sha1(data, MutableSlice(result).ubegin());
  return result;
}

void sha256(Slice data, MutableSlice output) {
  CHECK(output.size() >= 32);
  static thread_local DigestContext context("SHA256");
  context.digest(data, output);
}

string sha256(Slice data) {
  string result(32, '\0');
  sha256(data, result);
  return result;
}

Status create_openssl_error(int code, Slice message) {
  StringBuilder sb;
  sb << message;
  while (unsigned long error_code = ERR_get_error()) {
    char error_buf[1024];
    ERR_error_string_n(error_code, error_buf, sizeof(error_buf));
    sb << '{' << Slice(error_buf, std::strlen(error_buf)) << '}';
  }
  LOG_IF(ERROR, sb.is_error()) << "OpenSSL error buffer overflow";
  LOG(DEBUG) << sb.as_cslice();
  return Status::Error(code, sb.as_cslice());
}

void clear_openssl_errors(Slice source) {
  if (ERR_peek_error() != 0) {
    auto error = create_openssl_error(0, "Unprocessed OPENSSL_ERROR");
    if (!ends_with(error.message(), ":def_load:system lib}")) {
      LOG(ERROR) << source << ": " << error;
    }
  }
  errno = 0;
}

}  // namespace mtk

#endif
