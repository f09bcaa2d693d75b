//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/BigNum.h"

char disable_linker_warning_about_empty_file_bignum_cpp MTK_UNUSED;

#if MTK_HAVE_OPENSSL

#include "mtk/utils/logging.h"
#include "mtk/utils/misc.h"
#include "mtk/utils/SliceBuilder.h"

#include <openssl/bn.h>
#include <openssl/crypto.h>

namespace mtk {

class BigNumContext::Impl {
 public:
  BN_CTX *context;

  Impl() : context(BN_CTX_new()) {
    LOG_IF(FATAL, context == nullptr);
  }
  Impl(const Impl &) = delete;
  Impl &operator=(const Impl &) = delete;
  Impl(Impl &&) = delete;
  Impl &operator=(Impl &&) = delete;
  ~Impl() {
    BN_CTX_free(context);
  }
};

BigNumContext::BigNumContext() : impl_(make_unique<Impl>()) {
}

BigNumContext::BigNumContext(BigNumContext &&) noexcept = default;
BigNumContext &BigNumContext::operator=(BigNumContext &&) noexcept = default;
BigNumContext::~BigNumContext() = default;

class BigNum::Impl {
 public:
  BIGNUM *value;

  Impl() : Impl(BN_new()) {
  }
  explicit Impl(BIGNUM *value) : value(value) {
    LOG_IF(FATAL, value == nullptr);
  }
  Impl(const Impl &) = delete;
  Impl &operator=(const Impl &) = delete;
  Impl(Impl &&) = delete;
  Impl &operator=(Impl &&) = delete;
  ~Impl() {
    BN_clear_free(value);
  }
};

BigNum::BigNum() : impl_(make_unique<Impl>()) {
}

BigNum::BigNum(const BigNum &other) : BigNum() {
  *this = other;
}

BigNum &BigNum::operator=(const BigNum &other) {
  if (this == &other) {
    return *this;
  }
  CHECK(impl_ != nullptr);
  CHECK(other.impl_ != nullptr);
  auto copied = BN_copy(impl_->value, other.impl_->value);
  LOG_IF(FATAL, copied == nullptr);
  return *this;
}

BigNum::BigNum(BigNum &&) noexcept = default;
BigNum &BigNum::operator=(BigNum &&) noexcept = default;
BigNum::~BigNum() = default;

BigNum::BigNum(unique_ptr<Impl> &&impl) : impl_(std::move(impl)) {
}

BigNum BigNum::from_binary(Slice str) {
  return BigNum(make_unique<Impl>(BN_bin2bn(str.ubegin(), narrow_cast<int>(str.size()), nullptr)));
}

Result<BigNum> BigNum::from_hex(CSlice str) {
  BigNum result;
  int parsed = BN_hex2bn(&result.impl_->value, str.c_str());
  if (parsed == 0 || static_cast<size_t>(parsed) != str.size()) {
    return Status::Error(PSLICE() << "Failed to parse \"" << str << "\" as hexadecimal BigNum");
  }
  return std::move(result);
}

BigNum BigNum::from_raw(void *openssl_big_num) {
  return BigNum(make_unique<Impl>(static_cast<BIGNUM *>(openssl_big_num)));
}

int BigNum::get_num_bits() const {
  return BN_num_bits(impl_->value);
}

int BigNum::get_num_bytes() const {
  return BN_num_bytes(impl_->value);
}

bool BigNum::is_zero() const {
  return BN_is_zero(impl_->value) != 0;
}

BigNum BigNum::clone() const {
  BIGNUM *copy = BN_dup(impl_->value);
  LOG_IF(FATAL, copy == nullptr);
  return BigNum(make_unique<Impl>(copy));
}

string BigNum::to_binary(int exact_size) const {
  int num_size = get_num_bytes();
  if (exact_size == -1) {
    exact_size = num_size;
  } else {
    CHECK(exact_size >= num_size);
  }
  string result(exact_size, '\0');
  BN_bn2bin(impl_->value, MutableSlice(result).ubegin() + (exact_size - num_size));
  return result;
}

string BigNum::to_decimal() const {
  char *digits = BN_bn2dec(impl_->value);
  CHECK(digits != nullptr);
  string result(digits);
  OPENSSL_free(digits);
  return result;
}

void BigNum::mod_exp(BigNum &r, const BigNum &a, const BigNum &p, const BigNum &m, BigNumContext &context) {
  int result = BN_mod_exp(r.impl_->value, a.impl_->value, p.impl_->value, m.impl_->value, context.impl_->context);
  LOG_IF(FATAL, result != 1);
}

int BigNum::compare(const BigNum &a, const BigNum &b) {
  return BN_cmp(a.impl_->value, b.impl_->value);
}

StringBuilder &operator<<(StringBuilder &sb, const BigNum &bn) {
  return sb << bn.to_decimal();
}

}  // namespace mtk

#endif
