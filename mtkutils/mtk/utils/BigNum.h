//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"

#if MTK_HAVE_OPENSSL

#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"
#include "mtk/utils/StringBuilder.h"

namespace mtk {

class BigNumContext {
 public:
  BigNumContext();
  BigNumContext(const BigNumContext &) = delete;
  BigNumContext &operator=(const BigNumContext &) = delete;
  BigNumContext(BigNumContext &&other) noexcept;
  BigNumContext &operator=(BigNumContext &&other) noexcept;
  ~BigNumContext();

 private:
  class Impl;
  unique_ptr<Impl> impl_;

  friend class BigNum;
};

// Arbitrary precision unsigned integer, stored as an OpenSSL BIGNUM
class BigNum {
 public:
  BigNum();
  BigNum(const BigNum &other);
  BigNum &operator=(const BigNum &other);
  BigNum(BigNum &&other) noexcept;
  BigNum &operator=(BigNum &&other) noexcept;
  ~BigNum();

  // big-endian magnitude
  static BigNum from_binary(Slice str);

  static Result<BigNum> from_hex(CSlice str);

  // takes ownership of a BIGNUM *
  static BigNum from_raw(void *openssl_big_num);

  int get_num_bits() const;

  int get_num_bytes() const;

  bool is_zero() const;

  BigNum clone() const;

  // big-endian, left-padded with zeros to exact_size when it is given
  string to_binary(int exact_size = -1) const;

  string to_decimal() const;

  static void mod_exp(BigNum &r, const BigNum &a, const BigNum &p, const BigNum &m, BigNumContext &context);

  static int compare(const BigNum &a, const BigNum &b);

 private:
  class Impl;
  unique_ptr<Impl> impl_;

  explicit BigNum(unique_ptr<Impl> &&impl);
};

StringBuilder &operator<<(StringBuilder &sb, const BigNum &bn);

}  // namespace mtk

#endif
