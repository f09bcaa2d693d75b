//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/ErrorKind.h"

#include "mtk/utils/common.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"

#include <cstring>
#include <limits>

namespace mtk {

extern int VERBOSITY_NAME(tl_message);

// Forward-only reader over one TL message; the first error is kept and turns every further read into a zero value
class TlParser {
  const unsigned char *data_ = nullptr;
  size_t data_len_ = 0;
  size_t left_len_ = 0;
  size_t error_pos_ = std::numeric_limits<size_t>::max();
  int32 nesting_depth_ = 0;
  Status error_;

  alignas(8) static const unsigned char empty_data_[16];

  size_t get_offset() const {
    return data_len_ - left_len_;
  }

 public:
  explicit TlParser(Slice slice);

  TlParser(const TlParser &) = delete;
  TlParser &operator=(const TlParser &) = delete;
  TlParser(TlParser &&) = delete;
  TlParser &operator=(TlParser &&) = delete;
  ~TlParser() = default;

  void set_error(Status error);

  void set_error(ErrorKind kind, Slice message);

  bool has_error() const {
    return error_.is_error();
  }

  Status get_status() const;

  size_t get_error_pos() const {
    return error_pos_;
  }

  void check_len(const size_t len) {
    if (unlikely(left_len_ < len)) {
      set_error(unexpected_end_error(get_offset()));
    } else {
      left_len_ -= len;
    }
  }

  int32 fetch_int_unsafe() {
    int32 result;
    std::memcpy(&result, data_, sizeof(int32));
    data_ += sizeof(int32);
    return result;
  }

  int32 fetch_int() {
    check_len(sizeof(int32));
    return fetch_int_unsafe();
  }

  int64 fetch_long_unsafe() {
    int64 result;
    std::memcpy(&result, data_, sizeof(int64));
    data_ += sizeof(int64);
    return result;
  }

  int64 fetch_long() {
    check_len(sizeof(int64));
    return fetch_long_unsafe();
  }

  double fetch_double_unsafe() {
    double result;
    std::memcpy(&result, data_, sizeof(double));
    data_ += sizeof(double);
    return result;
  }

  double fetch_double() {
    check_len(sizeof(double));
    return fetch_double_unsafe();
  }

  template <class T>
  T fetch_string() {
    check_len(4);
    size_t result_len = data_[0];
    const unsigned char *result_begin;
    size_t result_aligned_len;
    if (result_len < 254) {
      result_begin = data_ + 1;
      result_aligned_len = (result_len >> 2) << 2;
    } else if (result_len == 254) {
      result_len = data_[1] + (data_[2] << 8) + (data_[3] << 16);
      result_begin = data_ + 4;
      result_aligned_len = ((result_len + 3) >> 2) << 2;
    } else {
      set_error(ErrorKind::Deserialize, "Can't fetch string, 255 found");
      return T();
    }
    check_len(result_aligned_len);
    if (has_error()) {
      return T();
    }
    data_ += result_aligned_len + 4;
    return T(reinterpret_cast<const char *>(result_begin), result_len);
  }

  void fetch_end();

  static constexpr int32 MAX_NESTING_DEPTH = 32;

  // for constructors containing a value of their own type; leave_nested() must follow every successful call
  bool enter_nested();

  void leave_nested() {
    CHECK(nesting_depth_ > 0);
    nesting_depth_--;
  }

  size_t get_left_len() const {
    return left_len_;
  }
};

}  // namespace mtk
