//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/Status.h"

#include <type_traits>
#include <utility>

namespace mtk {

template <class T>
class optional {
 public:
  optional() = default;
  template <class T1, std::enable_if_t<!std::is_same<std::decay_t<T1>, optional>::value, int> = 0>
  optional(T1 &&t) : impl_(std::forward<T1>(t)) {
  }

  optional(const optional &other) {
    if (other) {
      impl_ = Result<T>(other.value());
    }
  }
  optional &operator=(const optional &other) {
    if (this == &other) {
      return *this;
    }
    if (other) {
      impl_ = Result<T>(other.value());
    } else {
      impl_ = Result<T>();
    }
    return *this;
  }
  optional(optional &&) = default;
  optional &operator=(optional &&) = default;
  ~optional() = default;

  explicit operator bool() const {
    return impl_.is_ok();
  }
  T &value() {
    return impl_.ok_ref();
  }
  const T &value() const {
    return impl_.ok_ref();
  }
  T &operator*() {
    return value();
  }
  const T &operator*() const {
    return value();
  }
  T *operator->() {
    return &value();
  }
  const T *operator->() const {
    return &value();
  }

 private:
  Result<T> impl_;
};

}  // namespace mtk
