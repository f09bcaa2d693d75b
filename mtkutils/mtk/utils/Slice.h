//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"

#include <cstring>
#include <type_traits>

namespace mtk {

class Slice;

class MutableSlice {
  char *s_;
  size_t len_;

 public:
  MutableSlice() : s_(const_cast<char *>("")), len_(0) {
  }
  MutableSlice(char *s, size_t len) : s_(s), len_(len) {
    CHECK(s_ != nullptr);
  }
  MutableSlice(unsigned char *s, size_t len) : s_(reinterpret_cast<char *>(s)), len_(len) {
    CHECK(s_ != nullptr);
  }
  MutableSlice(string &s) : s_(&s[0]), len_(s.size()) {
  }
  MutableSlice(char *s, char *t) : MutableSlice(s, static_cast<size_t>(t - s)) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  MutableSlice &remove_prefix(size_t prefix_len) {
    CHECK(prefix_len <= len_);
    s_ += prefix_len;
    len_ -= prefix_len;
    return *this;
  }
  MutableSlice &remove_suffix(size_t suffix_len) {
    CHECK(suffix_len <= len_);
    len_ -= suffix_len;
    return *this;
  }
  MutableSlice &truncate(size_t size) {
    if (len_ > size) {
      len_ = size;
    }
    return *this;
  }

  MutableSlice substr(size_t from) const {
    CHECK(from <= len_);
    return MutableSlice(s_ + from, len_ - from);
  }
  MutableSlice substr(size_t from, size_t size) const {
    CHECK(from <= len_);
    return MutableSlice(s_ + from, min(size, len_ - from));
  }

  char *data() const {
    return s_;
  }
  char *begin() const {
    return s_;
  }
  unsigned char *ubegin() const {
    return reinterpret_cast<unsigned char *>(s_);
  }
  char *end() const {
    return s_ + len_;
  }
  unsigned char *uend() const {
    return reinterpret_cast<unsigned char *>(s_) + len_;
  }

  string str() const {
    return string(begin(), size());
  }

  void copy_from(Slice from);

  void fill(char c) {
    std::memset(s_, c, len_);
  }
  void fill_zero_secure();

  char &back() {
    CHECK(1 <= len_);
    return s_[len_ - 1];
  }
  char &operator[](size_t i) {
    return s_[i];
  }

  static const size_t npos = static_cast<size_t>(-1);
};

class Slice {
  const char *s_;
  size_t len_;

  struct private_tag {};

 public:
  Slice() : s_(""), len_(0) {
  }
  Slice(const MutableSlice &other) : s_(other.begin()), len_(other.size()) {
  }
  Slice(const char *s, size_t len) : s_(s), len_(len) {
    CHECK(s_ != nullptr);
  }
  Slice(const unsigned char *s, size_t len) : s_(reinterpret_cast<const char *>(s)), len_(len) {
    CHECK(s_ != nullptr);
  }
  Slice(const string &s) : s_(s.c_str()), len_(s.size()) {
  }
  template <class T>
  Slice(T s, std::enable_if_t<std::is_same<const char *, std::remove_const_t<T>>::value, private_tag> = {}) : s_(s) {
    CHECK(s_ != nullptr);
    len_ = std::strlen(s_);
  }
  template <class T>
  Slice(T s, std::enable_if_t<std::is_same<char *, std::remove_const_t<T>>::value, private_tag> = {}) : s_(s) {
    CHECK(s_ != nullptr);
    len_ = std::strlen(s_);
  }
  Slice(const char *s, const char *t) : s_(s), len_(static_cast<size_t>(t - s)) {
    CHECK(s_ != nullptr);
  }
  Slice(const unsigned char *s, const unsigned char *t)
      : s_(reinterpret_cast<const char *>(s)), len_(static_cast<size_t>(t - s)) {
    CHECK(s_ != nullptr);
  }

  template <size_t N>
  constexpr Slice(char (&)[N]) = delete;

  template <size_t N>
  constexpr Slice(const char (&a)[N]) : s_(a), len_(N - 1) {
  }

  bool empty() const {
    return len_ == 0;
  }
  size_t size() const {
    return len_;
  }

  Slice &remove_prefix(size_t prefix_len) {
    CHECK(prefix_len <= len_);
    s_ += prefix_len;
    len_ -= prefix_len;
    return *this;
  }
  Slice &remove_suffix(size_t suffix_len) {
    CHECK(suffix_len <= len_);
    len_ -= suffix_len;
    return *this;
  }
  Slice &truncate(size_t size) {
    if (len_ > size) {
      len_ = size;
    }
    return *this;
  }

  Slice substr(size_t from) const {
    CHECK(from <= len_);
    return Slice(s_ + from, len_ - from);
  }
  Slice substr(size_t from, size_t size) const {
    CHECK(from <= len_);
    return Slice(s_ + from, min(size, len_ - from));
  }

  size_t find(char c) const {
    for (size_t pos = 0; pos < len_; pos++) {
      if (s_[pos] == c) {
        return pos;
      }
    }
    return npos;
  }
  size_t find(Slice other) const {
    if (other.len_ > len_) {
      return npos;
    }
    for (size_t pos = 0; pos + other.len_ <= len_; pos++) {
      if (std::memcmp(s_ + pos, other.s_, other.len_) == 0) {
        return pos;
      }
    }
    return npos;
  }

  const char *data() const {
    return s_;
  }
  const char *begin() const {
    return s_;
  }
  const unsigned char *ubegin() const {
    return reinterpret_cast<const unsigned char *>(s_);
  }
  const char *end() const {
    return s_ + len_;
  }
  const unsigned char *uend() const {
    return reinterpret_cast<const unsigned char *>(s_) + len_;
  }

  string str() const {
    return string(begin(), size());
  }

  char back() const {
    CHECK(1 <= len_);
    return s_[len_ - 1];
  }
  char operator[](size_t i) const {
    return s_[i];
  }

  static const size_t npos = static_cast<size_t>(-1);
};

bool operator==(const Slice &a, const Slice &b);
bool operator!=(const Slice &a, const Slice &b);

class MutableCSlice : public MutableSlice {
 public:
  MutableCSlice() = delete;
  MutableCSlice(char *s, char *t) : MutableSlice(s, t) {
    CHECK(*t == '\0');
  }

  const char *c_str() const {
    return begin();
  }
};

class CSlice : public Slice {
 public:
  explicit CSlice(const MutableSlice &other) : Slice(other) {
  }
  CSlice(const MutableCSlice &other) : Slice(other.begin(), other.size()) {
  }
  CSlice(const string &str) : Slice(str) {
  }
  template <class T>
  CSlice(T s, std::enable_if_t<std::is_same<const char *, std::remove_const_t<T>>::value, int> = 0) : Slice(s) {
  }
  template <class T>
  CSlice(T s, std::enable_if_t<std::is_same<char *, std::remove_const_t<T>>::value, int> = 0) : Slice(s) {
  }
  CSlice(const char *s, const char *t) : Slice(s, t) {
    CHECK(*t == '\0');
  }

  template <size_t N>
  constexpr CSlice(char (&)[N]) = delete;

  template <size_t N>
  constexpr CSlice(const char (&a)[N]) : Slice(a) {
  }

  CSlice() : CSlice("") {
  }

  const char *c_str() const {
    return begin();
  }
};

inline void MutableSlice::copy_from(Slice from) {
  CHECK(size() >= from.size());
  std::memcpy(ubegin(), from.ubegin(), from.size());
}

inline void MutableSlice::fill_zero_secure() {
  volatile char *ptr = s_;
  for (size_t i = 0; i < len_; i++) {
    ptr[i] = 0;
  }
}

inline bool operator==(const Slice &a, const Slice &b) {
  return a.size() == b.size() && std::memcmp(a.data(), b.data(), a.size()) == 0;
}

inline bool operator!=(const Slice &a, const Slice &b) {
  return !(a == b);
}

inline bool operator<(const Slice &a, const Slice &b) {
  auto x = std::memcmp(a.data(), b.data(), mtk::min(a.size(), b.size()));
  if (x == 0) {
    return a.size() < b.size();
  }
  return x < 0;
}

inline Slice as_slice(Slice slice) {
  return slice;
}

inline Slice as_slice(const string &str) {
  return str;
}

inline MutableSlice as_mutable_slice(string &str) {
  return str;
}

}  // namespace mtk
