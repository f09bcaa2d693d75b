//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"

#include <new>
#include <type_traits>
#include <utility>

namespace mtk {

namespace detail {

template <size_t... Args>
class MaxSize;

template <size_t Arg>
class MaxSize<Arg> {
 public:
  static constexpr size_t value = Arg;
};

template <size_t Arg, size_t... Args>
class MaxSize<Arg, Args...> {
 public:
  static constexpr size_t value = Arg > MaxSize<Args...>::value ? Arg : MaxSize<Args...>::value;
};

template <class T, class... Types>
class IndexOf;

template <class T>
class IndexOf<T> {
 public:
  static constexpr int value = -1;
};

template <class T, class... Types>
class IndexOf<T, T, Types...> {
 public:
  static constexpr int value = 0;
};

template <class T, class U, class... Types>
class IndexOf<T, U, Types...> {
  static constexpr int next = IndexOf<T, Types...>::value;

 public:
  static constexpr int value = next < 0 ? -1 : next + 1;
};

template <int Offset, class... Types>
class ForEachType;

template <int Offset>
class ForEachType<Offset> {
 public:
  template <class F>
  static void visit(F &&) {
  }
};

template <int Offset, class T, class... Types>
class ForEachType<Offset, T, Types...> {
 public:
  template <class F>
  static void visit(F &&f) {
    f(Offset, static_cast<T *>(nullptr));
    ForEachType<Offset + 1, Types...>::visit(f);
  }
};

}  // namespace detail

// Tagged union of the listed types; the active alternative is identified by its position in the list
template <class... Types>
class Variant {
 public:
  static constexpr int npos = -1;

  Variant() = default;

  Variant(Variant &&other) noexcept {
    other.visit([&](auto &&value) { this->init_empty(std::forward<decltype(value)>(value)); });
  }
  Variant(const Variant &other) {
    other.visit([&](auto &&value) { this->init_empty(std::forward<decltype(value)>(value)); });
  }
  Variant &operator=(Variant &&other) noexcept {
    clear();
    other.visit([&](auto &&value) { this->init_empty(std::forward<decltype(value)>(value)); });
    return *this;
  }
  Variant &operator=(const Variant &other) {
    if (this == &other) {
      return *this;
    }
    clear();
    other.visit([&](auto &&value) { this->init_empty(std::forward<decltype(value)>(value)); });
    return *this;
  }

  template <class T, std::enable_if_t<!std::is_same<std::decay_t<T>, Variant>::value, int> = 0>
  Variant(T &&t) {
    init_empty(std::forward<T>(t));
  }
  template <class T, std::enable_if_t<!std::is_same<std::decay_t<T>, Variant>::value, int> = 0>
  Variant &operator=(T &&t) {
    clear();
    init_empty(std::forward<T>(t));
    return *this;
  }

  ~Variant() {
    clear();
  }

  template <class T>
  static constexpr int offset() {
    return detail::IndexOf<std::decay_t<T>, Types...>::value;
  }

  template <class T>
  void init_empty(T &&t) {
    using ValueT = std::decay_t<T>;
    static_assert(offset<ValueT>() != npos, "Type is not a variant alternative");
    CHECK(offset_ == npos);
    new (&get_unsafe<ValueT>()) ValueT(std::forward<T>(t));
    offset_ = offset<ValueT>();
  }

  template <class F>
  void visit(F &&f) {
    for_each([&](int offset, auto *ptr) {
      using T = std::decay_t<decltype(*ptr)>;
      if (offset == offset_) {
        f(std::move(this->template get_unsafe<T>()));
      }
    });
  }
  template <class F>
  void visit(F &&f) const {
    for_each([&](int offset, auto *ptr) {
      using T = std::decay_t<decltype(*ptr)>;
      if (offset == offset_) {
        f(this->template get_unsafe<T>());
      }
    });
  }

  template <class F>
  static void for_each(F &&f) {
    detail::ForEachType<0, Types...>::visit(f);
  }

  template <class T>
  bool is() const {
    return offset<T>() == offset_;
  }

  template <class T>
  T &get() {
    CHECK(is<T>());
    return get_unsafe<T>();
  }
  template <class T>
  const T &get() const {
    CHECK(is<T>());
    return get_unsafe<T>();
  }

  int32 get_offset() const {
    return offset_;
  }

  bool empty() const {
    return offset_ == npos;
  }

  void clear() {
    visit([](auto &&value) {
      using T = std::decay_t<decltype(value)>;
      value.~T();
    });
    offset_ = npos;
  }

 private:
  union {
    int64 align_;
    std::aligned_storage_t<detail::MaxSize<sizeof(Types)...>::value, detail::MaxSize<alignof(Types)...>::value>
        data_;
  };
  int offset_{npos};

  template <class T>
  T &get_unsafe() {
    return *reinterpret_cast<T *>(&data_);
  }
  template <class T>
  const T &get_unsafe() const {
    return *reinterpret_cast<const T *>(&data_);
  }
};

template <class T, class... Types>
auto &get(Variant<Types...> &v) {
  return v.template get<T>();
}
template <class T, class... Types>
auto &get(const Variant<Types...> &v) {
  return v.template get<T>();
}

}  // namespace mtk
