//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/ScopeGuard.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/StringBuilder.h"

#include <new>
#include <type_traits>
#include <utility>

#define TRY_STATUS(status)                      \
  {                                             \
    auto try_status = (status);                 \
    if (try_status.is_error()) {                \
      return try_status.move_as_error_unsafe(); \
    }                                           \
  }

#define TRY_STATUS_PREFIX(status, prefix)                    \
  {                                                          \
    auto try_status = (status);                              \
    if (try_status.is_error()) {                             \
      return try_status.move_as_error_prefix_unsafe(prefix); \
    }                                                        \
  }

#define TRY_RESULT(name, result) TRY_RESULT_IMPL(MTK_CONCAT(MTK_CONCAT(r_, name), __LINE__), auto name, result)

#define TRY_RESULT_ASSIGN(name, result) TRY_RESULT_IMPL(MTK_CONCAT(r_response, __LINE__), name, result)

#define TRY_RESULT_PREFIX(name, result, prefix) \
  TRY_RESULT_PREFIX_IMPL(MTK_CONCAT(MTK_CONCAT(r_, name), __LINE__), auto name, result, prefix)

#define TRY_RESULT_IMPL(r_name, name, result) \
  auto r_name = (result);                     \
  if (r_name.is_error()) {                    \
    return r_name.move_as_error_unsafe();     \
  }                                           \
  name = r_name.move_as_ok_unsafe();

#define TRY_RESULT_PREFIX_IMPL(r_name, name, result, prefix) \
  auto r_name = (result);                                    \
  if (r_name.is_error()) {                                   \
    return r_name.move_as_error_prefix_unsafe(prefix);       \
  }                                                          \
  name = r_name.move_as_ok_unsafe();

#define LOG_STATUS(status)                             \
  {                                                    \
    auto log_status = (status);                        \
    if (log_status.is_error()) {                       \
      LOG(ERROR) << log_status.move_as_error_unsafe(); \
    }                                                  \
  }

#define ensure() ensure_impl(__FILE__, __LINE__)
#define ensure_error() ensure_error_impl(__FILE__, __LINE__)

namespace mtk {

class Status {
 public:
  Status() = default;
  Status(const Status &) = delete;
  Status &operator=(const Status &) = delete;
  Status(Status &&) noexcept = default;
  Status &operator=(Status &&) noexcept = default;
  ~Status() = default;

  Status clone() const MTK_WARN_UNUSED_RESULT {
    if (is_ok()) {
      return Status();
    }
    return Status(ptr_->code, ptr_->message);
  }

  static Status OK() MTK_WARN_UNUSED_RESULT {
    return Status();
  }

  static Status Error(int err, Slice message = Slice()) MTK_WARN_UNUSED_RESULT {
    return Status(err, message);
  }

  static Status Error(Slice message) MTK_WARN_UNUSED_RESULT {
    return Error(0, message);
  }

  template <int Code>
  static Status Error() {
    return Error(Code);
  }

  StringBuilder &print(StringBuilder &sb) const {
    if (is_ok()) {
      return sb << "OK";
    }
    return sb << "[Error : " << code() << " : " << message() << "]";
  }

  string to_string() const {
    StringBuilder sb;
    print(sb);
    return sb.as_cslice().str();
  }

  bool is_ok() const MTK_WARN_UNUSED_RESULT {
    return !is_error();
  }

  bool is_error() const MTK_WARN_UNUSED_RESULT {
    return ptr_ != nullptr;
  }

  void ensure_impl(CSlice file_name, int line) const {
    if (!is_ok()) {
      LOG(FATAL) << "Unexpected Status " << to_string() << " in file " << file_name << " at line " << line;
    }
  }
  void ensure_error_impl(CSlice file_name, int line) const {
    if (is_ok()) {
      LOG(FATAL) << "Unexpected Status::OK in file " << file_name << " at line " << line;
    }
  }

  void ignore() const {
    // nop
  }

  int32 code() const {
    if (is_ok()) {
      return 0;
    }
    return ptr_->code;
  }

  CSlice message() const {
    if (is_ok()) {
      return CSlice("OK");
    }
    return CSlice(ptr_->message);
  }

  string public_message() const {
    return message().str();
  }

  const Status &error() const {
    return *this;
  }

  Status move() MTK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_error() MTK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_error_unsafe() MTK_WARN_UNUSED_RESULT {
    return std::move(*this);
  }

  Status move_as_ok() = delete;

  Status move_as_ok_unsafe() = delete;

  Status move_as_error_prefix(Slice prefix) const MTK_WARN_UNUSED_RESULT;

  Status move_as_error_prefix_unsafe(Slice prefix) const MTK_WARN_UNUSED_RESULT;

  Status move_as_error_suffix(Slice suffix) const MTK_WARN_UNUSED_RESULT;

 private:
  struct Info {
    int32 code;
    string message;
  };
  unique_ptr<Info> ptr_;

  Status(int32 code, Slice message) : ptr_(make_unique<Info>(Info{code, message.str()})) {
  }
};

template <class T = Unit>
class Result {
 public:
  using ValueT = T;
  Result() : status_(Status::Error<-1>()) {
  }
  template <class S, std::enable_if_t<!std::is_same<std::decay_t<S>, Result>::value, int> = 0>
  Result(S &&x) : status_(), value_(std::forward<S>(x)) {
  }
  Result(Status &&status) : status_(std::move(status)) {
    CHECK(status_.is_error());
  }
  Result(const Result &) = delete;
  Result &operator=(const Result &) = delete;
  Result(Result &&other) noexcept : status_(std::move(other.status_)) {
    if (status_.is_ok()) {
      new (&value_) T(std::move(other.value_));
      other.value_.~T();
    }
    other.status_ = Status::Error<-2>();
  }
  Result &operator=(Result &&other) noexcept {
    CHECK(this != &other);
    if (status_.is_ok()) {
      value_.~T();
    }
    if (other.status_.is_ok()) {
      new (&value_) T(std::move(other.value_));
      other.value_.~T();
    }
    status_ = std::move(other.status_);
    other.status_ = Status::Error<-3>();
    return *this;
  }
  template <class... ArgsT>
  void emplace(ArgsT &&...args) {
    if (status_.is_ok()) {
      value_.~T();
    }
    new (&value_) T(std::forward<ArgsT>(args)...);
    status_ = Status::OK();
  }
  ~Result() {
    if (status_.is_ok()) {
      value_.~T();
    }
  }

  void ensure_impl(CSlice file_name, int line) const {
    status_.ensure_impl(file_name, line);
  }
  void ensure_error_impl(CSlice file_name, int line) const {
    status_.ensure_error_impl(file_name, line);
  }
  void ignore() const {
    status_.ignore();
  }
  bool is_ok() const {
    return status_.is_ok();
  }
  bool is_error() const {
    return status_.is_error();
  }
  const Status &error() const {
    CHECK(status_.is_error());
    return status_;
  }
  Status move_as_error() MTK_WARN_UNUSED_RESULT {
    CHECK(status_.is_error());
    SCOPE_EXIT {
      status_ = Status::Error<-4>();
    };
    return std::move(status_);
  }
  Status move_as_error_unsafe() MTK_WARN_UNUSED_RESULT {
    SCOPE_EXIT {
      status_ = Status::Error<-5>();
    };
    return std::move(status_);
  }
  Status move_as_error_prefix(Slice prefix) MTK_WARN_UNUSED_RESULT {
    SCOPE_EXIT {
      status_ = Status::Error<-6>();
    };
    return status_.move_as_error_prefix(prefix);
  }
  Status move_as_error_prefix_unsafe(Slice prefix) MTK_WARN_UNUSED_RESULT {
    SCOPE_EXIT {
      status_ = Status::Error<-7>();
    };
    return status_.move_as_error_prefix_unsafe(prefix);
  }

  const T &ok() const {
    LOG_CHECK(status_.is_ok()) << status_;
    return value_;
  }
  T &ok_ref() {
    LOG_CHECK(status_.is_ok()) << status_;
    return value_;
  }
  const T &ok_ref() const {
    LOG_CHECK(status_.is_ok()) << status_;
    return value_;
  }
  T move_as_ok() {
    LOG_CHECK(status_.is_ok()) << status_;
    return std::move(value_);
  }
  T move_as_ok_unsafe() {
    return std::move(value_);
  }

  Result<T> clone() const MTK_WARN_UNUSED_RESULT {
    if (is_ok()) {
      return Result<T>(ok());
    }
    return error().clone();
  }

 private:
  Status status_;
  union {
    T value_;
  };
};

template <>
inline Result<Unit>::Result(Status &&status) : status_(std::move(status)) {
  // no check
}

inline StringBuilder &operator<<(StringBuilder &string_builder, const Status &status) {
  return status.print(string_builder);
}

}  // namespace mtk
