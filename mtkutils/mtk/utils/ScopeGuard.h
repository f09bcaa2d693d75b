//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"

#include <type_traits>
#include <utility>

namespace mtk {

template <class FunctionT>
class LambdaGuard {
 public:
  explicit LambdaGuard(const FunctionT &func) : func_(func) {
  }
  explicit LambdaGuard(FunctionT &&func) : func_(std::move(func)) {
  }
  LambdaGuard(const LambdaGuard &) = delete;
  LambdaGuard &operator=(const LambdaGuard &) = delete;
  LambdaGuard(LambdaGuard &&other) : func_(std::move(other.func_)), dismissed_(other.dismissed_) {
    other.dismissed_ = true;
  }
  LambdaGuard &operator=(LambdaGuard &&) = delete;

  void dismiss() {
    dismissed_ = true;
  }

  ~LambdaGuard() {
    if (!dismissed_) {
      func_();
    }
  }

 private:
  FunctionT func_;
  bool dismissed_ = false;
};

enum class ScopeExit {};
template <class FunctionT>
auto operator+(ScopeExit, FunctionT &&func) {
  return LambdaGuard<std::decay_t<FunctionT>>(std::forward<FunctionT>(func));
}

}  // namespace mtk

#define SCOPE_EXIT auto MTK_CONCAT(SCOPE_EXIT_VAR_, __LINE__) = ::mtk::ScopeExit() + [&]
