//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/config.h"

// clang-format off
#if defined(__clang__)
  #define MTK_CLANG 1
#elif defined(__GNUC__)
  #define MTK_GCC 1
#elif defined(_MSC_VER)
  #define MTK_MSVC 1
#endif

#if MTK_CLANG || MTK_GCC
  #define MTK_WARN_UNUSED_RESULT __attribute__((warn_unused_result))
  #define MTK_UNUSED __attribute__((unused))
#else
  #define MTK_WARN_UNUSED_RESULT
  #define MTK_UNUSED
#endif
// clang-format on

#include "mtk/utils/check.h"
#include "mtk/utils/int_types.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#define MTK_DEFINE_STR_IMPL(x) #x
#define MTK_DEFINE_STR(x) MTK_DEFINE_STR_IMPL(x)
#define MTK_CONCAT_IMPL(x, y) x##y
#define MTK_CONCAT(x, y) MTK_CONCAT_IMPL(x, y)

namespace mtk {

inline bool likely(bool x) {
#if MTK_CLANG || MTK_GCC
  return __builtin_expect(x, 1);
#else
  return x;
#endif
}

inline bool unlikely(bool x) {
#if MTK_CLANG || MTK_GCC
  return __builtin_expect(x, 0);
#else
  return x;
#endif
}

// parameters are taken by value, so constexpr class members can be passed without definitions
template <class T>
T max(T a, T b) {
  return a < b ? b : a;
}

template <class T>
T min(T a, T b) {
  return a < b ? a : b;
}

using string = std::string;

template <class ValueT>
using vector = std::vector<ValueT>;

template <class ValueT>
using unique_ptr = std::unique_ptr<ValueT>;

using std::make_unique;

struct Unit {};

}  // namespace mtk
