//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"

namespace mtk {

class TlStoreBinary {
 public:
  template <class T, class StorerT>
  static void store(const T &x, StorerT &s) {
    s.store_binary(x);
  }
};

class TlStoreBool {
 public:
  template <class StorerT>
  static void store(const bool &x, StorerT &s) {
    constexpr int32 ID_BOOL_FALSE = static_cast<int32>(0xbc799737);
    constexpr int32 ID_BOOL_TRUE = static_cast<int32>(0x997275b5);

    s.store_binary(x ? ID_BOOL_TRUE : ID_BOOL_FALSE);
  }
};

class TlStoreString {
 public:
  template <class T, class StorerT>
  static void store(const T &x, StorerT &s) {
    s.store_string(x);
  }
};

}  // namespace mtk
