//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_storers.h"

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"

#include <cstring>

namespace mtk {

// Assembles TL messages field by field for decoder tests
class TlMessageBuilder {
 public:
  TlMessageBuilder &add_int(int32 x) {
    return add_binary(x);
  }

  TlMessageBuilder &add_long(int64 x) {
    return add_binary(x);
  }

  TlMessageBuilder &add_double(double x) {
    return add_binary(x);
  }

  TlMessageBuilder &add_bool(bool x) {
    return add_int(x ? static_cast<int32>(0x997275b5) : static_cast<int32>(0xbc799737));
  }

  TlMessageBuilder &add_string(Slice str) {
    result_ += tl_serialize(StoredString{str});
    return *this;
  }

  TlMessageBuilder &add_vector_header(int32 count) {
    return add_int(TL_VECTOR_ID).add_int(count);
  }

  TlMessageBuilder &add_raw(Slice data) {
    result_.append(data.begin(), data.size());
    return *this;
  }

  const string &get() const {
    return result_;
  }

  size_t size() const {
    return result_.size();
  }

 private:
  string result_;

  struct StoredString {
    Slice str;

    template <class StorerT>
    void store(StorerT &storer) const {
      storer.store_string(str);
    }
  };

  template <class T>
  TlMessageBuilder &add_binary(const T &x) {
    char buf[sizeof(T)];
    std::memcpy(buf, &x, sizeof(T));
    result_.append(buf, sizeof(T));
    return *this;
  }
};

}  // namespace mtk
