//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/StringBuilder.h"

#define PSLICE() ::mtk::detail::Slicify() & ::mtk::SliceBuilder().ref()
#define PSTRING() ::mtk::detail::Stringify() & ::mtk::SliceBuilder().ref()

namespace mtk {

class SliceBuilder {
 public:
  template <class T>
  SliceBuilder &operator<<(T &&other) {
    sb_ << other;
    return *this;
  }

  MutableCSlice as_cslice() {
    return sb_.as_cslice();
  }

  SliceBuilder &ref() {
    return *this;
  }

 private:
  static constexpr size_t DEFAULT_BUFFER_SIZE = 1024;
  char buffer_[DEFAULT_BUFFER_SIZE];
  StringBuilder sb_{MutableSlice(buffer_, DEFAULT_BUFFER_SIZE), true};
};

namespace detail {
class Slicify {
 public:
  CSlice operator&(SliceBuilder &slice_builder) {
    return slice_builder.as_cslice();
  }
};

class Stringify {
 public:
  string operator&(SliceBuilder &slice_builder) {
    return slice_builder.as_cslice().str();
  }
};
}  // namespace detail

}  // namespace mtk
