//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/Status.h"

#include "mtk/utils/SliceBuilder.h"

namespace mtk {

Status Status::move_as_error_prefix(Slice prefix) const {
  CHECK(is_error());
  return move_as_error_prefix_unsafe(prefix);
}

Status Status::move_as_error_prefix_unsafe(Slice prefix) const {
  return Error(code(), PSLICE() << prefix << message());
}

Status Status::move_as_error_suffix(Slice suffix) const {
  CHECK(is_error());
  return Error(code(), PSLICE() << message() << suffix);
}

}  // namespace mtk
