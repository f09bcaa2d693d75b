//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"

namespace mtk {

string base64_encode(Slice input);

// accepts only canonical padded input
Result<string> base64_decode(Slice base64);

}  // namespace mtk
