//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_parsers.h"

#include "mtk/utils/common.h"
#include "mtk/utils/format.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"

namespace mtk {

// decodes a whole message as a boxed T; trailing bytes are an error
template <class T>
Result<T> fetch_result(Slice message) {
  TlParser parser(message);
  auto result = TlFetchObject<T>::parse(parser);
  parser.fetch_end();

  if (parser.has_error()) {
    auto status = parser.get_status();
    LOG(WARNING) << "Can't parse " << T::type_name() << " of size " << message.size() << ": "
                 << get_error_kind(status) << ' ' << status.message();
    VLOG(tl_message) << "Rejected message:" << format::as_hex_dump<4>(message);
    return std::move(status);
  }

  return std::move(result);
}

}  // namespace mtk
