//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/check.h"

#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/SliceBuilder.h"

namespace mtk {
namespace detail {

void process_check_error(const char *message, const char *file, int line) {
  ::mtk::Logger(*log_interface, log_options, VERBOSITY_NAME(ERROR), Slice(file), line, Slice())
      << "Check `" << message << "` failed";
  ::mtk::process_fatal_error(PSLICE() << "Check `" << message << "` failed in " << file << " at " << line << '\n');
}

}  // namespace detail
}  // namespace mtk
