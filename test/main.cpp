//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/common.h"
#include "mtk/utils/crypto.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/OptionParser.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"
#include "mtk/utils/tests.h"

int main(int argc, char **argv) {
  SET_VERBOSITY_LEVEL(VERBOSITY_NAME(FATAL));
  mtk::init_crypto();

  mtk::TestsRunner &runner = mtk::TestsRunner::get_default();

  int default_verbosity_level = 1;
  mtk::OptionParser options;
  options.add_option('f', "filter", "run only specified tests",
                     [&](mtk::Slice filter) { runner.add_substr_filter(filter.str()); });
  options.add_option('o', "offset", "run tests from the specified test",
                     [&](mtk::Slice offset) { runner.set_offset(offset.str()); });
  options.add_option('s', "stress", "run tests infinitely", [&] { runner.set_stress_flag(true); });
  options.add_checked_option('v', "verbosity", "log verbosity level",
                             mtk::OptionParser::parse_integer(default_verbosity_level));
  options.add_check([&] {
    if (default_verbosity_level < 0) {
      return mtk::Status::Error("Wrong verbosity level specified");
    }
    return mtk::Status::OK();
  });
  auto r_non_options = options.run(argc, argv, 0);
  if (r_non_options.is_error()) {
    LOG(PLAIN) << argv[0] << ": " << r_non_options.error().message();
    LOG(PLAIN) << options;
    return 1;
  }
  SET_VERBOSITY_LEVEL(default_verbosity_level);

  runner.run_all();
}
