//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/misc.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"
#include "mtk/utils/StringBuilder.h"

#include <functional>

namespace mtk {

class OptionParser {
  class Option {
   public:
    enum class Type { NoArg, Arg };
    Type type;
    char short_key;
    string long_key;
    string description;
    std::function<Status(Slice)> arg_callback;
  };

  void add_option(Option::Type type, char short_key, Slice long_key, Slice description,
                  std::function<Status(Slice)> callback);

 public:
  template <class T>
  static std::function<Status(Slice)> parse_integer(T &value) {
    return [&value](Slice value_str) {
      TRY_RESULT_ASSIGN(value, to_integer_safe<T>(value_str));
      return Status::OK();
    };
  }

  void set_description(string description);

  void add_checked_option(char short_key, Slice long_key, Slice description, std::function<Status(Slice)> callback);

  void add_checked_option(char short_key, Slice long_key, Slice description, std::function<Status(void)> callback);

  void add_option(char short_key, Slice long_key, Slice description, std::function<void(Slice)> callback);

  void add_option(char short_key, Slice long_key, Slice description, std::function<void(void)> callback);

  void add_check(std::function<Status()> check);

  // returns found non-option parameters
  Result<vector<char *>> run(int argc, char *argv[], int expected_non_option_count = -1) MTK_WARN_UNUSED_RESULT;

  // doesn't run the checks
  Result<vector<char *>> run_impl(int argc, char *argv[], int expected_non_option_count) MTK_WARN_UNUSED_RESULT;

  friend StringBuilder &operator<<(StringBuilder &sb, const OptionParser &o);

 private:
  vector<Option> options_;
  vector<std::function<Status()>> checks_;
  string description_;
};

}  // namespace mtk
