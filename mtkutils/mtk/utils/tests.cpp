//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/tests.h"

#include <chrono>

namespace mtk {

TestsRunner &TestsRunner::get_default() {
  static TestsRunner default_runner;
  return default_runner;
}

void TestsRunner::add_test(string name, std::function<unique_ptr<Test>()> test) {
  for (auto &info : tests_) {
    if (info.name == name) {
      LOG(FATAL) << "Test name collision " << name;
    }
  }
  tests_.push_back(Info{std::move(name), std::move(test)});
}

void TestsRunner::add_substr_filter(string str) {
  if (str[0] != '+' && str[0] != '-') {
    str = "+" + str;
  }
  substr_filters_.push_back(std::move(str));
}

void TestsRunner::set_offset(string offset) {
  offset_ = std::move(offset);
}

void TestsRunner::set_stress_flag(bool flag) {
  stress_flag_ = flag;
}

bool TestsRunner::is_selected(Slice name) const {
  if (substr_filters_.empty()) {
    return true;
  }
  bool has_positive = false;
  bool is_matched = false;
  for (auto &filter : substr_filters_) {
    Slice pattern = Slice(filter).substr(1);
    bool contains = name.find(pattern) != Slice::npos;
    if (filter[0] == '-') {
      if (contains) {
        return false;
      }
    } else {
      has_positive = true;
      is_matched |= contains;
    }
  }
  return !has_positive || is_matched;
}

size_t TestsRunner::run_all() {
  size_t executed = 0;
  do {
    bool is_offset_reached = offset_.empty();
    for (auto &info : tests_) {
      if (!is_offset_reached) {
        if (Slice(info.name).find(offset_) == Slice::npos) {
          continue;
        }
        is_offset_reached = true;
      }
      if (!is_selected(info.name)) {
        continue;
      }

      LOG(ERROR) << "Run " << tag("test", info.name);
      auto start = std::chrono::steady_clock::now();
      auto test = info.creator();
      test->run();
      auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
      LOG(INFO) << tag("test", info.name) << " passed in " << StringBuilder::FixedDouble(elapsed, 3) << "s";
      executed++;
    }
  } while (stress_flag_);
  LOG(ERROR) << "Ran " << executed << " tests";
  return executed;
}

}  // namespace mtk
