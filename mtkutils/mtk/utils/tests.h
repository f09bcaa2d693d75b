//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/format.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"

#include <functional>
#include <utility>

#define TEST_NAME(test_case_name, test_name) \
  MTK_CONCAT(Test, MTK_CONCAT(_, MTK_CONCAT(test_case_name, MTK_CONCAT(_, test_name))))

#define TEST(test_case_name, test_name) TEST_IMPL(Test_##test_case_name##_##test_name)

#define TEST_IMPL(test_name)                                                                      \
  class test_name final : public ::mtk::Test {                                                    \
   public:                                                                                        \
    void run() final;                                                                             \
  };                                                                                              \
  ::mtk::RegisterTest<test_name> MTK_CONCAT(test_instance_, MTK_CONCAT(test_name, __LINE__))(     \
      MTK_DEFINE_STR(test_name));                                                                 \
  void test_name::run()

#define ASSERT_EQ(expected, got) ::mtk::assert_eq_impl((expected), (got), __FILE__, __LINE__)

#define ASSERT_NE(expected, got) ::mtk::assert_ne_impl((expected), (got), __FILE__, __LINE__)

#define ASSERT_TRUE(got) ::mtk::assert_true_impl((got), __FILE__, __LINE__)

#define ASSERT_STREQ(expected, got) \
  ::mtk::assert_eq_impl(::mtk::Slice((expected)), ::mtk::Slice((got)), __FILE__, __LINE__)

namespace mtk {

class Test {
 public:
  Test() = default;
  Test(const Test &) = delete;
  Test &operator=(const Test &) = delete;
  Test(Test &&) = delete;
  Test &operator=(Test &&) = delete;
  virtual ~Test() = default;

  virtual void run() = 0;
};

class TestsRunner {
 public:
  static TestsRunner &get_default();

  void add_test(string name, std::function<unique_ptr<Test>()> test);

  void add_substr_filter(string str);

  // tests before the first one whose name contains offset are skipped
  void set_offset(string offset);

  void set_stress_flag(bool flag);

  // returns number of executed tests
  size_t run_all();

 private:
  struct Info {
    string name;
    std::function<unique_ptr<Test>()> creator;
  };

  vector<Info> tests_;
  vector<string> substr_filters_;
  string offset_;
  bool stress_flag_{false};

  bool is_selected(Slice name) const;
};

template <class T>
class RegisterTest {
 public:
  explicit RegisterTest(string name, TestsRunner &runner = TestsRunner::get_default()) {
    runner.add_test(std::move(name), [] { return make_unique<T>(); });
  }
};

template <class T1, class T2>
void assert_eq_impl(const T1 &expected, const T2 &got, const char *file, int line) {
  LOG_CHECK(expected == got) << tag("expected", expected) << tag("got", got) << " in " << file << " at line "
                             << line;
}

template <class T1, class T2>
void assert_ne_impl(const T1 &expected, const T2 &got, const char *file, int line) {
  LOG_CHECK(!(expected == got)) << tag("not expected", expected) << tag("got", got) << " in " << file
                                << " at line " << line;
}

template <class T>
void assert_true_impl(const T &got, const char *file, int line) {
  LOG_CHECK(got) << "Expected true in " << file << " at line " << line;
}

}  // namespace mtk
