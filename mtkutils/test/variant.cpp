//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/StringBuilder.h"
#include "mtk/utils/tests.h"
#include "mtk/utils/Variant.h"

namespace {

mtk::StringBuilder &get_lifetime_log() {
  static mtk::StringBuilder sb;
  return sb;
}

mtk::string move_lifetime_log() {
  auto res = get_lifetime_log().as_cslice().str();
  get_lifetime_log().clear();
  return res;
}

template <char name>
class Tracked {
 public:
  Tracked() {
    get_lifetime_log() << '+' << name;
  }
  Tracked(const Tracked &) {
    get_lifetime_log() << '=' << name;
  }
  Tracked &operator=(const Tracked &) = delete;
  Tracked(Tracked &&) noexcept {
    get_lifetime_log() << '>' << name;
  }
  Tracked &operator=(Tracked &&) = delete;
  ~Tracked() {
    get_lifetime_log() << '-' << name;
  }
};

using A = Tracked<'A'>;
using B = Tracked<'B'>;

}  // namespace

TEST(Variant, lifetime) {
  {
    mtk::Variant<mtk::unique_ptr<A>, mtk::unique_ptr<B>> ab;
    ASSERT_TRUE(ab.empty());
    ASSERT_STREQ("", move_lifetime_log());
    ab = mtk::make_unique<A>();
    ASSERT_STREQ("+A", move_lifetime_log());
    ab = mtk::make_unique<B>();
    ASSERT_STREQ("+B-A", move_lifetime_log());
    ASSERT_EQ(1, ab.get_offset());
  }
  ASSERT_STREQ("-B", move_lifetime_log());
}

TEST(Variant, copy_and_move) {
  {
    mtk::Variant<A, B> a{A()};
    ASSERT_STREQ("+A>A-A", move_lifetime_log());
    auto copy = a;
    ASSERT_STREQ("=A", move_lifetime_log());
    auto moved = std::move(a);
    ASSERT_STREQ(">A", move_lifetime_log());
    ASSERT_TRUE(copy.is<A>());
    ASSERT_TRUE(moved.is<A>());
    moved.clear();
    ASSERT_STREQ("-A", move_lifetime_log());
    ASSERT_TRUE(moved.empty());
  }
  ASSERT_STREQ("-A-A", move_lifetime_log());
}

TEST(Variant, visit) {
  mtk::Variant<mtk::int32, mtk::string, double> v;
  ASSERT_EQ(-1, v.get_offset());
  ASSERT_EQ(0, (mtk::Variant<mtk::int32, mtk::string, double>::offset<mtk::int32>()));
  ASSERT_EQ(2, (mtk::Variant<mtk::int32, mtk::string, double>::offset<double>()));
  ASSERT_EQ(-1, (mtk::Variant<mtk::int32, mtk::string, double>::offset<char>()));

  v = mtk::string("peer");
  ASSERT_TRUE(v.is<mtk::string>());
  ASSERT_STREQ("peer", mtk::get<mtk::string>(v));

  mtk::string visited;
  v.visit([&visited](const auto &value) {
    mtk::StringBuilder sb;
    sb << value;
    visited = sb.as_cslice().str();
  });
  ASSERT_STREQ("peer", visited);

  v = 12345;
  ASSERT_EQ(12345, v.get<mtk::int32>());
  ASSERT_EQ(0, v.get_offset());
}
