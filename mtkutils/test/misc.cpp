//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/as.h"
#include "mtk/utils/BigNum.h"
#include "mtk/utils/common.h"
#include "mtk/utils/format.h"
#include "mtk/utils/misc.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/ScopeGuard.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/SliceBuilder.h"
#include "mtk/utils/Status.h"
#include "mtk/utils/StringBuilder.h"
#include "mtk/utils/tests.h"

static void test_full_split(mtk::Slice str, const mtk::vector<mtk::string> &expected) {
  ASSERT_EQ(expected, mtk::full_split(str, ' '));
}

TEST(Misc, full_split) {
  test_full_split("", {""});
  test_full_split(" ", {"", ""});
  test_full_split("abcdef", {"abcdef"});
  test_full_split("abc def", {"abc", "def"});
  test_full_split(" abcdef", {"", "abcdef"});
  test_full_split("abcdef ", {"abcdef", ""});
  test_full_split("  ab  cd  ", {"", "", "ab", "", "cd", "", ""});
}

TEST(Misc, to_integer_safe) {
  ASSERT_EQ(mtk::to_integer_safe<mtk::int32>("-1234567").ok(), -1234567);
  ASSERT_EQ(mtk::to_integer_safe<mtk::int64>("-12345678910111213").ok(), -12345678910111213);
  ASSERT_EQ(mtk::to_integer_safe<mtk::uint64>("12345678910111213").ok(), 12345678910111213ull);
  ASSERT_TRUE(mtk::to_integer_safe<mtk::uint32>("-1234567").is_error());
  ASSERT_TRUE(mtk::to_integer_safe<mtk::int16>("-1254567").is_error());
  ASSERT_TRUE(mtk::to_integer_safe<mtk::uint64>("-12345678910111213").is_error());
  ASSERT_TRUE(mtk::to_integer_safe<mtk::int32>("").is_error());
  ASSERT_TRUE(mtk::to_integer_safe<mtk::int32>("12a").is_error());
}

TEST(Misc, narrow_cast) {
  mtk::size_t size = 256;
  ASSERT_EQ(256, narrow_cast<int>(size));
  mtk::int32 length = 70000;
  ASSERT_EQ(70000u, narrow_cast<mtk::uint32>(length));
  ASSERT_EQ(-5, narrow_cast<mtk::int64>(-5));
}

TEST(Misc, StringBuilder) {
  auto small_str = mtk::string{"abcdefghij"};
  auto big_str = mtk::string(1000, 'a');
  using V = mtk::vector<mtk::string>;
  for (auto use_buf : {false, true}) {
    for (std::size_t initial_buffer_size : {0, 1, 5, 10, 100, 1000, 2000}) {
      for (const auto &test :
           {V{small_str}, V{small_str, big_str, big_str, small_str}, V{big_str, small_str, big_str}}) {
        mtk::string buf(initial_buffer_size, '\0');
        mtk::StringBuilder sb(buf, use_buf);
        mtk::string res;
        for (const auto &x : test) {
          res += x;
          sb << x;
        }
        if (use_buf) {
          ASSERT_STREQ(res, sb.as_cslice());
        } else {
          auto sb_result = sb.as_cslice();
          res.resize(sb_result.size());
          ASSERT_STREQ(res, sb_result);
        }
      }
    }
  }
}

TEST(Misc, format) {
  ASSERT_STREQ("0x1cb5c415", PSLICE() << mtk::format::as_hex(static_cast<mtk::int32>(0x1cb5c415)));
  ASSERT_STREQ("15c4b51c", PSLICE() << mtk::format::as_hex_dump<0>(mtk::Slice("\x15\xc4\xb5\x1c")));
  ASSERT_STREQ("\n15c4b51c 00000000\n",
               PSLICE() << mtk::format::as_hex_dump<4>(mtk::Slice("\x15\xc4\xb5\x1c\x00\x00\x00\x00", 8)));
  ASSERT_STREQ("a\\x0ab\\x22", PSLICE() << mtk::format::escaped("a\nb\""));
  ASSERT_STREQ("{1, 2, 3}", PSLICE() << mtk::format::as_array(mtk::vector<int>{1, 2, 3}));
  ASSERT_STREQ("[size:5]", PSLICE() << mtk::tag("size", 5));
}

TEST(Misc, hex_encode) {
  ASSERT_STREQ("", mtk::hex_encode(""));
  ASSERT_STREQ("00ff10", mtk::hex_encode(mtk::Slice("\x00\xff\x10", 3)));
}

TEST(Misc, Slice_find) {
  mtk::Slice s("chatParticipants");
  ASSERT_EQ(0u, s.find(mtk::Slice("chat")));
  ASSERT_EQ(4u, s.find(mtk::Slice("Participants")));
  ASSERT_TRUE(s.find(mtk::Slice("channel")) == mtk::Slice::npos);
  ASSERT_EQ(0u, s.find(mtk::Slice()));
  ASSERT_EQ(4u, s.find('P'));
}

TEST(Misc, As) {
  char buf[100];
  mtk::as<int>(buf) = 123;
  ASSERT_EQ(123, mtk::as<int>(static_cast<const char *>(buf)));
  ASSERT_EQ(123, mtk::as<int>(static_cast<char *>(buf)));
  char buf2[100];
  mtk::as<int>(buf2) = mtk::as<int>(buf);
  ASSERT_EQ(123, mtk::as<int>(static_cast<const char *>(buf2)));
  mtk::as<mtk::int64>(buf + 3) = -7596991558377038078;
  ASSERT_EQ(-7596991558377038078, mtk::as<mtk::int64>(static_cast<const char *>(buf + 3)));
}

TEST(Misc, ScopeExit) {
  int calls = 0;
  {
    SCOPE_EXIT {
      calls++;
    };
    ASSERT_EQ(0, calls);
  }
  ASSERT_EQ(1, calls);
}

TEST(Misc, optional) {
  mtk::optional<mtk::int32> empty;
  ASSERT_TRUE(!empty);
  mtk::optional<mtk::string> title(mtk::string("invite"));
  ASSERT_TRUE(static_cast<bool>(title));
  auto copy = title;
  ASSERT_STREQ("invite", copy.value());
  ASSERT_EQ(6u, copy->size());
}

static mtk::Status check_positive(int value) {
  if (value <= 0) {
    return mtk::Status::Error(PSLICE() << "Value " << value << " isn't positive");
  }
  return mtk::Status::OK();
}

static mtk::Result<int> double_positive(int value) {
  TRY_STATUS(check_positive(value));
  return value * 2;
}

static mtk::Result<int> quadruple_positive(int value) {
  TRY_RESULT(doubled, double_positive(value));
  return doubled * 2;
}

TEST(Misc, Status) {
  ASSERT_EQ(8, quadruple_positive(2).ok());
  auto r_value = quadruple_positive(-1);
  ASSERT_TRUE(r_value.is_error());
  ASSERT_STREQ("Value -1 isn't positive", r_value.error().message());

  auto status = mtk::Status::Error(400, "Bad request");
  ASSERT_EQ(400, status.code());
  auto clone = status.clone();
  ASSERT_STREQ(status.message(), clone.message());
  ASSERT_TRUE(mtk::Status::OK().is_ok());
}

TEST(BigNum, from_binary) {
  ASSERT_STREQ(mtk::BigNum::from_binary("").to_decimal(), "0");
  ASSERT_STREQ(mtk::BigNum::from_binary("a").to_decimal(), "97");
  ASSERT_STREQ(mtk::BigNum::from_binary(mtk::Slice("\x00\xff", 2)).to_decimal(), "255");
  ASSERT_STREQ(mtk::BigNum::from_binary(mtk::Slice("\x00\x01\x00\x00", 4)).to_decimal(), "65536");
  ASSERT_STREQ(mtk::BigNum::from_binary("\xff").to_binary(), "\xff");
  ASSERT_STREQ(mtk::BigNum::from_binary("\xff").to_binary(2), mtk::Slice("\x00\xff", 2));
  ASSERT_STREQ(mtk::BigNum::from_binary(mtk::Slice("\x00\x01\x00\x00", 4)).to_binary(), mtk::Slice("\x01\x00\x00", 3));
  ASSERT_EQ(17, mtk::BigNum::from_binary(mtk::Slice("\x01\x00\x00", 3)).get_num_bits());
  ASSERT_EQ(3, mtk::BigNum::from_binary(mtk::Slice("\x01\x00\x00", 3)).get_num_bytes());
  ASSERT_TRUE(mtk::BigNum::from_binary("").is_zero());
}

TEST(BigNum, from_hex) {
  ASSERT_STREQ(mtk::BigNum::from_hex("010001").move_as_ok().to_decimal(), "65537");
  ASSERT_TRUE(mtk::BigNum::from_hex("xyz").is_error());
}

TEST(BigNum, mod_exp) {
  mtk::BigNumContext context;
  mtk::BigNum r;
  auto a = mtk::BigNum::from_binary("\x04");
  auto p = mtk::BigNum::from_binary("\x0d");
  auto m = mtk::BigNum::from_binary(mtk::Slice("\x01\xf1", 2));
  mtk::BigNum::mod_exp(r, a, p, m, context);
  ASSERT_STREQ("445", r.to_decimal());
  ASSERT_TRUE(mtk::BigNum::compare(r, m) < 0);
  ASSERT_EQ(0, mtk::BigNum::compare(r.clone(), r));
}
