//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/SliceBuilder.h"
#include "mtk/utils/Status.h"

#include <limits>
#include <type_traits>

namespace mtk {

inline bool begins_with(Slice str, Slice prefix) {
  return prefix.size() <= str.size() && prefix == Slice(str.data(), prefix.size());
}

inline bool ends_with(Slice str, Slice suffix) {
  return suffix.size() <= str.size() && suffix == Slice(str.data() + str.size() - suffix.size(), suffix.size());
}

inline vector<string> full_split(Slice s, char delimiter = ' ') {
  vector<string> result;
  while (true) {
    auto delimiter_pos = s.find(delimiter);
    if (delimiter_pos == Slice::npos) {
      result.push_back(s.str());
      return result;
    }
    result.push_back(s.substr(0, delimiter_pos).str());
    s = s.substr(delimiter_pos + 1);
  }
}

string hex_encode(Slice data);

namespace detail {
template <class T, class R>
struct is_same_signedness : public std::integral_constant<bool, std::is_signed<T>::value == std::is_signed<R>::value> {
};

class NarrowCast {
  const char *file_;
  int line_;

 public:
  NarrowCast(const char *file, int line) : file_(file), line_(line) {
  }

  template <class R, class A>
  R cast(const A &a) {
    using RT = std::decay_t<R>;
    using AT = std::decay_t<A>;

    auto r = static_cast<RT>(a);
    LOG_CHECK(static_cast<AT>(r) == a) << static_cast<AT>(r) << ' ' << a << ' ' << file_ << ' ' << line_;
    LOG_CHECK((is_same_signedness<RT, AT>::value) || ((r < RT{}) == (a < AT{})))
        << static_cast<AT>(r) << ' ' << a << ' ' << file_ << ' ' << line_;
    return r;
  }
};
}  // namespace detail

#define narrow_cast ::mtk::detail::NarrowCast(__FILE__, __LINE__).cast

template <class T>
Result<T> to_integer_safe(Slice str) {
  static_assert(std::is_integral<T>::value, "expected an integral type");
  using UnsignedT = std::make_unsigned_t<T>;
  if (str.empty()) {
    return Status::Error("Empty string can't be converted to integer");
  }
  size_t pos = 0;
  bool is_negative = false;
  if (str[0] == '-') {
    if (!std::is_signed<T>::value) {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as an unsigned number");
    }
    is_negative = true;
    pos++;
  }
  if (pos == str.size()) {
    return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as a number");
  }
  UnsignedT limit = is_negative ? static_cast<UnsignedT>(static_cast<UnsignedT>(std::numeric_limits<T>::max()) + 1)
                                : static_cast<UnsignedT>(std::numeric_limits<T>::max());
  UnsignedT value = 0;
  for (; pos < str.size(); pos++) {
    auto c = str[pos];
    if (c < '0' || c > '9') {
      return Status::Error(PSLICE() << "Can't parse \"" << str << "\" as a number");
    }
    auto digit = static_cast<UnsignedT>(c - '0');
    if (value > (limit - digit) / 10) {
      return Status::Error(PSLICE() << "Number \"" << str << "\" is out of range");
    }
    value = static_cast<UnsignedT>(value * 10 + digit);
  }
  if (is_negative) {
    return static_cast<T>(static_cast<UnsignedT>(0u - value));
  }
  return static_cast<T>(value);
}

}  // namespace mtk
