//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_parsers.h"

#include "mtk/utils/common.h"
#include "mtk/utils/format.h"
#include "mtk/utils/SliceBuilder.h"

namespace mtk {

constexpr int32 TL_VECTOR_ID = 0x1cb5c415;

template <class Func, int32 constructor_id>
class TlFetchBoxed {
 public:
  template <class ParserT>
  static auto parse(ParserT &parser) -> decltype(Func::parse(parser)) {
    auto parsed_constructor_id = parser.fetch_int();
    if (parser.has_error()) {
      return decltype(Func::parse(parser))();
    }
    if (parsed_constructor_id != constructor_id) {
      parser.set_error(ErrorKind::UnknownConstructor, PSLICE() << "Wrong constructor "
                                                               << format::as_hex(parsed_constructor_id)
                                                               << " found instead of " << format::as_hex(constructor_id));
      return decltype(Func::parse(parser))();
    }
    return Func::parse(parser);
  }
};

class TlFetchBool {
 public:
  template <class ParserT>
  static bool parse(ParserT &parser) {
    constexpr int32 ID_BOOL_FALSE = static_cast<int32>(0xbc799737);
    constexpr int32 ID_BOOL_TRUE = static_cast<int32>(0x997275b5);

    int32 c = parser.fetch_int();
    if (c == ID_BOOL_TRUE) {
      return true;
    }
    if (c != ID_BOOL_FALSE) {
      parser.set_error(ErrorKind::UnknownConstructor,
                       PSLICE() << "Bool expected, but " << format::as_hex(c) << " found; expected {"
                                << format::as_hex(ID_BOOL_FALSE) << ", " << format::as_hex(ID_BOOL_TRUE) << '}');
    }
    return false;
  }
};

class TlFetchInt {
 public:
  template <class ParserT>
  static int32 parse(ParserT &parser) {
    return parser.fetch_int();
  }
};

class TlFetchLong {
 public:
  template <class ParserT>
  static int64 parse(ParserT &parser) {
    return parser.fetch_long();
  }
};

class TlFetchDouble {
 public:
  template <class ParserT>
  static double parse(ParserT &parser) {
    return parser.fetch_double();
  }
};

template <class T>
class TlFetchString {
 public:
  template <class ParserT>
  static T parse(ParserT &parser) {
    return parser.template fetch_string<T>();
  }
};

template <class T>
class TlFetchBytes {
 public:
  template <class ParserT>
  static T parse(ParserT &parser) {
    return parser.template fetch_string<T>();
  }
};

// Vector<T> with its 0x1cb5c415 prefix; the element count is checked against max_size before anything is allocated
template <class Func, int32 max_size>
class TlFetchBoundedVector {
 public:
  template <class ParserT>
  static auto parse(ParserT &parser) -> vector<decltype(Func::parse(parser))> {
    static_assert(max_size >= 0, "Wrong vector size limit");
    vector<decltype(Func::parse(parser))> v;
    auto prefix = parser.fetch_int();
    if (parser.has_error()) {
      return v;
    }
    if (prefix != TL_VECTOR_ID) {
      parser.set_error(ErrorKind::Deserialize, PSLICE() << "Wrong vector prefix " << format::as_hex(prefix));
      return v;
    }
    auto count = parser.fetch_int();
    if (parser.has_error()) {
      return v;
    }
    if (count < 0) {
      parser.set_error(ErrorKind::Deserialize, PSLICE() << "Wrong vector length " << count);
      return v;
    }
    if (count > max_size) {
      parser.set_error(ErrorKind::Deserialize,
                       PSLICE() << "Too many elements in vector: " << count << " instead of at most " << max_size);
      return v;
    }
    if (parser.get_left_len() < static_cast<size_t>(count)) {
      parser.check_len(static_cast<size_t>(count));
      return v;
    }

    v.reserve(static_cast<size_t>(count));
    for (int32 i = 0; i < count; i++) {
      v.push_back(Func::parse(parser));
      if (parser.has_error()) {
        v.clear();
        break;
      }
    }
    return v;
  }
};

// bare constructors parse themselves in their TlParser constructor, unions read the tag first
template <class T>
class TlFetchObject {
 public:
  template <class ParserT>
  static T parse(ParserT &parser) {
    return T(parser);
  }
};

}  // namespace mtk
