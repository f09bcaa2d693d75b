//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/StringBuilder.h"

namespace mtk {
namespace format {

inline char hex_digit(int x) {
  return "0123456789abcdef"[x & 15];
}

// fixed-size little-endian value printed most significant byte first
template <size_t size>
struct HexDumpSize {
  const unsigned char *data;
};

template <size_t size>
StringBuilder &operator<<(StringBuilder &sb, const HexDumpSize<size> &dump) {
  for (size_t i = 0; i < size; i++) {
    int byte = dump.data[size - 1 - i];
    sb << hex_digit(byte >> 4) << hex_digit(byte);
  }
  return sb;
}

// byte string in wire order, grouped by align bytes, 16 groups per line
template <size_t align>
struct HexDumpSlice {
  Slice slice;
};

inline StringBuilder &operator<<(StringBuilder &sb, const HexDumpSlice<0> &dump) {
  for (auto c : dump.slice) {
    auto byte = static_cast<unsigned char>(c);
    sb << hex_digit(byte >> 4) << hex_digit(byte);
  }
  return sb;
}

template <size_t align>
StringBuilder &operator<<(StringBuilder &sb, const HexDumpSlice<align> &dump) {
  auto slice = dump.slice;
  auto size = slice.size();
  sb << '\n';
  if (size == 0) {
    return sb;
  }

  size_t group = 0;
  for (size_t i = 0; i < size; i += align, group++) {
    sb << HexDumpSlice<0>{slice.substr(i, align)};
    if ((group & 15) == 15 || i + align >= size) {
      sb << '\n';
    } else {
      sb << ' ';
    }
  }
  return sb;
}

template <size_t align>
HexDumpSlice<align> as_hex_dump(Slice slice) {
  return HexDumpSlice<align>{slice};
}

template <class T>
HexDumpSize<sizeof(T)> as_hex_dump(const T &value) {
  return HexDumpSize<sizeof(T)>{reinterpret_cast<const unsigned char *>(&value)};
}

template <class T>
struct Hex {
  const T &value;
};

template <class T>
Hex<T> as_hex(const T &value) {
  return Hex<T>{value};
}

template <class T>
StringBuilder &operator<<(StringBuilder &sb, const Hex<T> &hex) {
  return sb << "0x" << as_hex_dump(hex.value);
}

struct Escaped {
  Slice str;
};

inline StringBuilder &operator<<(StringBuilder &sb, const Escaped &escaped) {
  for (auto c : escaped.str) {
    auto byte = static_cast<unsigned char>(c);
    if (byte > 31 && byte < 127 && byte != '"' && byte != '\\') {
      sb << c;
    } else {
      sb << "\\x" << hex_digit(byte >> 4) << hex_digit(byte);
    }
  }
  return sb;
}

inline Escaped escaped(Slice slice) {
  return Escaped{slice};
}

template <class ArrayT>
struct Array {
  const ArrayT &ref;
};

template <class ArrayT>
StringBuilder &operator<<(StringBuilder &sb, const Array<ArrayT> &array) {
  bool first = true;
  sb << '{';
  for (auto &x : array.ref) {
    if (!first) {
      sb << Slice(", ");
    }
    sb << x;
    first = false;
  }
  return sb << '}';
}

template <class ArrayT>
Array<ArrayT> as_array(const ArrayT &array) {
  return Array<ArrayT>{array};
}

template <class ValueT>
struct Tagged {
  Slice tag;
  const ValueT &ref;
};

template <class ValueT>
StringBuilder &operator<<(StringBuilder &sb, const Tagged<ValueT> &tagged) {
  return sb << '[' << tagged.tag << ':' << tagged.ref << ']';
}

template <class ValueT>
Tagged<ValueT> tag(Slice tag, const ValueT &ref) {
  return Tagged<ValueT>{tag, ref};
}

}  // namespace format

using format::tag;

}  // namespace mtk
