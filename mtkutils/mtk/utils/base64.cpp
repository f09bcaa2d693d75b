//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/base64.h"

#include <algorithm>
#include <iterator>

namespace mtk {

static const char *const base64_characters = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static const unsigned char *get_character_table() {
  static unsigned char char_to_value[256];
  static bool is_inited = [] {
    std::fill(std::begin(char_to_value), std::end(char_to_value), static_cast<unsigned char>(64));
    for (unsigned char i = 0; i < 64; i++) {
      char_to_value[static_cast<unsigned char>(base64_characters[i])] = i;
    }
    return true;
  }();
  CHECK(is_inited);
  return char_to_value;
}

string base64_encode(Slice input) {
  string base64;
  base64.reserve((input.size() + 2) / 3 * 4);
  auto data = input.ubegin();
  for (size_t i = 0; i < input.size(); i += 3) {
    size_t left = min(input.size() - i, static_cast<size_t>(3));
    uint32 c = static_cast<uint32>(data[i]) << 16;
    if (left > 1) {
      c |= static_cast<uint32>(data[i + 1]) << 8;
    }
    if (left > 2) {
      c |= data[i + 2];
    }
    base64 += base64_characters[c >> 18];
    base64 += base64_characters[(c >> 12) & 63];
    base64 += left > 1 ? base64_characters[(c >> 6) & 63] : '=';
    base64 += left > 2 ? base64_characters[c & 63] : '=';
  }
  return base64;
}

Result<string> base64_decode(Slice base64) {
  if ((base64.size() & 3) != 0) {
    return Status::Error("Wrong string length");
  }
  size_t padding_length = 0;
  while (!base64.empty() && base64.back() == '=' && padding_length < 3) {
    base64.remove_suffix(1);
    padding_length++;
  }
  if (padding_length >= 3) {
    return Status::Error("Wrong string padding");
  }

  auto table = get_character_table();
  string result;
  result.reserve(base64.size() / 4 * 3 + 2);
  for (size_t i = 0; i < base64.size(); i += 4) {
    size_t left = min(base64.size() - i, static_cast<size_t>(4));
    uint32 c = 0;
    for (size_t t = 0; t < left; t++) {
      auto value = table[base64.ubegin()[i + t]];
      if (value == 64) {
        return Status::Error("Wrong character in the string");
      }
      c |= static_cast<uint32>(value) << ((3 - t) * 6);
    }
    result += static_cast<char>((c >> 16) & 255);
    if (left == 2) {
      if ((c & 0xffff) != 0) {
        return Status::Error("Wrong padding in the string");
      }
      continue;
    }
    result += static_cast<char>((c >> 8) & 255);
    if (left == 3) {
      if ((c & 0xff) != 0) {
        return Status::Error("Wrong padding in the string");
      }
      continue;
    }
    result += static_cast<char>(c & 255);
  }
  return std::move(result);
}

}  // namespace mtk
