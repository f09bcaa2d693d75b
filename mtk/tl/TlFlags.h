//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"

namespace mtk {

// Flags word of a TL constructor; optional fields must be fetched in their declared order
class TlFlags {
 public:
  TlFlags() = default;
  explicit TlFlags(int32 flags) : flags_(flags) {
  }

  bool has(int bit) const {
    CHECK(0 <= bit && bit < 32);
    return (static_cast<uint32>(flags_) >> bit) & 1;
  }

  // consumes nothing if the bit is clear
  template <class Func, class ParserT>
  auto fetch_if(int bit, ParserT &parser) const -> optional<decltype(Func::parse(parser))> {
    if (!has(bit)) {
      return {};
    }
    auto value = Func::parse(parser);
    if (parser.has_error()) {
      return {};
    }
    return optional<decltype(Func::parse(parser))>(std::move(value));
  }

  int32 get() const {
    return flags_;
  }

 private:
  int32 flags_ = 0;
};

}  // namespace mtk
