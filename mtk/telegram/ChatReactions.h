//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/tl_storers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class reactionEmpty {
 public:
  static constexpr int32 ID = 2046153753;

  reactionEmpty() = default;

  explicit reactionEmpty(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class reactionEmoji {
 public:
  string emoticon_;

  static constexpr int32 ID = 455247544;

  reactionEmoji() = default;

  explicit reactionEmoji(string emoticon);

  explicit reactionEmoji(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class reactionCustomEmoji {
 public:
  int64 document_id_ = 0;

  static constexpr int32 ID = -1992950669;

  reactionCustomEmoji() = default;

  explicit reactionCustomEmoji(int64 document_id);

  explicit reactionCustomEmoji(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class reactionPaid {
 public:
  static constexpr int32 ID = 1379771627;

  reactionPaid() = default;

  explicit reactionPaid(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class Reaction final : public TlUnion<Reaction, reactionEmpty, reactionEmoji, reactionCustomEmoji, reactionPaid> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("Reaction");
  }
};

class chatReactionsNone {
 public:
  static constexpr int32 ID = -352570692;

  chatReactionsNone() = default;

  explicit chatReactionsNone(TlParser &parser);
};

class chatReactionsAll {
 public:
  int32 flags_ = 0;
  bool allow_custom_ = false;

  static constexpr int32 ID = 1385335754;

  chatReactionsAll() = default;

  explicit chatReactionsAll(TlParser &parser);
};

class chatReactionsSome {
 public:
  vector<Reaction> reactions_;

  static constexpr int32 ID = 1713193015;
  static constexpr int32 MAX_REACTIONS = 1000;

  chatReactionsSome() = default;

  explicit chatReactionsSome(TlParser &parser);
};

class ChatReactions final : public TlUnion<ChatReactions, chatReactionsNone, chatReactionsAll, chatReactionsSome> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("ChatReactions");
  }

  bool is_allowed(const Reaction &reaction) const;
};

}  // namespace telegram_api
}  // namespace mtk
