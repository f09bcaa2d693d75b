//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/ChatReactions.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_object_store.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

constexpr int32 reactionEmpty::ID;

reactionEmpty::reactionEmpty(TlParser &/*parser*/) {
}

void reactionEmpty::store(TlStorerUnsafe &/*s*/) const {
}

void reactionEmpty::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 reactionEmoji::ID;

reactionEmoji::reactionEmoji(string emoticon) : emoticon_(std::move(emoticon)) {
}

reactionEmoji::reactionEmoji(TlParser &parser) : emoticon_(TlFetchString<string>::parse(parser)) {
}

void reactionEmoji::store(TlStorerUnsafe &s) const {
  TlStoreString::store(emoticon_, s);
}

void reactionEmoji::store(TlStorerCalcLength &s) const {
  TlStoreString::store(emoticon_, s);
}

constexpr int32 reactionCustomEmoji::ID;

reactionCustomEmoji::reactionCustomEmoji(int64 document_id) : document_id_(document_id) {
}

reactionCustomEmoji::reactionCustomEmoji(TlParser &parser) : document_id_(TlFetchLong::parse(parser)) {
}

void reactionCustomEmoji::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(document_id_, s);
}

void reactionCustomEmoji::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(document_id_, s);
}

constexpr int32 reactionPaid::ID;

reactionPaid::reactionPaid(TlParser &/*parser*/) {
}

void reactionPaid::store(TlStorerUnsafe &/*s*/) const {
}

void reactionPaid::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 chatReactionsNone::ID;

chatReactionsNone::chatReactionsNone(TlParser &/*parser*/) {
}

constexpr int32 chatReactionsAll::ID;

chatReactionsAll::chatReactionsAll(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  allow_custom_ = flags.has(0);
}

constexpr int32 chatReactionsSome::ID;

chatReactionsSome::chatReactionsSome(TlParser &parser)
    : reactions_(TlFetchBoundedVector<TlFetchObject<Reaction>, MAX_REACTIONS>::parse(parser)) {
}

bool ChatReactions::is_allowed(const Reaction &reaction) const {
  if (reaction.empty() || reaction.is<reactionEmpty>()) {
    return false;
  }
  switch (get_id()) {
    case chatReactionsNone::ID:
      return false;
    case chatReactionsAll::ID:
      return !reaction.is<reactionCustomEmoji>() || get<chatReactionsAll>().allow_custom_;
    case chatReactionsSome::ID:
      for (auto &allowed_reaction : get<chatReactionsSome>().reactions_) {
        if (allowed_reaction.get_id() != reaction.get_id()) {
          continue;
        }
        if (reaction.is<reactionEmoji>() &&
            allowed_reaction.get<reactionEmoji>().emoticon_ != reaction.get<reactionEmoji>().emoticon_) {
          continue;
        }
        if (reaction.is<reactionCustomEmoji>() && allowed_reaction.get<reactionCustomEmoji>().document_id_ !=
                                                      reaction.get<reactionCustomEmoji>().document_id_) {
          continue;
        }
        return true;
      }
      return false;
    default:
      return false;
  }
}

}  // namespace telegram_api
}  // namespace mtk
