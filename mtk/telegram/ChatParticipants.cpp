//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/ChatParticipants.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

constexpr int32 chatParticipant::ID;

chatParticipant::chatParticipant(TlParser &parser)
    : user_id_(TlFetchLong::parse(parser)), inviter_id_(TlFetchLong::parse(parser)), date_(TlFetchInt::parse(parser)) {
}

constexpr int32 chatParticipantCreator::ID;

chatParticipantCreator::chatParticipantCreator(TlParser &parser) : user_id_(TlFetchLong::parse(parser)) {
}

constexpr int32 chatParticipantAdmin::ID;

chatParticipantAdmin::chatParticipantAdmin(TlParser &parser)
    : user_id_(TlFetchLong::parse(parser)), inviter_id_(TlFetchLong::parse(parser)), date_(TlFetchInt::parse(parser)) {
}

int64 ChatParticipant::get_user_id() const {
  int64 user_id = 0;
  visit([&user_id](const auto &participant) { user_id = participant.user_id_; });
  return user_id;
}

bool ChatParticipant::is_administrator() const {
  return is<chatParticipantCreator>() || is<chatParticipantAdmin>();
}

constexpr int32 chatParticipantsForbidden::ID;

chatParticipantsForbidden::chatParticipantsForbidden(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  chat_id_ = TlFetchLong::parse(parser);
  self_participant_ = flags.fetch_if<TlFetchObject<ChatParticipant>>(0, parser);
}

constexpr int32 chatParticipants::ID;

chatParticipants::chatParticipants(TlParser &parser)
    : chat_id_(TlFetchLong::parse(parser))
    , participants_(TlFetchBoundedVector<TlFetchObject<ChatParticipant>, MAX_PARTICIPANTS>::parse(parser))
    , version_(TlFetchInt::parse(parser)) {
}

int64 ChatParticipants::get_chat_id() const {
  int64 chat_id = 0;
  visit([&chat_id](const auto &participants) { chat_id = participants.chat_id_; });
  return chat_id;
}

size_t ChatParticipants::get_participant_count() const {
  if (!is<chatParticipants>()) {
    return 0;
  }
  return get<chatParticipants>().participants_.size();
}

}  // namespace telegram_api
}  // namespace mtk
