//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class chatParticipant {
 public:
  int64 user_id_ = 0;
  int64 inviter_id_ = 0;
  int32 date_ = 0;

  static constexpr int32 ID = -1070776313;

  chatParticipant() = default;

  explicit chatParticipant(TlParser &parser);
};

class chatParticipantCreator {
 public:
  int64 user_id_ = 0;

  static constexpr int32 ID = -462696732;

  chatParticipantCreator() = default;

  explicit chatParticipantCreator(TlParser &parser);
};

class chatParticipantAdmin {
 public:
  int64 user_id_ = 0;
  int64 inviter_id_ = 0;
  int32 date_ = 0;

  static constexpr int32 ID = -1600962725;

  chatParticipantAdmin() = default;

  explicit chatParticipantAdmin(TlParser &parser);
};

class ChatParticipant final
    : public TlUnion<ChatParticipant, chatParticipant, chatParticipantCreator, chatParticipantAdmin> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("ChatParticipant");
  }

  int64 get_user_id() const;

  bool is_administrator() const;
};

class chatParticipantsForbidden {
 public:
  int32 flags_ = 0;
  int64 chat_id_ = 0;
  optional<ChatParticipant> self_participant_;

  static constexpr int32 ID = -2023500831;

  chatParticipantsForbidden() = default;

  explicit chatParticipantsForbidden(TlParser &parser);
};

class chatParticipants {
 public:
  int64 chat_id_ = 0;
  vector<ChatParticipant> participants_;
  int32 version_ = 0;

  static constexpr int32 ID = 1018991608;
  static constexpr int32 MAX_PARTICIPANTS = 10000;

  chatParticipants() = default;

  explicit chatParticipants(TlParser &parser);
};

class ChatParticipants final
    : public TlUnion<ChatParticipants, chatParticipantsForbidden, chatParticipants> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("ChatParticipants");
  }

  int64 get_chat_id() const;

  // number of known members; 0 if the list is not accessible
  size_t get_participant_count() const;
};

}  // namespace telegram_api
}  // namespace mtk
