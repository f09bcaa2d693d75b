//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/telegram/BotInfo.h"
#include "mtk/telegram/ChatParticipants.h"
#include "mtk/telegram/ChatReactions.h"
#include "mtk/telegram/ExportedChatInvite.h"
#include "mtk/telegram/Peer.h"
#include "mtk/telegram/PeerNotifySettings.h"
#include "mtk/telegram/Photo.h"

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/tl_storers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class inputGroupCall {
 public:
  int64 id_ = 0;
  int64 access_hash_ = 0;

  static constexpr int32 ID = -659913713;

  inputGroupCall() = default;

  inputGroupCall(int64 id, int64 access_hash);

  explicit inputGroupCall(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class chatFull {
 public:
  int32 flags_ = 0;
  bool can_set_username_ = false;
  bool has_scheduled_ = false;
  bool translations_disabled_ = false;
  int64 id_ = 0;
  string about_;
  ChatParticipants participants_;
  optional<Photo> chat_photo_;
  peerNotifySettings notify_settings_;
  optional<ExportedChatInvite> exported_invite_;
  optional<vector<botInfo>> bot_info_;
  optional<int32> pinned_msg_id_;
  optional<int32> folder_id_;
  optional<inputGroupCall> call_;
  optional<int32> ttl_period_;
  optional<Peer> groupcall_default_join_as_;
  optional<string> theme_emoticon_;
  optional<int32> requests_pending_;
  optional<vector<int64>> recent_requesters_;
  optional<ChatReactions> available_reactions_;
  optional<int32> reactions_limit_;

  static constexpr int32 ID = 640893467;
  static constexpr int32 MAX_BOT_INFO = 1000;
  static constexpr int32 MAX_RECENT_REQUESTERS = 100;

  chatFull() = default;

  explicit chatFull(TlParser &parser);
};

// only the leading fields of channelFull#e4e0b29d are decoded
class channelFull {
 public:
  int32 flags_ = 0;
  bool can_set_username_ = false;
  bool has_scheduled_ = false;
  int64 id_ = 0;
  string about_;
  optional<Photo> chat_photo_;
  peerNotifySettings notify_settings_;

  static constexpr int32 ID = -455036259;

  channelFull() = default;

  explicit channelFull(TlParser &parser);
};

class ChatFull final : public TlUnion<ChatFull, chatFull, channelFull> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("ChatFull");
  }

  int64 get_chat_id() const;

  bool is_channel() const {
    return is<channelFull>();
  }

  const peerNotifySettings &get_notify_settings() const;
};

}  // namespace telegram_api
}  // namespace mtk
