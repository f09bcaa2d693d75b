//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/telegram/BotInfo.h"
#include "mtk/telegram/PeerNotifySettings.h"
#include "mtk/telegram/Photo.h"

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class peerSettings {
 public:
  int32 flags_ = 0;
  bool report_spam_ = false;
  bool add_contact_ = false;
  bool block_contact_ = false;
  bool share_contact_ = false;
  bool need_contacts_exception_ = false;
  bool report_geo_ = false;
  bool autoarchived_ = false;
  bool invite_members_ = false;
  bool request_chat_broadcast_ = false;
  bool business_bot_paused_ = false;
  bool business_bot_can_reply_ = false;
  optional<int32> geo_distance_;
  optional<string> request_chat_title_;
  optional<int32> request_chat_date_;
  optional<int64> business_bot_id_;
  optional<string> business_bot_manage_url_;
  optional<int64> charge_paid_message_stars_;
  optional<string> registration_month_;
  optional<string> phone_country_;
  optional<int32> name_change_date_;
  optional<int32> photo_change_date_;

  static constexpr int32 ID = -193510921;

  peerSettings() = default;

  explicit peerSettings(TlParser &parser);
};

class chatAdminRights {
 public:
  int32 flags_ = 0;

  enum : int32 {
    CHANGE_INFO_MASK = 1 << 0,
    POST_MESSAGES_MASK = 1 << 1,
    EDIT_MESSAGES_MASK = 1 << 2,
    DELETE_MESSAGES_MASK = 1 << 3,
    BAN_USERS_MASK = 1 << 4,
    INVITE_USERS_MASK = 1 << 5,
    PIN_MESSAGES_MASK = 1 << 7,
    ADD_ADMINS_MASK = 1 << 9,
    ANONYMOUS_MASK = 1 << 10,
    MANAGE_CALL_MASK = 1 << 11,
    OTHER_MASK = 1 << 12,
    MANAGE_TOPICS_MASK = 1 << 13,
    POST_STORIES_MASK = 1 << 14,
    EDIT_STORIES_MASK = 1 << 15,
    DELETE_STORIES_MASK = 1 << 16
  };

  static constexpr int32 ID = 1605510357;

  chatAdminRights() = default;

  explicit chatAdminRights(TlParser &parser);

  bool has(int32 mask) const {
    return (flags_ & mask) != 0;
  }
};

class birthday {
 public:
  int32 flags_ = 0;
  int32 day_ = 0;
  int32 month_ = 0;
  optional<int32> year_;

  static constexpr int32 ID = 1821253126;

  birthday() = default;

  explicit birthday(TlParser &parser);
};

// userFull#a02bc13e with two flags words read one after another; fields of types that aren't decoded here
// (theme, wallpaper, stories, business information, star ratings, gift settings, saved music, note and others)
// make the whole message rejected
class userFull {
 public:
  int32 flags_ = 0;
  bool blocked_ = false;
  bool phone_calls_available_ = false;
  bool phone_calls_private_ = false;
  bool can_pin_message_ = false;
  bool has_scheduled_ = false;
  bool video_calls_available_ = false;
  bool voice_messages_forbidden_ = false;
  bool translations_disabled_ = false;
  bool stories_pinned_available_ = false;
  bool blocked_my_stories_from_ = false;
  bool wallpaper_overridden_ = false;
  bool contact_require_premium_ = false;
  bool read_dates_private_ = false;
  int32 flags2_ = 0;
  bool sponsored_enabled_ = false;
  bool can_view_revenue_ = false;
  bool bot_can_manage_emoji_status_ = false;
  bool display_gifts_button_ = false;
  int64 id_ = 0;
  optional<string> about_;
  peerSettings settings_;
  optional<Photo> personal_photo_;
  optional<Photo> profile_photo_;
  optional<Photo> fallback_photo_;
  peerNotifySettings notify_settings_;
  optional<botInfo> bot_info_;
  optional<int32> pinned_msg_id_;
  int32 common_chats_count_ = 0;
  optional<int32> folder_id_;
  optional<int32> ttl_period_;
  optional<string> private_forward_name_;
  optional<chatAdminRights> bot_group_admin_rights_;
  optional<chatAdminRights> bot_broadcast_admin_rights_;
  optional<birthday> birthday_;
  optional<int64> personal_channel_id_;
  optional<int32> personal_channel_message_;
  optional<int32> stargifts_count_;
  optional<int64> send_paid_messages_stars_;

  static constexpr int32 ID = -1607745218;

  userFull() = default;

  explicit userFull(TlParser &parser);
};

class UserFull final : public TlUnion<UserFull, userFull> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("UserFull");
  }

  int64 get_user_id() const {
    return get<userFull>().id_;
  }

  bool is_bot() const {
    return static_cast<bool>(get<userFull>().bot_info_);
  }
};

}  // namespace telegram_api
}  // namespace mtk
