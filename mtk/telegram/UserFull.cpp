//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/UserFull.h"

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/TlFlags.h"

#include "mtk/utils/SliceBuilder.h"

namespace mtk {
namespace telegram_api {

namespace {

void reject_unsupported_field(const TlFlags &flags, int bit, Slice field_name, TlParser &parser) {
  if (flags.has(bit) && !parser.has_error()) {
    parser.set_error(ErrorKind::Deserialize, PSLICE() << "Unsupported field " << field_name << " of userFull");
  }
}

}  // namespace

constexpr int32 peerSettings::ID;

peerSettings::peerSettings(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  report_spam_ = flags.has(0);
  add_contact_ = flags.has(1);
  block_contact_ = flags.has(2);
  share_contact_ = flags.has(3);
  need_contacts_exception_ = flags.has(4);
  report_geo_ = flags.has(5);
  autoarchived_ = flags.has(7);
  invite_members_ = flags.has(8);
  request_chat_broadcast_ = flags.has(10);
  business_bot_paused_ = flags.has(11);
  business_bot_can_reply_ = flags.has(12);
  geo_distance_ = flags.fetch_if<TlFetchInt>(6, parser);
  request_chat_title_ = flags.fetch_if<TlFetchString<string>>(9, parser);
  request_chat_date_ = flags.fetch_if<TlFetchInt>(9, parser);
  business_bot_id_ = flags.fetch_if<TlFetchLong>(13, parser);
  business_bot_manage_url_ = flags.fetch_if<TlFetchString<string>>(13, parser);
  charge_paid_message_stars_ = flags.fetch_if<TlFetchLong>(14, parser);
  registration_month_ = flags.fetch_if<TlFetchString<string>>(15, parser);
  phone_country_ = flags.fetch_if<TlFetchString<string>>(16, parser);
  name_change_date_ = flags.fetch_if<TlFetchInt>(17, parser);
  photo_change_date_ = flags.fetch_if<TlFetchInt>(18, parser);
}

constexpr int32 chatAdminRights::ID;

chatAdminRights::chatAdminRights(TlParser &parser) : flags_(TlFetchInt::parse(parser)) {
}

constexpr int32 birthday::ID;

birthday::birthday(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  day_ = TlFetchInt::parse(parser);
  month_ = TlFetchInt::parse(parser);
  year_ = flags.fetch_if<TlFetchInt>(0, parser);
}

constexpr int32 userFull::ID;

userFull::userFull(TlParser &parser) {
  using FetchPeerSettings = TlFetchBoxed<TlFetchObject<peerSettings>, peerSettings::ID>;
  using FetchNotifySettings = TlFetchBoxed<TlFetchObject<peerNotifySettings>, peerNotifySettings::ID>;
  using FetchBotInfo = TlFetchBoxed<TlFetchObject<botInfo>, botInfo::ID>;
  using FetchAdminRights = TlFetchBoxed<TlFetchObject<chatAdminRights>, chatAdminRights::ID>;
  using FetchBirthday = TlFetchBoxed<TlFetchObject<birthday>, birthday::ID>;

  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  blocked_ = flags.has(0);
  phone_calls_available_ = flags.has(4);
  phone_calls_private_ = flags.has(5);
  can_pin_message_ = flags.has(7);
  has_scheduled_ = flags.has(12);
  video_calls_available_ = flags.has(13);
  voice_messages_forbidden_ = flags.has(20);
  translations_disabled_ = flags.has(23);
  stories_pinned_available_ = flags.has(26);
  blocked_my_stories_from_ = flags.has(27);
  wallpaper_overridden_ = flags.has(28);
  contact_require_premium_ = flags.has(29);
  read_dates_private_ = flags.has(30);

  TlFlags flags2(TlFetchInt::parse(parser));
  flags2_ = flags2.get();
  sponsored_enabled_ = flags2.has(7);
  can_view_revenue_ = flags2.has(9);
  bot_can_manage_emoji_status_ = flags2.has(10);
  display_gifts_button_ = flags2.has(16);

  id_ = TlFetchLong::parse(parser);
  about_ = flags.fetch_if<TlFetchString<string>>(1, parser);
  settings_ = FetchPeerSettings::parse(parser);
  personal_photo_ = flags.fetch_if<TlFetchObject<Photo>>(21, parser);
  profile_photo_ = flags.fetch_if<TlFetchObject<Photo>>(2, parser);
  fallback_photo_ = flags.fetch_if<TlFetchObject<Photo>>(22, parser);
  notify_settings_ = FetchNotifySettings::parse(parser);
  bot_info_ = flags.fetch_if<FetchBotInfo>(3, parser);
  pinned_msg_id_ = flags.fetch_if<TlFetchInt>(6, parser);
  common_chats_count_ = TlFetchInt::parse(parser);
  folder_id_ = flags.fetch_if<TlFetchInt>(11, parser);
  ttl_period_ = flags.fetch_if<TlFetchInt>(14, parser);
  reject_unsupported_field(flags, 15, "theme", parser);
  private_forward_name_ = flags.fetch_if<TlFetchString<string>>(16, parser);
  bot_group_admin_rights_ = flags.fetch_if<FetchAdminRights>(17, parser);
  bot_broadcast_admin_rights_ = flags.fetch_if<FetchAdminRights>(18, parser);
  reject_unsupported_field(flags, 24, "wallpaper", parser);
  reject_unsupported_field(flags, 25, "stories", parser);
  reject_unsupported_field(flags2, 0, "business_work_hours", parser);
  reject_unsupported_field(flags2, 1, "business_location", parser);
  reject_unsupported_field(flags2, 2, "business_greeting_message", parser);
  reject_unsupported_field(flags2, 3, "business_away_message", parser);
  reject_unsupported_field(flags2, 4, "business_intro", parser);
  birthday_ = flags2.fetch_if<FetchBirthday>(5, parser);
  personal_channel_id_ = flags2.fetch_if<TlFetchLong>(6, parser);
  personal_channel_message_ = flags2.fetch_if<TlFetchInt>(6, parser);
  stargifts_count_ = flags2.fetch_if<TlFetchInt>(8, parser);
  reject_unsupported_field(flags2, 11, "starref_program", parser);
  reject_unsupported_field(flags2, 12, "bot_verification", parser);
  send_paid_messages_stars_ = flags2.fetch_if<TlFetchLong>(14, parser);
  reject_unsupported_field(flags2, 15, "disallowed_gifts", parser);
  reject_unsupported_field(flags2, 17, "stars_rating", parser);
  reject_unsupported_field(flags2, 18, "stars_my_pending_rating", parser);
  reject_unsupported_field(flags2, 20, "main_tab", parser);
  reject_unsupported_field(flags2, 21, "saved_music", parser);
  reject_unsupported_field(flags2, 22, "note", parser);
}

}  // namespace telegram_api
}  // namespace mtk
