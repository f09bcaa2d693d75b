//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "test/TlMessageBuilder.h"

#include "mtk/telegram/BotInfo.h"
#include "mtk/telegram/ChatFull.h"
#include "mtk/telegram/ChatParticipants.h"
#include "mtk/telegram/ChatReactions.h"
#include "mtk/telegram/ExportedChatInvite.h"
#include "mtk/telegram/Peer.h"
#include "mtk/telegram/PeerNotifySettings.h"
#include "mtk/telegram/Photo.h"
#include "mtk/telegram/UserFull.h"

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/fetch_result.h"
#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/tl_storers.h"

#include "mtk/utils/common.h"
#include "mtk/utils/logging.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"
#include "mtk/utils/tests.h"

using namespace mtk::telegram_api;

using mtk::ErrorKind;
using mtk::int32;
using mtk::int64;
using mtk::string;
using mtk::TlMessageBuilder;
using mtk::TlParser;

static bool has_substr(mtk::Slice str, mtk::Slice substr) {
  return str.str().find(substr.str()) != string::npos;
}

static TlMessageBuilder &add_empty_notify_settings(TlMessageBuilder &builder) {
  return builder.add_int(peerNotifySettings::ID).add_int(0);
}

static TlMessageBuilder &add_empty_participants(TlMessageBuilder &builder, int64 chat_id) {
  return builder.add_int(chatParticipants::ID).add_long(chat_id).add_vector_header(0).add_int(1);
}

static string minimal_chat_full() {
  TlMessageBuilder builder;
  builder.add_int(chatFull::ID).add_int(0).add_long(123).add_string("hello");
  add_empty_participants(builder, 123);
  add_empty_notify_settings(builder);
  return builder.get();
}

TEST(Records, chat_full_minimal) {
  auto message = minimal_chat_full();
  ASSERT_EQ(56u, message.size());
  ASSERT_EQ(string("\x1b\x42\x33\x26", 4), message.substr(0, 4));

  auto r_chat_full = mtk::fetch_result<ChatFull>(message);
  ASSERT_TRUE(r_chat_full.is_ok());
  auto &chat_full = r_chat_full.ok();
  ASSERT_TRUE(!chat_full.is_channel());
  ASSERT_EQ(123, chat_full.get_chat_id());

  auto &chat = chat_full.get<chatFull>();
  ASSERT_EQ(0, chat.flags_);
  ASSERT_EQ(string("hello"), chat.about_);
  ASSERT_TRUE(chat.participants_.is<chatParticipants>());
  ASSERT_EQ(123, chat.participants_.get_chat_id());
  ASSERT_EQ(0u, chat.participants_.get_participant_count());
  ASSERT_EQ(1, chat.participants_.get<chatParticipants>().version_);
  ASSERT_EQ(0, chat_full.get_notify_settings().flags_);
  ASSERT_TRUE(!chat_full.get_notify_settings().is_muted(0));
  ASSERT_TRUE(!chat.can_set_username_);
  ASSERT_TRUE(!chat.chat_photo_);
  ASSERT_TRUE(!chat.exported_invite_);
  ASSERT_TRUE(!chat.bot_info_);
  ASSERT_TRUE(!chat.call_);
  ASSERT_TRUE(!chat.recent_requesters_);
  ASSERT_TRUE(!chat.available_reactions_);
}

TEST(Records, chat_full_truncated) {
  auto message = minimal_chat_full();
  mtk::ScopedDisableLog disable_log;
  for (size_t length = 0; length < message.size(); length++) {
    auto r_chat_full = mtk::fetch_result<ChatFull>(mtk::Slice(message).substr(0, length));
    ASSERT_TRUE(r_chat_full.is_error());
    ASSERT_TRUE(mtk::is_error_kind(r_chat_full.error(), ErrorKind::UnexpectedEnd));
  }

  auto r_chat_full = mtk::fetch_result<ChatFull>(message + string(4, '\0'));
  ASSERT_TRUE(mtk::is_error_kind(r_chat_full.error(), ErrorKind::Deserialize));
  ASSERT_TRUE(has_substr(r_chat_full.error().message(), "Too much data to fetch: 4 bytes left"));
}

TEST(Records, chat_full_wrong_notify_settings) {
  TlMessageBuilder builder;
  builder.add_int(chatFull::ID).add_int(0).add_long(123).add_string("hello");
  add_empty_participants(builder, 123);
  builder.add_int(notificationSoundNone::ID).add_int(0);

  auto r_chat_full = mtk::fetch_result<ChatFull>(builder.get());
  ASSERT_TRUE(mtk::is_error_kind(r_chat_full.error(), ErrorKind::UnknownConstructor));
  ASSERT_TRUE(has_substr(r_chat_full.error().message(), "Wrong constructor"));
}

TEST(Records, chat_full_optional_fields) {
  TlMessageBuilder builder;
  builder.add_int(chatFull::ID).add_int(2095308).add_long(-1).add_string("about");
  add_empty_participants(builder, 1);
  builder.add_int(photoEmpty::ID).add_long(9);
  add_empty_notify_settings(builder);
  builder.add_int(chatInviteExported::ID).add_int(1 << 5).add_string("t.me/+abc").add_long(5).add_int(100);
  builder.add_vector_header(1)
      .add_int(botInfo::ID)
      .add_int(5)
      .add_long(77)
      .add_vector_header(1)
      .add_int(botCommand::ID)
      .add_string("start")
      .add_string("Start the bot");
  builder.add_int(10).add_int(1);
  builder.add_int(inputGroupCall::ID).add_long(3).add_long(4);
  builder.add_int(86400);
  builder.add_int(peerUser::ID).add_long(77);
  builder.add_string("x");
  builder.add_int(2).add_vector_header(2).add_long(5).add_long(6);
  builder.add_int(chatReactionsSome::ID).add_vector_header(1).add_int(reactionEmoji::ID).add_string("\xf0\x9f\x91\x8d");
  builder.add_int(11);

  auto r_chat_full = mtk::fetch_result<ChatFull>(builder.get());
  ASSERT_TRUE(r_chat_full.is_ok());
  auto &chat = r_chat_full.ok().get<chatFull>();
  ASSERT_TRUE(chat.can_set_username_);
  ASSERT_TRUE(!chat.has_scheduled_);
  ASSERT_TRUE(chat.translations_disabled_);
  ASSERT_EQ(-1, chat.id_);
  ASSERT_EQ(9, chat.chat_photo_.value().get_photo_id());

  auto &invite = chat.exported_invite_.value().get<chatInviteExported>();
  ASSERT_TRUE(invite.permanent_);
  ASSERT_TRUE(!invite.revoked_);
  ASSERT_EQ(string("t.me/+abc"), invite.link_);
  ASSERT_EQ(5, invite.admin_id_);

  auto &bot_info = chat.bot_info_.value();
  ASSERT_EQ(1u, bot_info.size());
  ASSERT_EQ(77, bot_info[0].user_id_.value());
  ASSERT_TRUE(!bot_info[0].description_);
  ASSERT_EQ(1u, bot_info[0].commands_.value().size());
  ASSERT_EQ(string("start"), bot_info[0].commands_.value()[0].command_);
  ASSERT_EQ(string("Start the bot"), bot_info[0].commands_.value()[0].description_);

  ASSERT_EQ(10, chat.pinned_msg_id_.value());
  ASSERT_EQ(1, chat.folder_id_.value());
  ASSERT_EQ(3, chat.call_.value().id_);
  ASSERT_EQ(4, chat.call_.value().access_hash_);
  ASSERT_EQ(86400, chat.ttl_period_.value());
  ASSERT_EQ(77, chat.groupcall_default_join_as_.value().get_peer_id());
  ASSERT_EQ(string("x"), chat.theme_emoticon_.value());
  ASSERT_EQ(2, chat.requests_pending_.value());
  ASSERT_EQ(mtk::vector<int64>({5, 6}), chat.recent_requesters_.value());
  ASSERT_TRUE(chat.available_reactions_.value().is_allowed(Reaction(reactionEmoji("\xf0\x9f\x91\x8d"))));
  ASSERT_EQ(11, chat.reactions_limit_.value());
}

TEST(Records, chat_full_too_many_recent_requesters) {
  TlMessageBuilder builder;
  builder.add_int(chatFull::ID).add_int(1 << 17).add_long(1).add_string("");
  add_empty_participants(builder, 1);
  add_empty_notify_settings(builder);
  builder.add_int(101).add_vector_header(101);
  for (int i = 0; i < 101; i++) {
    builder.add_long(i);
  }

  auto r_chat_full = mtk::fetch_result<ChatFull>(builder.get());
  ASSERT_TRUE(mtk::is_error_kind(r_chat_full.error(), ErrorKind::Deserialize));
  ASSERT_TRUE(has_substr(r_chat_full.error().message(), "101 instead of at most 100"));
}

TEST(Records, channel_full) {
  TlMessageBuilder builder;
  builder.add_int(channelFull::ID).add_int(524356).add_long(555).add_string("channel");
  builder.add_int(photoEmpty::ID).add_long(0);
  add_empty_notify_settings(builder);

  auto r_chat_full = mtk::fetch_result<ChatFull>(builder.get());
  ASSERT_TRUE(r_chat_full.is_ok());
  auto &chat_full = r_chat_full.ok();
  ASSERT_TRUE(chat_full.is_channel());
  ASSERT_EQ(555, chat_full.get_chat_id());
  auto &channel = chat_full.get<channelFull>();
  ASSERT_TRUE(channel.can_set_username_);
  ASSERT_TRUE(channel.has_scheduled_);
  ASSERT_EQ(string("channel"), channel.about_);
  ASSERT_EQ(0, channel.chat_photo_.value().get_photo_id());
  ASSERT_EQ(0, chat_full.get_notify_settings().flags_);
}

TEST(Records, participants) {
  TlMessageBuilder builder;
  builder.add_int(chatParticipants::ID).add_long(7).add_vector_header(3);
  builder.add_int(chatParticipant::ID).add_long(1).add_long(2).add_int(3);
  builder.add_int(chatParticipantAdmin::ID).add_long(4).add_long(5).add_int(6);
  builder.add_int(chatParticipantCreator::ID).add_long(8);
  builder.add_int(12);

  auto r_participants = mtk::fetch_result<ChatParticipants>(builder.get());
  ASSERT_TRUE(r_participants.is_ok());
  auto &participants = r_participants.ok();
  ASSERT_EQ(7, participants.get_chat_id());
  ASSERT_EQ(3u, participants.get_participant_count());
  auto &list = participants.get<chatParticipants>().participants_;
  ASSERT_EQ(1, list[0].get_user_id());
  ASSERT_TRUE(!list[0].is_administrator());
  ASSERT_EQ(4, list[1].get_user_id());
  ASSERT_TRUE(list[1].is_administrator());
  ASSERT_EQ(6, list[1].get<chatParticipantAdmin>().date_);
  ASSERT_EQ(8, list[2].get_user_id());
  ASSERT_TRUE(list[2].is_administrator());
  ASSERT_EQ(12, participants.get<chatParticipants>().version_);
}

TEST(Records, participants_forbidden) {
  auto message = TlMessageBuilder()
                     .add_int(chatParticipantsForbidden::ID)
                     .add_int(1)
                     .add_long(5)
                     .add_int(chatParticipantCreator::ID)
                     .add_long(9)
                     .get();
  auto r_participants = mtk::fetch_result<ChatParticipants>(message);
  ASSERT_TRUE(r_participants.is_ok());
  auto &participants = r_participants.ok();
  ASSERT_EQ(5, participants.get_chat_id());
  ASSERT_EQ(0u, participants.get_participant_count());
  auto &self_participant = participants.get<chatParticipantsForbidden>().self_participant_;
  ASSERT_TRUE(static_cast<bool>(self_participant));
  ASSERT_EQ(9, self_participant->get_user_id());
  ASSERT_TRUE(self_participant->is_administrator());

  message = TlMessageBuilder().add_int(chatParticipantsForbidden::ID).add_int(0).add_long(5).get();
  r_participants = mtk::fetch_result<ChatParticipants>(message);
  ASSERT_TRUE(r_participants.is_ok());
  ASSERT_TRUE(!r_participants.ok().get<chatParticipantsForbidden>().self_participant_);
}

TEST(Records, participants_limit) {
  // no participant bodies follow, so the count is rejected before the remaining length is checked
  auto message = TlMessageBuilder().add_int(chatParticipants::ID).add_long(7).add_vector_header(10001).get();
  TlParser parser(message);
  ChatParticipants participants(parser);
  ASSERT_TRUE(participants.empty());
  ASSERT_TRUE(mtk::is_error_kind(parser.get_status(), ErrorKind::Deserialize));
  ASSERT_STREQ("Too many elements in vector: 10001 instead of at most 10000 at offset 20", parser.get_status().message());
}

TEST(Records, photo) {
  TlMessageBuilder builder;
  builder.add_int(photo::ID).add_int(3).add_long(1).add_long(2).add_string("ref").add_int(3);
  builder.add_vector_header(2);
  builder.add_int(photoSize::ID).add_string("m").add_int(320).add_int(240).add_int(1000);
  builder.add_int(photoSizeProgressive::ID).add_string("y").add_int(800).add_int(600);
  builder.add_vector_header(3).add_int(100).add_int(200).add_int(300);
  builder.add_vector_header(1);
  builder.add_int(videoSize::ID).add_int(1).add_string("u").add_int(640).add_int(640).add_int(5000).add_double(1.5);
  builder.add_int(2);

  auto r_photo = mtk::fetch_result<Photo>(builder.get());
  ASSERT_TRUE(r_photo.is_ok());
  ASSERT_EQ(1, r_photo.ok().get_photo_id());
  auto &p = r_photo.ok().get<photo>();
  ASSERT_TRUE(p.has_stickers_);
  ASSERT_EQ(2, p.access_hash_);
  ASSERT_EQ(string("ref"), p.file_reference_);
  ASSERT_EQ(2u, p.sizes_.size());
  ASSERT_EQ(string("m"), p.sizes_[0].get_type().str());
  ASSERT_EQ(320, p.sizes_[0].get<photoSize>().w_);
  ASSERT_EQ(string("y"), p.sizes_[1].get_type().str());
  ASSERT_EQ(mtk::vector<int32>({100, 200, 300}), p.sizes_[1].get<photoSizeProgressive>().sizes_);
  ASSERT_EQ(1u, p.video_sizes_.value().size());
  auto &video_size = p.video_sizes_.value()[0].get<videoSize>();
  ASSERT_EQ(string("u"), video_size.type_);
  ASSERT_EQ(1.5, video_size.video_start_ts_.value());
  ASSERT_EQ(2, p.dc_id_);
}

TEST(Records, photo_without_video_sizes) {
  TlMessageBuilder builder;
  builder.add_int(photo::ID).add_int(0).add_long(1).add_long(2).add_string("").add_int(3);
  builder.add_vector_header(1).add_int(photoStrippedSize::ID).add_string("i").add_string(string("\x01\x02\x03", 3));
  builder.add_int(4);

  auto r_photo = mtk::fetch_result<Photo>(builder.get());
  ASSERT_TRUE(r_photo.is_ok());
  auto &p = r_photo.ok().get<photo>();
  ASSERT_TRUE(!p.has_stickers_);
  ASSERT_TRUE(!p.video_sizes_);
  ASSERT_EQ(string("\x01\x02\x03", 3), p.sizes_[0].get<photoStrippedSize>().bytes_);
  ASSERT_EQ(4, p.dc_id_);
}

TEST(Records, photo_size_limits) {
  TlMessageBuilder builder;
  builder.add_int(photoSizeProgressive::ID).add_string("y").add_int(800).add_int(600).add_vector_header(51);
  for (int i = 0; i < 51; i++) {
    builder.add_int(i);
  }
  auto r_size = mtk::fetch_result<PhotoSize>(builder.get());
  ASSERT_TRUE(mtk::is_error_kind(r_size.error(), ErrorKind::Deserialize));
  ASSERT_TRUE(has_substr(r_size.error().message(), "51 instead of at most 50"));

  auto message = TlMessageBuilder()
                     .add_int(videoSizeEmojiMarkup::ID)
                     .add_long(10)
                     .add_vector_header(5)
                     .add_int(1)
                     .add_int(2)
                     .add_int(3)
                     .add_int(4)
                     .add_int(5)
                     .get();
  auto r_video_size = mtk::fetch_result<VideoSize>(message);
  ASSERT_TRUE(mtk::is_error_kind(r_video_size.error(), ErrorKind::Deserialize));
}

TEST(Records, video_size_sticker_markup) {
  auto message = TlMessageBuilder()
                     .add_int(videoSizeStickerMarkup::ID)
                     .add_int(inputStickerSetShortName::ID)
                     .add_string("animals")
                     .add_long(99)
                     .add_vector_header(2)
                     .add_int(0xffffff)
                     .add_int(0)
                     .get();
  auto r_video_size = mtk::fetch_result<VideoSize>(message);
  ASSERT_TRUE(r_video_size.is_ok());
  auto &markup = r_video_size.ok().get<videoSizeStickerMarkup>();
  ASSERT_EQ(string("animals"), markup.stickerset_.get<inputStickerSetShortName>().short_name_);
  ASSERT_EQ(99, markup.sticker_id_);
  ASSERT_EQ(mtk::vector<int32>({0xffffff, 0}), markup.background_colors_);
}

TEST(Records, notify_settings) {
  using FetchNotifySettings = mtk::TlFetchBoxed<mtk::TlFetchObject<peerNotifySettings>, peerNotifySettings::ID>;

  auto message = TlMessageBuilder()
                     .add_int(peerNotifySettings::ID)
                     .add_int(45)
                     .add_bool(true)
                     .add_int(200)
                     .add_int(notificationSoundLocal::ID)
                     .add_string("Title")
                     .add_string("data")
                     .add_int(notificationSoundRingtone::ID)
                     .add_long(31)
                     .get();
  TlParser parser(message);
  auto settings = FetchNotifySettings::parse(parser);
  parser.fetch_end();
  ASSERT_TRUE(!parser.has_error());
  ASSERT_TRUE(settings.show_previews_.value());
  ASSERT_TRUE(!settings.silent_);
  ASSERT_EQ(200, settings.mute_until_.value());
  ASSERT_EQ(string("Title"), settings.ios_sound_.value().get<notificationSoundLocal>().title_);
  ASSERT_EQ(string("data"), settings.ios_sound_.value().get<notificationSoundLocal>().data_);
  ASSERT_TRUE(!settings.android_sound_);
  ASSERT_EQ(31, settings.other_sound_.value().get<notificationSoundRingtone>().id_);
  ASSERT_TRUE(!settings.stories_muted_);
  ASSERT_TRUE(settings.is_muted(100));
  ASSERT_TRUE(!settings.is_muted(200));
  ASSERT_TRUE(!settings.is_muted(300));
}

TEST(Records, notify_settings_unknown_sound) {
  auto message = TlMessageBuilder().add_int(peerNotifySettings::ID).add_int(1 << 3).add_int(0x12345678).get();
  TlParser parser(message);
  mtk::TlFetchBoxed<mtk::TlFetchObject<peerNotifySettings>, peerNotifySettings::ID>::parse(parser);
  auto status = parser.get_status();
  ASSERT_TRUE(mtk::is_error_kind(status, ErrorKind::UnknownConstructor));
  ASSERT_TRUE(has_substr(status.message(), "for NotificationSound"));
}

TEST(Records, bot_info_unsupported_fields) {
  using FetchBotInfo = mtk::TlFetchBoxed<mtk::TlFetchObject<botInfo>, botInfo::ID>;

  for (int bit : {5, 8, 9}) {
    auto message = TlMessageBuilder().add_int(botInfo::ID).add_int(1 << bit).add_int(0).get();
    TlParser parser(message);
    FetchBotInfo::parse(parser);
    auto status = parser.get_status();
    ASSERT_TRUE(mtk::is_error_kind(status, ErrorKind::Deserialize));
    ASSERT_TRUE(has_substr(status.message(), "Unsupported field"));
    ASSERT_TRUE(has_substr(status.message(), "of botInfo"));
  }

  auto message = TlMessageBuilder()
                     .add_int(botInfo::ID)
                     .add_int((1 << 1) | (1 << 3) | (1 << 6) | (1 << 7))
                     .add_string("A bot")
                     .add_int(botMenuButton::ID)
                     .add_string("Open")
                     .add_string("https://example.com")
                     .add_string("https://example.com/privacy")
                     .get();
  TlParser parser(message);
  auto bot_info = FetchBotInfo::parse(parser);
  parser.fetch_end();
  ASSERT_TRUE(!parser.has_error());
  ASSERT_TRUE(bot_info.has_preview_medias_);
  ASSERT_TRUE(!bot_info.user_id_);
  ASSERT_EQ(string("A bot"), bot_info.description_.value());
  ASSERT_EQ(string("Open"), bot_info.menu_button_.value().get<botMenuButton>().text_);
  ASSERT_EQ(string("https://example.com/privacy"), bot_info.privacy_policy_url_.value());
}

TEST(Records, exported_invite) {
  auto message = TlMessageBuilder()
                     .add_int(chatInviteExported::ID)
                     .add_int(2047)
                     .add_string("t.me/+xyz")
                     .add_long(42)
                     .add_int(1000)
                     .add_int(11)
                     .add_int(12)
                     .add_int(13)
                     .add_int(14)
                     .add_int(15)
                     .add_int(16)
                     .add_string("Invite")
                     .add_int(starsSubscriptionPricing::ID)
                     .add_int(2592000)
                     .add_long(100)
                     .get();
  auto r_invite = mtk::fetch_result<ExportedChatInvite>(message);
  ASSERT_TRUE(r_invite.is_ok());
  auto &invite = r_invite.ok().get<chatInviteExported>();
  ASSERT_TRUE(invite.revoked_);
  ASSERT_TRUE(invite.permanent_);
  ASSERT_TRUE(invite.request_needed_);
  ASSERT_EQ(42, invite.admin_id_);
  ASSERT_EQ(1000, invite.date_);
  ASSERT_EQ(11, invite.start_date_.value());
  ASSERT_EQ(12, invite.expire_date_.value());
  ASSERT_EQ(13, invite.usage_limit_.value());
  ASSERT_EQ(14, invite.usage_.value());
  ASSERT_EQ(15, invite.requested_.value());
  ASSERT_EQ(16, invite.subscription_expired_.value());
  ASSERT_EQ(string("Invite"), invite.title_.value());
  ASSERT_EQ(2592000, invite.subscription_pricing_.value().period_);
  ASSERT_EQ(100, invite.subscription_pricing_.value().amount_);

  auto r_requests = mtk::fetch_result<ExportedChatInvite>(TlMessageBuilder().add_int(chatInvitePublicJoinRequests::ID).get());
  ASSERT_TRUE(r_requests.is_ok());
  ASSERT_TRUE(r_requests.ok().is<chatInvitePublicJoinRequests>());
}

TEST(Records, reactions) {
  auto r_all = mtk::fetch_result<ChatReactions>(TlMessageBuilder().add_int(chatReactionsAll::ID).add_int(0).get());
  ASSERT_TRUE(r_all.is_ok());
  auto &all = r_all.ok();
  ASSERT_TRUE(all.is_allowed(Reaction(reactionEmoji("A"))));
  ASSERT_TRUE(!all.is_allowed(Reaction(reactionCustomEmoji(42))));
  ASSERT_TRUE(all.is_allowed(Reaction(reactionPaid())));
  ASSERT_TRUE(!all.is_allowed(Reaction(reactionEmpty())));
  ASSERT_TRUE(!all.is_allowed(Reaction()));

  auto r_all_custom = mtk::fetch_result<ChatReactions>(TlMessageBuilder().add_int(chatReactionsAll::ID).add_int(1).get());
  ASSERT_TRUE(r_all_custom.ok().is_allowed(Reaction(reactionCustomEmoji(42))));

  auto r_none = mtk::fetch_result<ChatReactions>(TlMessageBuilder().add_int(chatReactionsNone::ID).get());
  ASSERT_TRUE(!r_none.ok().is_allowed(Reaction(reactionEmoji("A"))));

  auto message = TlMessageBuilder()
                     .add_int(chatReactionsSome::ID)
                     .add_vector_header(2)
                     .add_int(reactionEmoji::ID)
                     .add_string("A")
                     .add_int(reactionCustomEmoji::ID)
                     .add_long(42)
                     .get();
  auto r_some = mtk::fetch_result<ChatReactions>(message);
  ASSERT_TRUE(r_some.is_ok());
  auto &some = r_some.ok();
  ASSERT_TRUE(some.is_allowed(Reaction(reactionEmoji("A"))));
  ASSERT_TRUE(!some.is_allowed(Reaction(reactionEmoji("B"))));
  ASSERT_TRUE(some.is_allowed(Reaction(reactionCustomEmoji(42))));
  ASSERT_TRUE(!some.is_allowed(Reaction(reactionCustomEmoji(43))));
  ASSERT_TRUE(!some.is_allowed(Reaction(reactionPaid())));
}

TEST(Records, store) {
  Reaction reaction = reactionEmoji("A");
  ASSERT_EQ(TlMessageBuilder().add_int(reactionEmoji::ID).add_string("A").get(), mtk::tl_serialize(reaction));
  ASSERT_EQ(8u, mtk::tl_calc_length(reaction));

  reaction = reactionPaid();
  ASSERT_EQ(TlMessageBuilder().add_int(reactionPaid::ID).get(), mtk::tl_serialize(reaction));

  InputStickerSet sticker_set = inputStickerSetID(1, 2);
  auto serialized = mtk::tl_serialize(sticker_set);
  ASSERT_EQ(TlMessageBuilder().add_int(inputStickerSetID::ID).add_long(1).add_long(2).get(), serialized);
  TlParser parser(serialized);
  InputStickerSet parsed(parser);
  parser.fetch_end();
  ASSERT_TRUE(!parser.has_error());
  ASSERT_EQ(2, parsed.get<inputStickerSetID>().access_hash_);

  ASSERT_EQ(TlMessageBuilder().add_long(3).add_long(4).get(), mtk::tl_serialize(inputGroupCall(3, 4)));
  ASSERT_EQ(TlMessageBuilder().add_int(inputStickerSetEmpty::ID).get(),
            mtk::tl_serialize(InputStickerSet(inputStickerSetEmpty())));
}

static TlMessageBuilder &add_user_full_header(TlMessageBuilder &builder, int32 flags, int32 flags2, int64 user_id) {
  return builder.add_int(userFull::ID).add_int(flags).add_int(flags2).add_long(user_id);
}

static string minimal_user_full(int32 flags, int32 flags2) {
  TlMessageBuilder builder;
  add_user_full_header(builder, flags, flags2, 7);
  builder.add_int(peerSettings::ID).add_int(0);
  add_empty_notify_settings(builder);
  builder.add_int(3);
  return builder.get();
}

TEST(Records, user_full_minimal) {
  auto r_user_full = mtk::fetch_result<UserFull>(minimal_user_full(0, 0));
  ASSERT_TRUE(r_user_full.is_ok());
  ASSERT_EQ(7, r_user_full.ok().get_user_id());
  ASSERT_TRUE(!r_user_full.ok().is_bot());

  auto &user = r_user_full.ok().get<userFull>();
  ASSERT_EQ(0, user.flags_);
  ASSERT_EQ(0, user.flags2_);
  ASSERT_TRUE(!user.about_);
  ASSERT_EQ(0, user.settings_.flags_);
  ASSERT_TRUE(!user.profile_photo_);
  ASSERT_EQ(0, user.notify_settings_.flags_);
  ASSERT_EQ(3, user.common_chats_count_);
  ASSERT_TRUE(!user.sponsored_enabled_);
  ASSERT_TRUE(!user.birthday_);
  ASSERT_TRUE(!user.personal_channel_id_);
  ASSERT_TRUE(!user.stargifts_count_);
}

TEST(Records, user_full_both_flags_words) {
  int32 flags = (1 << 0) | (1 << 1) | (1 << 2) | (1 << 3) | (1 << 6) | (1 << 17) | (1 << 30);
  int32 flags2 = (1 << 5) | (1 << 6) | (1 << 7) | (1 << 8) | (1 << 14) | (1 << 16);

  TlMessageBuilder builder;
  add_user_full_header(builder, flags, flags2, 1000);
  builder.add_string("bio");
  builder.add_int(peerSettings::ID)
      .add_int((1 << 0) | (1 << 9) | (1 << 15))
      .add_string("Group")
      .add_int(1700000000)
      .add_string("03.2021");
  builder.add_int(photoEmpty::ID).add_long(55);
  add_empty_notify_settings(builder);
  builder.add_int(botInfo::ID).add_int(1 << 0).add_long(1000);
  builder.add_int(12);
  builder.add_int(4);
  builder.add_int(chatAdminRights::ID).add_int(chatAdminRights::OTHER_MASK | chatAdminRights::CHANGE_INFO_MASK);
  builder.add_int(birthday::ID).add_int(1).add_int(29).add_int(2).add_int(2000);
  builder.add_long(-1001).add_int(77);
  builder.add_int(5);
  builder.add_long(250);

  auto r_user_full = mtk::fetch_result<UserFull>(builder.get());
  ASSERT_TRUE(r_user_full.is_ok());
  ASSERT_TRUE(r_user_full.ok().is_bot());
  auto &user = r_user_full.ok().get<userFull>();
  ASSERT_TRUE(user.blocked_);
  ASSERT_TRUE(user.read_dates_private_);
  ASSERT_TRUE(!user.phone_calls_available_);
  ASSERT_EQ(string("bio"), user.about_.value());
  ASSERT_TRUE(user.settings_.report_spam_);
  ASSERT_TRUE(!user.settings_.add_contact_);
  ASSERT_EQ(string("Group"), user.settings_.request_chat_title_.value());
  ASSERT_EQ(1700000000, user.settings_.request_chat_date_.value());
  ASSERT_EQ(string("03.2021"), user.settings_.registration_month_.value());
  ASSERT_TRUE(!user.settings_.phone_country_);
  ASSERT_EQ(55, user.profile_photo_.value().get<photoEmpty>().id_);
  ASSERT_TRUE(!user.personal_photo_);
  ASSERT_TRUE(!user.fallback_photo_);
  ASSERT_EQ(1000, user.bot_info_.value().user_id_.value());
  ASSERT_EQ(12, user.pinned_msg_id_.value());
  ASSERT_EQ(4, user.common_chats_count_);
  ASSERT_TRUE(user.bot_group_admin_rights_.value().has(chatAdminRights::OTHER_MASK));
  ASSERT_TRUE(!user.bot_group_admin_rights_.value().has(chatAdminRights::BAN_USERS_MASK));
  ASSERT_TRUE(!user.bot_broadcast_admin_rights_);

  ASSERT_EQ(flags2, user.flags2_);
  ASSERT_TRUE(user.sponsored_enabled_);
  ASSERT_TRUE(user.display_gifts_button_);
  ASSERT_TRUE(!user.can_view_revenue_);
  ASSERT_EQ(29, user.birthday_.value().day_);
  ASSERT_EQ(2, user.birthday_.value().month_);
  ASSERT_EQ(2000, user.birthday_.value().year_.value());
  ASSERT_EQ(-1001, user.personal_channel_id_.value());
  ASSERT_EQ(77, user.personal_channel_message_.value());
  ASSERT_EQ(5, user.stargifts_count_.value());
  ASSERT_EQ(250, user.send_paid_messages_stars_.value());
}

TEST(Records, user_full_second_flags_word_clear) {
  TlMessageBuilder builder;
  add_user_full_header(builder, (1 << 1) | (1 << 11), 0, 8);
  builder.add_string("");
  builder.add_int(peerSettings::ID).add_int(0);
  add_empty_notify_settings(builder);
  builder.add_int(0).add_int(2);

  auto r_user_full = mtk::fetch_result<UserFull>(builder.get());
  ASSERT_TRUE(r_user_full.is_ok());
  auto &user = r_user_full.ok().get<userFull>();
  ASSERT_EQ(string(), user.about_.value());
  ASSERT_EQ(2, user.folder_id_.value());
  ASSERT_TRUE(!user.birthday_);
  ASSERT_TRUE(!user.personal_channel_id_);
  ASSERT_TRUE(!user.personal_channel_message_);
  ASSERT_TRUE(!user.send_paid_messages_stars_);

  // a set bit of the second flags word requires its field
  auto message = minimal_user_full(0, 1 << 8);
  TlParser parser(message);
  UserFull user_full(parser);
  ASSERT_TRUE(user_full.empty());
  ASSERT_TRUE(mtk::is_error_kind(parser.get_status(), ErrorKind::UnexpectedEnd));
  ASSERT_EQ(message.size(), parser.get_error_pos());
}

TEST(Records, user_full_unsupported_fields) {
  for (int bit : {15, 24, 25}) {
    auto message = minimal_user_full(1 << bit, 0);
    TlParser parser(message);
    UserFull user_full(parser);
    auto status = parser.get_status();
    ASSERT_TRUE(mtk::is_error_kind(status, ErrorKind::Deserialize));
    ASSERT_TRUE(has_substr(status.message(), "of userFull"));
  }
  for (int bit : {0, 1, 2, 3, 4, 11, 12, 15, 17, 18, 20, 21, 22}) {
    auto message = minimal_user_full(0, 1 << bit);
    TlParser parser(message);
    UserFull user_full(parser);
    auto status = parser.get_status();
    ASSERT_TRUE(mtk::is_error_kind(status, ErrorKind::Deserialize));
    ASSERT_TRUE(has_substr(status.message(), "Unsupported field"));
  }

  auto message = minimal_user_full(0, 1 << 21);
  TlParser parser(message);
  UserFull user_full(parser);
  ASSERT_TRUE(has_substr(parser.get_status().message(), "saved_music"));
}

static InputPeer reparse_input_peer(const InputPeer &peer) {
  auto serialized = mtk::tl_serialize(peer);
  ASSERT_EQ(serialized.size(), mtk::tl_calc_length(peer));
  TlParser parser(serialized);
  InputPeer result(parser);
  parser.fetch_end();
  ASSERT_TRUE(!parser.has_error());
  ASSERT_EQ(serialized, mtk::tl_serialize(result));
  return result;
}

TEST(Records, input_peer) {
  ASSERT_EQ(TlMessageBuilder().add_int(inputPeerSelf::ID).get(), mtk::tl_serialize(InputPeer(inputPeerSelf())));
  ASSERT_EQ(TlMessageBuilder().add_int(inputPeerUser::ID).add_long(1).add_long(-2).get(),
            mtk::tl_serialize(InputPeer(inputPeerUser(1, -2))));

  ASSERT_TRUE(reparse_input_peer(inputPeerEmpty()).is<inputPeerEmpty>());
  ASSERT_EQ(5, reparse_input_peer(inputPeerChat(5)).get<inputPeerChat>().chat_id_);
  auto channel = reparse_input_peer(inputPeerChannel(3, 4));
  ASSERT_EQ(3, channel.get<inputPeerChannel>().channel_id_);
  ASSERT_EQ(4, channel.get<inputPeerChannel>().access_hash_);
  auto user = reparse_input_peer(inputPeerUser(1, -2));
  ASSERT_EQ(-2, user.get<inputPeerUser>().access_hash_);
}

TEST(Records, input_peer_from_message) {
  InputPeer peer = inputPeerChannelFromMessage(
      InputPeer(inputPeerUserFromMessage(InputPeer(inputPeerChat(5)), 10, 11)), 20, 21);
  auto expected = TlMessageBuilder()
                      .add_int(inputPeerChannelFromMessage::ID)
                      .add_int(inputPeerUserFromMessage::ID)
                      .add_int(inputPeerChat::ID)
                      .add_long(5)
                      .add_int(10)
                      .add_long(11)
                      .add_int(20)
                      .add_long(21)
                      .get();
  ASSERT_EQ(expected, mtk::tl_serialize(peer));

  auto parsed = reparse_input_peer(peer);
  auto &channel = parsed.get<inputPeerChannelFromMessage>();
  ASSERT_EQ(20, channel.msg_id_);
  ASSERT_EQ(21, channel.channel_id_);
  auto &user = channel.peer_->get<inputPeerUserFromMessage>();
  ASSERT_EQ(10, user.msg_id_);
  ASSERT_EQ(11, user.user_id_);
  ASSERT_EQ(5, user.peer_->get<inputPeerChat>().chat_id_);
}

static string nested_input_peer(int depth) {
  TlMessageBuilder builder;
  for (int i = 0; i < depth; i++) {
    builder.add_int(inputPeerUserFromMessage::ID);
  }
  builder.add_int(inputPeerSelf::ID);
  for (int i = 0; i < depth; i++) {
    builder.add_int(i).add_long(i);
  }
  return builder.get();
}

TEST(Records, input_peer_nesting_limit) {
  {
    auto message = nested_input_peer(TlParser::MAX_NESTING_DEPTH);
    TlParser parser(message);
    InputPeer peer(parser);
    parser.fetch_end();
    ASSERT_TRUE(!parser.has_error());
    ASSERT_EQ(message, mtk::tl_serialize(peer));
  }

  auto message = nested_input_peer(TlParser::MAX_NESTING_DEPTH + 1);
  TlParser parser(message);
  InputPeer peer(parser);
  ASSERT_TRUE(peer.empty());
  ASSERT_TRUE(mtk::is_error_kind(parser.get_status(), ErrorKind::Deserialize));
  ASSERT_TRUE(has_substr(parser.get_status().message(), "Nesting depth exceeds 32"));
  ASSERT_EQ(4u * (TlParser::MAX_NESTING_DEPTH + 1), parser.get_error_pos());
}

TEST(Records, input_peer_notify_settings) {
  inputPeerNotifySettings settings;
  ASSERT_EQ(TlMessageBuilder().add_int(0).get(), mtk::tl_serialize(settings));

  settings.show_previews_ = true;
  settings.mute_until_ = 100;
  settings.sound_ = NotificationSound(notificationSoundRingtone(5));
  settings.stories_hide_sender_ = false;
  settings.stories_sound_ = NotificationSound(notificationSoundLocal("Title", "data"));
  ASSERT_EQ(1 | 4 | 8 | 128 | 256, settings.get_flags());

  auto expected = TlMessageBuilder()
                      .add_int(settings.get_flags())
                      .add_bool(true)
                      .add_int(100)
                      .add_int(notificationSoundRingtone::ID)
                      .add_long(5)
                      .add_bool(false)
                      .add_int(notificationSoundLocal::ID)
                      .add_string("Title")
                      .add_string("data")
                      .get();
  auto serialized = mtk::tl_serialize(settings);
  ASSERT_EQ(expected, serialized);

  TlParser parser(serialized);
  inputPeerNotifySettings parsed(parser);
  parser.fetch_end();
  ASSERT_TRUE(!parser.has_error());
  ASSERT_TRUE(parsed.show_previews_.value());
  ASSERT_TRUE(!parsed.silent_);
  ASSERT_EQ(100, parsed.mute_until_.value());
  ASSERT_EQ(5, parsed.sound_.value().get<notificationSoundRingtone>().id_);
  ASSERT_TRUE(!parsed.stories_muted_);
  ASSERT_TRUE(!parsed.stories_hide_sender_.value());
  ASSERT_EQ(string("data"), parsed.stories_sound_.value().get<notificationSoundLocal>().data_);
  ASSERT_EQ(settings.get_flags(), parsed.get_flags());
}
