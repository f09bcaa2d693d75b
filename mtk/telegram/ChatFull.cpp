//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/ChatFull.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_object_store.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

namespace {

using FetchNotifySettings = TlFetchBoxed<TlFetchObject<peerNotifySettings>, peerNotifySettings::ID>;

}  // namespace

constexpr int32 inputGroupCall::ID;

inputGroupCall::inputGroupCall(int64 id, int64 access_hash) : id_(id), access_hash_(access_hash) {
}

inputGroupCall::inputGroupCall(TlParser &parser)
    : id_(TlFetchLong::parse(parser)), access_hash_(TlFetchLong::parse(parser)) {
}

void inputGroupCall::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(id_, s);
  TlStoreBinary::store(access_hash_, s);
}

void inputGroupCall::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(id_, s);
  TlStoreBinary::store(access_hash_, s);
}

constexpr int32 chatFull::ID;

chatFull::chatFull(TlParser &parser) {
  using FetchBotInfo = TlFetchBoundedVector<TlFetchBoxed<TlFetchObject<botInfo>, botInfo::ID>, MAX_BOT_INFO>;
  using FetchRecentRequesters = TlFetchBoundedVector<TlFetchLong, MAX_RECENT_REQUESTERS>;

  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  can_set_username_ = flags.has(7);
  has_scheduled_ = flags.has(8);
  translations_disabled_ = flags.has(19);
  id_ = TlFetchLong::parse(parser);
  about_ = TlFetchString<string>::parse(parser);
  participants_ = TlFetchObject<ChatParticipants>::parse(parser);
  chat_photo_ = flags.fetch_if<TlFetchObject<Photo>>(2, parser);
  notify_settings_ = FetchNotifySettings::parse(parser);
  exported_invite_ = flags.fetch_if<TlFetchObject<ExportedChatInvite>>(13, parser);
  bot_info_ = flags.fetch_if<FetchBotInfo>(3, parser);
  pinned_msg_id_ = flags.fetch_if<TlFetchInt>(6, parser);
  folder_id_ = flags.fetch_if<TlFetchInt>(11, parser);
  call_ = flags.fetch_if<TlFetchBoxed<TlFetchObject<inputGroupCall>, inputGroupCall::ID>>(12, parser);
  ttl_period_ = flags.fetch_if<TlFetchInt>(14, parser);
  groupcall_default_join_as_ = flags.fetch_if<TlFetchObject<Peer>>(15, parser);
  theme_emoticon_ = flags.fetch_if<TlFetchString<string>>(16, parser);
  requests_pending_ = flags.fetch_if<TlFetchInt>(17, parser);
  recent_requesters_ = flags.fetch_if<FetchRecentRequesters>(17, parser);
  available_reactions_ = flags.fetch_if<TlFetchObject<ChatReactions>>(18, parser);
  reactions_limit_ = flags.fetch_if<TlFetchInt>(20, parser);
}

constexpr int32 channelFull::ID;

channelFull::channelFull(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  can_set_username_ = flags.has(6);
  has_scheduled_ = flags.has(19);
  id_ = TlFetchLong::parse(parser);
  about_ = TlFetchString<string>::parse(parser);
  chat_photo_ = flags.fetch_if<TlFetchObject<Photo>>(2, parser);
  notify_settings_ = FetchNotifySettings::parse(parser);
}

int64 ChatFull::get_chat_id() const {
  int64 chat_id = 0;
  visit([&chat_id](const auto &chat_full) { chat_id = chat_full.id_; });
  return chat_id;
}

const peerNotifySettings &ChatFull::get_notify_settings() const {
  if (is<channelFull>()) {
    return get<channelFull>().notify_settings_;
  }
  return get<chatFull>().notify_settings_;
}

}  // namespace telegram_api
}  // namespace mtk
