//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/PeerNotifySettings.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_object_store.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

constexpr int32 notificationSoundDefault::ID;

notificationSoundDefault::notificationSoundDefault(TlParser &/*parser*/) {
}

void notificationSoundDefault::store(TlStorerUnsafe &/*s*/) const {
}

void notificationSoundDefault::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 notificationSoundNone::ID;

notificationSoundNone::notificationSoundNone(TlParser &/*parser*/) {
}

void notificationSoundNone::store(TlStorerUnsafe &/*s*/) const {
}

void notificationSoundNone::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 notificationSoundLocal::ID;

notificationSoundLocal::notificationSoundLocal(string title, string data)
    : title_(std::move(title)), data_(std::move(data)) {
}

notificationSoundLocal::notificationSoundLocal(TlParser &parser)
    : title_(TlFetchString<string>::parse(parser)), data_(TlFetchString<string>::parse(parser)) {
}

void notificationSoundLocal::store(TlStorerUnsafe &s) const {
  TlStoreString::store(title_, s);
  TlStoreString::store(data_, s);
}

void notificationSoundLocal::store(TlStorerCalcLength &s) const {
  TlStoreString::store(title_, s);
  TlStoreString::store(data_, s);
}

constexpr int32 notificationSoundRingtone::ID;

notificationSoundRingtone::notificationSoundRingtone(int64 id) : id_(id) {
}

notificationSoundRingtone::notificationSoundRingtone(TlParser &parser) : id_(TlFetchLong::parse(parser)) {
}

void notificationSoundRingtone::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(id_, s);
}

void notificationSoundRingtone::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(id_, s);
}

constexpr int32 peerNotifySettings::ID;

peerNotifySettings::peerNotifySettings(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  show_previews_ = flags.fetch_if<TlFetchBool>(0, parser);
  silent_ = flags.fetch_if<TlFetchBool>(1, parser);
  mute_until_ = flags.fetch_if<TlFetchInt>(2, parser);
  ios_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(3, parser);
  android_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(4, parser);
  other_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(5, parser);
  stories_muted_ = flags.fetch_if<TlFetchBool>(6, parser);
  stories_hide_sender_ = flags.fetch_if<TlFetchBool>(7, parser);
  stories_ios_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(8, parser);
  stories_android_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(9, parser);
  stories_other_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(10, parser);
}

bool peerNotifySettings::is_muted(int32 unix_time) const {
  return mute_until_ && mute_until_.value() > unix_time;
}

constexpr int32 inputPeerNotifySettings::ID;

inputPeerNotifySettings::inputPeerNotifySettings(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  show_previews_ = flags.fetch_if<TlFetchBool>(0, parser);
  silent_ = flags.fetch_if<TlFetchBool>(1, parser);
  mute_until_ = flags.fetch_if<TlFetchInt>(2, parser);
  sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(3, parser);
  stories_muted_ = flags.fetch_if<TlFetchBool>(6, parser);
  stories_hide_sender_ = flags.fetch_if<TlFetchBool>(7, parser);
  stories_sound_ = flags.fetch_if<TlFetchObject<NotificationSound>>(8, parser);
}

int32 inputPeerNotifySettings::get_flags() const {
  int32 flags = 0;
  if (show_previews_) {
    flags |= 1 << 0;
  }
  if (silent_) {
    flags |= 1 << 1;
  }
  if (mute_until_) {
    flags |= 1 << 2;
  }
  if (sound_) {
    flags |= 1 << 3;
  }
  if (stories_muted_) {
    flags |= 1 << 6;
  }
  if (stories_hide_sender_) {
    flags |= 1 << 7;
  }
  if (stories_sound_) {
    flags |= 1 << 8;
  }
  return flags;
}

template <class StorerT>
static void store_input_peer_notify_settings(const inputPeerNotifySettings &settings, StorerT &s) {
  TlStoreBinary::store(settings.get_flags(), s);
  if (settings.show_previews_) {
    TlStoreBool::store(settings.show_previews_.value(), s);
  }
  if (settings.silent_) {
    TlStoreBool::store(settings.silent_.value(), s);
  }
  if (settings.mute_until_) {
    TlStoreBinary::store(settings.mute_until_.value(), s);
  }
  if (settings.sound_) {
    settings.sound_.value().store(s);
  }
  if (settings.stories_muted_) {
    TlStoreBool::store(settings.stories_muted_.value(), s);
  }
  if (settings.stories_hide_sender_) {
    TlStoreBool::store(settings.stories_hide_sender_.value(), s);
  }
  if (settings.stories_sound_) {
    settings.stories_sound_.value().store(s);
  }
}

void inputPeerNotifySettings::store(TlStorerUnsafe &s) const {
  store_input_peer_notify_settings(*this, s);
}

void inputPeerNotifySettings::store(TlStorerCalcLength &s) const {
  store_input_peer_notify_settings(*this, s);
}

}  // namespace telegram_api
}  // namespace mtk
