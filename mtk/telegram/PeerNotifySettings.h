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
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class notificationSoundDefault {
 public:
  static constexpr int32 ID = -1746354498;

  notificationSoundDefault() = default;

  explicit notificationSoundDefault(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class notificationSoundNone {
 public:
  static constexpr int32 ID = 1863070943;

  notificationSoundNone() = default;

  explicit notificationSoundNone(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class notificationSoundLocal {
 public:
  string title_;
  string data_;

  static constexpr int32 ID = -2096391452;

  notificationSoundLocal() = default;

  notificationSoundLocal(string title, string data);

  explicit notificationSoundLocal(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class notificationSoundRingtone {
 public:
  int64 id_ = 0;

  static constexpr int32 ID = -9666487;

  notificationSoundRingtone() = default;

  explicit notificationSoundRingtone(int64 id);

  explicit notificationSoundRingtone(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class NotificationSound final
    : public TlUnion<NotificationSound, notificationSoundDefault, notificationSoundNone, notificationSoundLocal,
                     notificationSoundRingtone> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("NotificationSound");
  }
};

// peerNotifySettings#99622c0c; every field is optional and controlled by its own flag bit
class peerNotifySettings {
 public:
  int32 flags_ = 0;
  optional<bool> show_previews_;
  optional<bool> silent_;
  optional<int32> mute_until_;
  optional<NotificationSound> ios_sound_;
  optional<NotificationSound> android_sound_;
  optional<NotificationSound> other_sound_;
  optional<bool> stories_muted_;
  optional<bool> stories_hide_sender_;
  optional<NotificationSound> stories_ios_sound_;
  optional<NotificationSound> stories_android_sound_;
  optional<NotificationSound> stories_other_sound_;

  static constexpr int32 ID = -1721619444;

  peerNotifySettings() = default;

  explicit peerNotifySettings(TlParser &parser);

  // whether notifications are muted at the moment unix_time
  bool is_muted(int32 unix_time) const;
};

// inputPeerNotifySettings#cacb6ae2; the flags word is derived from the fields present
class inputPeerNotifySettings {
 public:
  optional<bool> show_previews_;
  optional<bool> silent_;
  optional<int32> mute_until_;
  optional<NotificationSound> sound_;
  optional<bool> stories_muted_;
  optional<bool> stories_hide_sender_;
  optional<NotificationSound> stories_sound_;

  static constexpr int32 ID = -892638494;

  inputPeerNotifySettings() = default;

  explicit inputPeerNotifySettings(TlParser &parser);

  int32 get_flags() const;

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

}  // namespace telegram_api
}  // namespace mtk
