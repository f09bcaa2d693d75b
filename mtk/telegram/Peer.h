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
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class peerUser {
 public:
  int64 user_id_ = 0;

  static constexpr int32 ID = 1498486562;

  peerUser() = default;

  explicit peerUser(int64 user_id);

  explicit peerUser(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class peerChat {
 public:
  int64 chat_id_ = 0;

  static constexpr int32 ID = 918946202;

  peerChat() = default;

  explicit peerChat(int64 chat_id);

  explicit peerChat(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class peerChannel {
 public:
  int64 channel_id_ = 0;

  static constexpr int32 ID = -1566230754;

  peerChannel() = default;

  explicit peerChannel(int64 channel_id);

  explicit peerChannel(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class Peer final : public TlUnion<Peer, peerUser, peerChat, peerChannel> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("Peer");
  }

  // identifier of the user, the chat or the channel
  int64 get_peer_id() const;
};

class InputPeer;

class inputPeerEmpty {
 public:
  static constexpr int32 ID = 2134579434;

  inputPeerEmpty() = default;

  explicit inputPeerEmpty(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputPeerSelf {
 public:
  static constexpr int32 ID = 2107670217;

  inputPeerSelf() = default;

  explicit inputPeerSelf(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputPeerChat {
 public:
  int64 chat_id_ = 0;

  static constexpr int32 ID = 900291769;

  inputPeerChat() = default;

  explicit inputPeerChat(int64 chat_id);

  explicit inputPeerChat(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputPeerUser {
 public:
  int64 user_id_ = 0;
  int64 access_hash_ = 0;

  static constexpr int32 ID = -571955892;

  inputPeerUser() = default;

  inputPeerUser(int64 user_id, int64 access_hash);

  explicit inputPeerUser(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputPeerChannel {
 public:
  int64 channel_id_ = 0;
  int64 access_hash_ = 0;

  static constexpr int32 ID = 666680316;

  inputPeerChannel() = default;

  inputPeerChannel(int64 channel_id, int64 access_hash);

  explicit inputPeerChannel(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

// a user known only from message msg_id in the chat peer
class inputPeerUserFromMessage {
 public:
  unique_ptr<InputPeer> peer_;
  int32 msg_id_ = 0;
  int64 user_id_ = 0;

  static constexpr int32 ID = -1468331492;

  inputPeerUserFromMessage();

  inputPeerUserFromMessage(InputPeer &&peer, int32 msg_id, int64 user_id);

  explicit inputPeerUserFromMessage(TlParser &parser);

  inputPeerUserFromMessage(inputPeerUserFromMessage &&other) noexcept;
  inputPeerUserFromMessage &operator=(inputPeerUserFromMessage &&other) noexcept;
  ~inputPeerUserFromMessage();

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

// a channel known only from message msg_id in the chat peer
class inputPeerChannelFromMessage {
 public:
  unique_ptr<InputPeer> peer_;
  int32 msg_id_ = 0;
  int64 channel_id_ = 0;

  static constexpr int32 ID = -1121318848;

  inputPeerChannelFromMessage();

  inputPeerChannelFromMessage(InputPeer &&peer, int32 msg_id, int64 channel_id);

  explicit inputPeerChannelFromMessage(TlParser &parser);

  inputPeerChannelFromMessage(inputPeerChannelFromMessage &&other) noexcept;
  inputPeerChannelFromMessage &operator=(inputPeerChannelFromMessage &&other) noexcept;
  ~inputPeerChannelFromMessage();

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class InputPeer final
    : public TlUnion<InputPeer, inputPeerEmpty, inputPeerSelf, inputPeerChat, inputPeerUser, inputPeerChannel,
                     inputPeerUserFromMessage, inputPeerChannelFromMessage> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("InputPeer");
  }
};

}  // namespace telegram_api
}  // namespace mtk
