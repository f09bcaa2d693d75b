//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/Peer.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_object_store.h"

namespace mtk {
namespace telegram_api {

constexpr int32 peerUser::ID;

peerUser::peerUser(int64 user_id) : user_id_(user_id) {
}

peerUser::peerUser(TlParser &parser) : user_id_(TlFetchLong::parse(parser)) {
}

void peerUser::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(user_id_, s);
}

void peerUser::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(user_id_, s);
}

constexpr int32 peerChat::ID;

peerChat::peerChat(int64 chat_id) : chat_id_(chat_id) {
}

peerChat::peerChat(TlParser &parser) : chat_id_(TlFetchLong::parse(parser)) {
}

void peerChat::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(chat_id_, s);
}

void peerChat::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(chat_id_, s);
}

constexpr int32 peerChannel::ID;

peerChannel::peerChannel(int64 channel_id) : channel_id_(channel_id) {
}

peerChannel::peerChannel(TlParser &parser) : channel_id_(TlFetchLong::parse(parser)) {
}

void peerChannel::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(channel_id_, s);
}

void peerChannel::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(channel_id_, s);
}

int64 Peer::get_peer_id() const {
  int64 result = 0;
  switch (get_id()) {
    case peerUser::ID:
      result = get<peerUser>().user_id_;
      break;
    case peerChat::ID:
      result = get<peerChat>().chat_id_;
      break;
    case peerChannel::ID:
      result = get<peerChannel>().channel_id_;
      break;
    default:
      UNREACHABLE();
  }
  return result;
}

constexpr int32 inputPeerEmpty::ID;

inputPeerEmpty::inputPeerEmpty(TlParser &/*parser*/) {
}

void inputPeerEmpty::store(TlStorerUnsafe &/*s*/) const {
}

void inputPeerEmpty::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 inputPeerSelf::ID;

inputPeerSelf::inputPeerSelf(TlParser &/*parser*/) {
}

void inputPeerSelf::store(TlStorerUnsafe &/*s*/) const {
}

void inputPeerSelf::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 inputPeerChat::ID;

inputPeerChat::inputPeerChat(int64 chat_id) : chat_id_(chat_id) {
}

inputPeerChat::inputPeerChat(TlParser &parser) : chat_id_(TlFetchLong::parse(parser)) {
}

void inputPeerChat::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(chat_id_, s);
}

void inputPeerChat::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(chat_id_, s);
}

constexpr int32 inputPeerUser::ID;

inputPeerUser::inputPeerUser(int64 user_id, int64 access_hash) : user_id_(user_id), access_hash_(access_hash) {
}

inputPeerUser::inputPeerUser(TlParser &parser)
    : user_id_(TlFetchLong::parse(parser)), access_hash_(TlFetchLong::parse(parser)) {
}

void inputPeerUser::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(user_id_, s);
  TlStoreBinary::store(access_hash_, s);
}

void inputPeerUser::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(user_id_, s);
  TlStoreBinary::store(access_hash_, s);
}

constexpr int32 inputPeerChannel::ID;

inputPeerChannel::inputPeerChannel(int64 channel_id, int64 access_hash)
    : channel_id_(channel_id), access_hash_(access_hash) {
}

inputPeerChannel::inputPeerChannel(TlParser &parser)
    : channel_id_(TlFetchLong::parse(parser)), access_hash_(TlFetchLong::parse(parser)) {
}

void inputPeerChannel::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(channel_id_, s);
  TlStoreBinary::store(access_hash_, s);
}

void inputPeerChannel::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(channel_id_, s);
  TlStoreBinary::store(access_hash_, s);
}

namespace {

unique_ptr<InputPeer> fetch_nested_input_peer(TlParser &parser) {
  if (!parser.enter_nested()) {
    return nullptr;
  }
  auto peer = make_unique<InputPeer>(parser);
  parser.leave_nested();
  return peer;
}

template <class StorerT>
void store_nested_input_peer(const unique_ptr<InputPeer> &peer, StorerT &s) {
  CHECK(peer != nullptr);
  peer->store(s);
}

}  // namespace

constexpr int32 inputPeerUserFromMessage::ID;

inputPeerUserFromMessage::inputPeerUserFromMessage() = default;

inputPeerUserFromMessage::inputPeerUserFromMessage(InputPeer &&peer, int32 msg_id, int64 user_id)
    : peer_(make_unique<InputPeer>(std::move(peer))), msg_id_(msg_id), user_id_(user_id) {
}

inputPeerUserFromMessage::inputPeerUserFromMessage(TlParser &parser)
    : peer_(fetch_nested_input_peer(parser))
    , msg_id_(TlFetchInt::parse(parser))
    , user_id_(TlFetchLong::parse(parser)) {
}

inputPeerUserFromMessage::inputPeerUserFromMessage(inputPeerUserFromMessage &&other) noexcept = default;
inputPeerUserFromMessage &inputPeerUserFromMessage::operator=(inputPeerUserFromMessage &&other) noexcept = default;
inputPeerUserFromMessage::~inputPeerUserFromMessage() = default;

void inputPeerUserFromMessage::store(TlStorerUnsafe &s) const {
  store_nested_input_peer(peer_, s);
  TlStoreBinary::store(msg_id_, s);
  TlStoreBinary::store(user_id_, s);
}

void inputPeerUserFromMessage::store(TlStorerCalcLength &s) const {
  store_nested_input_peer(peer_, s);
  TlStoreBinary::store(msg_id_, s);
  TlStoreBinary::store(user_id_, s);
}

constexpr int32 inputPeerChannelFromMessage::ID;

inputPeerChannelFromMessage::inputPeerChannelFromMessage() = default;

inputPeerChannelFromMessage::inputPeerChannelFromMessage(InputPeer &&peer, int32 msg_id, int64 channel_id)
    : peer_(make_unique<InputPeer>(std::move(peer))), msg_id_(msg_id), channel_id_(channel_id) {
}

inputPeerChannelFromMessage::inputPeerChannelFromMessage(TlParser &parser)
    : peer_(fetch_nested_input_peer(parser))
    , msg_id_(TlFetchInt::parse(parser))
    , channel_id_(TlFetchLong::parse(parser)) {
}

inputPeerChannelFromMessage::inputPeerChannelFromMessage(inputPeerChannelFromMessage &&other) noexcept = default;
inputPeerChannelFromMessage &inputPeerChannelFromMessage::operator=(inputPeerChannelFromMessage &&other) noexcept =
    default;
inputPeerChannelFromMessage::~inputPeerChannelFromMessage() = default;

void inputPeerChannelFromMessage::store(TlStorerUnsafe &s) const {
  store_nested_input_peer(peer_, s);
  TlStoreBinary::store(msg_id_, s);
  TlStoreBinary::store(channel_id_, s);
}

void inputPeerChannelFromMessage::store(TlStorerCalcLength &s) const {
  store_nested_input_peer(peer_, s);
  TlStoreBinary::store(msg_id_, s);
  TlStoreBinary::store(channel_id_, s);
}

}  // namespace telegram_api
}  // namespace mtk
