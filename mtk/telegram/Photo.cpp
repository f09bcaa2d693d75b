//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/Photo.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/tl_object_store.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

constexpr int32 photoSizeEmpty::ID;

photoSizeEmpty::photoSizeEmpty(TlParser &parser) : type_(TlFetchString<string>::parse(parser)) {
}

constexpr int32 photoSize::ID;

photoSize::photoSize(string type, int32 w, int32 h, int32 size) : type_(std::move(type)), w_(w), h_(h), size_(size) {
}

photoSize::photoSize(TlParser &parser)
    : type_(TlFetchString<string>::parse(parser))
    , w_(TlFetchInt::parse(parser))
    , h_(TlFetchInt::parse(parser))
    , size_(TlFetchInt::parse(parser)) {
}

constexpr int32 photoCachedSize::ID;

photoCachedSize::photoCachedSize(TlParser &parser)
    : type_(TlFetchString<string>::parse(parser))
    , w_(TlFetchInt::parse(parser))
    , h_(TlFetchInt::parse(parser))
    , bytes_(TlFetchBytes<string>::parse(parser)) {
}

constexpr int32 photoStrippedSize::ID;

photoStrippedSize::photoStrippedSize(TlParser &parser)
    : type_(TlFetchString<string>::parse(parser)), bytes_(TlFetchBytes<string>::parse(parser)) {
}

constexpr int32 photoSizeProgressive::ID;

photoSizeProgressive::photoSizeProgressive(TlParser &parser)
    : type_(TlFetchString<string>::parse(parser))
    , w_(TlFetchInt::parse(parser))
    , h_(TlFetchInt::parse(parser))
    , sizes_(TlFetchBoundedVector<TlFetchInt, MAX_SIZES>::parse(parser)) {
}

constexpr int32 photoPathSize::ID;

photoPathSize::photoPathSize(TlParser &parser)
    : type_(TlFetchString<string>::parse(parser)), bytes_(TlFetchBytes<string>::parse(parser)) {
}

Slice PhotoSize::get_type() const {
  Slice result;
  visit([&result](const auto &size) { result = size.type_; });
  return result;
}

constexpr int32 inputStickerSetEmpty::ID;

inputStickerSetEmpty::inputStickerSetEmpty(TlParser &/*parser*/) {
}

void inputStickerSetEmpty::store(TlStorerUnsafe &/*s*/) const {
}

void inputStickerSetEmpty::store(TlStorerCalcLength &/*s*/) const {
}

constexpr int32 inputStickerSetID::ID;

inputStickerSetID::inputStickerSetID(int64 id, int64 access_hash) : id_(id), access_hash_(access_hash) {
}

inputStickerSetID::inputStickerSetID(TlParser &parser)
    : id_(TlFetchLong::parse(parser)), access_hash_(TlFetchLong::parse(parser)) {
}

void inputStickerSetID::store(TlStorerUnsafe &s) const {
  TlStoreBinary::store(id_, s);
  TlStoreBinary::store(access_hash_, s);
}

void inputStickerSetID::store(TlStorerCalcLength &s) const {
  TlStoreBinary::store(id_, s);
  TlStoreBinary::store(access_hash_, s);
}

constexpr int32 inputStickerSetShortName::ID;

inputStickerSetShortName::inputStickerSetShortName(string short_name) : short_name_(std::move(short_name)) {
}

inputStickerSetShortName::inputStickerSetShortName(TlParser &parser)
    : short_name_(TlFetchString<string>::parse(parser)) {
}

void inputStickerSetShortName::store(TlStorerUnsafe &s) const {
  TlStoreString::store(short_name_, s);
}

void inputStickerSetShortName::store(TlStorerCalcLength &s) const {
  TlStoreString::store(short_name_, s);
}

constexpr int32 videoSize::ID;

videoSize::videoSize(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  type_ = TlFetchString<string>::parse(parser);
  w_ = TlFetchInt::parse(parser);
  h_ = TlFetchInt::parse(parser);
  size_ = TlFetchInt::parse(parser);
  video_start_ts_ = flags.fetch_if<TlFetchDouble>(0, parser);
}

constexpr int32 videoSizeEmojiMarkup::ID;

videoSizeEmojiMarkup::videoSizeEmojiMarkup(TlParser &parser)
    : emoji_id_(TlFetchLong::parse(parser))
    , background_colors_(TlFetchBoundedVector<TlFetchInt, MAX_BACKGROUND_COLORS>::parse(parser)) {
}

constexpr int32 videoSizeStickerMarkup::ID;

videoSizeStickerMarkup::videoSizeStickerMarkup(TlParser &parser)
    : stickerset_(TlFetchObject<InputStickerSet>::parse(parser))
    , sticker_id_(TlFetchLong::parse(parser))
    , background_colors_(TlFetchBoundedVector<TlFetchInt, MAX_BACKGROUND_COLORS>::parse(parser)) {
}

constexpr int32 photoEmpty::ID;

photoEmpty::photoEmpty(TlParser &parser) : id_(TlFetchLong::parse(parser)) {
}

constexpr int32 photo::ID;

photo::photo(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  has_stickers_ = flags.has(0);
  id_ = TlFetchLong::parse(parser);
  access_hash_ = TlFetchLong::parse(parser);
  file_reference_ = TlFetchBytes<string>::parse(parser);
  date_ = TlFetchInt::parse(parser);
  sizes_ = TlFetchBoundedVector<TlFetchObject<PhotoSize>, MAX_SIZES>::parse(parser);
  video_sizes_ = flags.fetch_if<TlFetchBoundedVector<TlFetchObject<VideoSize>, MAX_VIDEO_SIZES>>(1, parser);
  dc_id_ = TlFetchInt::parse(parser);
}

int64 Photo::get_photo_id() const {
  if (is<photo>()) {
    return get<photo>().id_;
  }
  return get<photoEmpty>().id_;
}

}  // namespace telegram_api
}  // namespace mtk
