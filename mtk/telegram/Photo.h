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

class photoSizeEmpty {
 public:
  string type_;

  static constexpr int32 ID = 236446268;

  photoSizeEmpty() = default;

  explicit photoSizeEmpty(TlParser &parser);
};

class photoSize {
 public:
  string type_;
  int32 w_ = 0;
  int32 h_ = 0;
  int32 size_ = 0;

  static constexpr int32 ID = 1976012384;

  photoSize() = default;

  photoSize(string type, int32 w, int32 h, int32 size);

  explicit photoSize(TlParser &parser);
};

class photoCachedSize {
 public:
  string type_;
  int32 w_ = 0;
  int32 h_ = 0;
  string bytes_;

  static constexpr int32 ID = 35527382;

  photoCachedSize() = default;

  explicit photoCachedSize(TlParser &parser);
};

class photoStrippedSize {
 public:
  string type_;
  string bytes_;

  static constexpr int32 ID = -525288402;

  photoStrippedSize() = default;

  explicit photoStrippedSize(TlParser &parser);
};

class photoSizeProgressive {
 public:
  string type_;
  int32 w_ = 0;
  int32 h_ = 0;
  vector<int32> sizes_;

  static constexpr int32 ID = -96535659;
  static constexpr int32 MAX_SIZES = 50;

  photoSizeProgressive() = default;

  explicit photoSizeProgressive(TlParser &parser);
};

class photoPathSize {
 public:
  string type_;
  string bytes_;

  static constexpr int32 ID = -668906175;

  photoPathSize() = default;

  explicit photoPathSize(TlParser &parser);
};

class PhotoSize final : public TlUnion<PhotoSize, photoSizeEmpty, photoSize, photoCachedSize, photoStrippedSize,
                                       photoSizeProgressive, photoPathSize> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("PhotoSize");
  }

  Slice get_type() const;
};

class inputStickerSetEmpty {
 public:
  static constexpr int32 ID = -4838507;

  inputStickerSetEmpty() = default;

  explicit inputStickerSetEmpty(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputStickerSetID {
 public:
  int64 id_ = 0;
  int64 access_hash_ = 0;

  static constexpr int32 ID = -1645763991;

  inputStickerSetID() = default;

  inputStickerSetID(int64 id, int64 access_hash);

  explicit inputStickerSetID(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class inputStickerSetShortName {
 public:
  string short_name_;

  static constexpr int32 ID = -2044933984;

  inputStickerSetShortName() = default;

  explicit inputStickerSetShortName(string short_name);

  explicit inputStickerSetShortName(TlParser &parser);

  void store(TlStorerUnsafe &s) const;

  void store(TlStorerCalcLength &s) const;
};

class InputStickerSet final
    : public TlUnion<InputStickerSet, inputStickerSetEmpty, inputStickerSetID, inputStickerSetShortName> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("InputStickerSet");
  }
};

class videoSize {
 public:
  int32 flags_ = 0;
  string type_;
  int32 w_ = 0;
  int32 h_ = 0;
  int32 size_ = 0;
  optional<double> video_start_ts_;

  static constexpr int32 ID = -567037804;

  videoSize() = default;

  explicit videoSize(TlParser &parser);
};

class videoSizeEmojiMarkup {
 public:
  int64 emoji_id_ = 0;
  vector<int32> background_colors_;

  static constexpr int32 ID = -128171716;
  static constexpr int32 MAX_BACKGROUND_COLORS = 4;

  videoSizeEmojiMarkup() = default;

  explicit videoSizeEmojiMarkup(TlParser &parser);
};

class videoSizeStickerMarkup {
 public:
  InputStickerSet stickerset_;
  int64 sticker_id_ = 0;
  vector<int32> background_colors_;

  static constexpr int32 ID = 228623102;
  static constexpr int32 MAX_BACKGROUND_COLORS = 4;

  videoSizeStickerMarkup() = default;

  explicit videoSizeStickerMarkup(TlParser &parser);
};

class VideoSize final : public TlUnion<VideoSize, videoSize, videoSizeEmojiMarkup, videoSizeStickerMarkup> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("VideoSize");
  }
};

class photoEmpty {
 public:
  int64 id_ = 0;

  static constexpr int32 ID = 590459437;

  photoEmpty() = default;

  explicit photoEmpty(TlParser &parser);
};

class photo {
 public:
  int32 flags_ = 0;
  bool has_stickers_ = false;
  int64 id_ = 0;
  int64 access_hash_ = 0;
  string file_reference_;
  int32 date_ = 0;
  vector<PhotoSize> sizes_;
  optional<vector<VideoSize>> video_sizes_;
  int32 dc_id_ = 0;

  static constexpr int32 ID = -82216347;
  static constexpr int32 MAX_SIZES = 100;
  static constexpr int32 MAX_VIDEO_SIZES = 100;

  photo() = default;

  explicit photo(TlParser &parser);
};

class Photo final : public TlUnion<Photo, photoEmpty, photo> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("Photo");
  }

  int64 get_photo_id() const;
};

}  // namespace telegram_api
}  // namespace mtk
