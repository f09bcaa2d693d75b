//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/telegram/Photo.h"

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class botCommand {
 public:
  string command_;
  string description_;

  static constexpr int32 ID = -1032140601;

  botCommand() = default;

  explicit botCommand(TlParser &parser);
};

class botMenuButtonDefault {
 public:
  static constexpr int32 ID = 1966318984;

  botMenuButtonDefault() = default;

  explicit botMenuButtonDefault(TlParser &parser);
};

class botMenuButtonCommands {
 public:
  static constexpr int32 ID = 1113113093;

  botMenuButtonCommands() = default;

  explicit botMenuButtonCommands(TlParser &parser);
};

class botMenuButton {
 public:
  string text_;
  string url_;

  static constexpr int32 ID = -944407322;

  botMenuButton() = default;

  explicit botMenuButton(TlParser &parser);
};

class BotMenuButton final
    : public TlUnion<BotMenuButton, botMenuButtonDefault, botMenuButtonCommands, botMenuButton> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("BotMenuButton");
  }
};

// botInfo#4d8a0299; description_document, app_settings and verifier_settings aren't supported
// and a message containing any of them is rejected
class botInfo {
 public:
  int32 flags_ = 0;
  bool has_preview_medias_ = false;
  optional<int64> user_id_;
  optional<string> description_;
  optional<Photo> description_photo_;
  optional<vector<botCommand>> commands_;
  optional<BotMenuButton> menu_button_;
  optional<string> privacy_policy_url_;

  static constexpr int32 ID = 1300890265;
  static constexpr int32 MAX_COMMANDS = 1000;

  botInfo() = default;

  explicit botInfo(TlParser &parser);
};

}  // namespace telegram_api
}  // namespace mtk
