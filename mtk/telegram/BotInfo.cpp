//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/BotInfo.h"

#include "mtk/tl/ErrorKind.h"
#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/TlFlags.h"

#include "mtk/utils/SliceBuilder.h"

namespace mtk {
namespace telegram_api {

namespace {

void reject_unsupported_field(const TlFlags &flags, int bit, Slice field_name, TlParser &parser) {
  if (flags.has(bit) && !parser.has_error()) {
    parser.set_error(ErrorKind::Deserialize, PSLICE() << "Unsupported field " << field_name << " of botInfo");
  }
}

}  // namespace

constexpr int32 botCommand::ID;

botCommand::botCommand(TlParser &parser)
    : command_(TlFetchString<string>::parse(parser)), description_(TlFetchString<string>::parse(parser)) {
}

constexpr int32 botMenuButtonDefault::ID;

botMenuButtonDefault::botMenuButtonDefault(TlParser &/*parser*/) {
}

constexpr int32 botMenuButtonCommands::ID;

botMenuButtonCommands::botMenuButtonCommands(TlParser &/*parser*/) {
}

constexpr int32 botMenuButton::ID;

botMenuButton::botMenuButton(TlParser &parser)
    : text_(TlFetchString<string>::parse(parser)), url_(TlFetchString<string>::parse(parser)) {
}

constexpr int32 botInfo::ID;

botInfo::botInfo(TlParser &parser) {
  using FetchCommands = TlFetchBoundedVector<TlFetchBoxed<TlFetchObject<botCommand>, botCommand::ID>, MAX_COMMANDS>;
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  has_preview_medias_ = flags.has(6);
  user_id_ = flags.fetch_if<TlFetchLong>(0, parser);
  description_ = flags.fetch_if<TlFetchString<string>>(1, parser);
  description_photo_ = flags.fetch_if<TlFetchObject<Photo>>(4, parser);
  reject_unsupported_field(flags, 5, "description_document", parser);
  commands_ = flags.fetch_if<FetchCommands>(2, parser);
  menu_button_ = flags.fetch_if<TlFetchObject<BotMenuButton>>(3, parser);
  privacy_policy_url_ = flags.fetch_if<TlFetchString<string>>(7, parser);
  reject_unsupported_field(flags, 8, "app_settings", parser);
  reject_unsupported_field(flags, 9, "verifier_settings", parser);
}

}  // namespace telegram_api
}  // namespace mtk
