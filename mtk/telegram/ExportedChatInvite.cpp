//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/telegram/ExportedChatInvite.h"

#include "mtk/tl/tl_object_parse.h"
#include "mtk/tl/TlFlags.h"

namespace mtk {
namespace telegram_api {

constexpr int32 starsSubscriptionPricing::ID;

starsSubscriptionPricing::starsSubscriptionPricing(TlParser &parser)
    : period_(TlFetchInt::parse(parser)), amount_(TlFetchLong::parse(parser)) {
}

constexpr int32 chatInviteExported::ID;

chatInviteExported::chatInviteExported(TlParser &parser) {
  TlFlags flags(TlFetchInt::parse(parser));
  flags_ = flags.get();
  revoked_ = flags.has(0);
  permanent_ = flags.has(5);
  request_needed_ = flags.has(6);
  link_ = TlFetchString<string>::parse(parser);
  admin_id_ = TlFetchLong::parse(parser);
  date_ = TlFetchInt::parse(parser);
  start_date_ = flags.fetch_if<TlFetchInt>(4, parser);
  expire_date_ = flags.fetch_if<TlFetchInt>(1, parser);
  usage_limit_ = flags.fetch_if<TlFetchInt>(2, parser);
  usage_ = flags.fetch_if<TlFetchInt>(3, parser);
  requested_ = flags.fetch_if<TlFetchInt>(7, parser);
  subscription_expired_ = flags.fetch_if<TlFetchInt>(10, parser);
  title_ = flags.fetch_if<TlFetchString<string>>(8, parser);
  subscription_pricing_ =
      flags.fetch_if<TlFetchBoxed<TlFetchObject<starsSubscriptionPricing>, starsSubscriptionPricing::ID>>(9, parser);
}

constexpr int32 chatInvitePublicJoinRequests::ID;

chatInvitePublicJoinRequests::chatInvitePublicJoinRequests(TlParser &/*parser*/) {
}

}  // namespace telegram_api
}  // namespace mtk
