//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/tl/tl_parsers.h"
#include "mtk/tl/TlUnion.h"

#include "mtk/utils/common.h"
#include "mtk/utils/optional.h"
#include "mtk/utils/Slice.h"

namespace mtk {
namespace telegram_api {

class starsSubscriptionPricing {
 public:
  int32 period_ = 0;
  int64 amount_ = 0;

  static constexpr int32 ID = 88173912;

  starsSubscriptionPricing() = default;

  explicit starsSubscriptionPricing(TlParser &parser);
};

class chatInviteExported {
 public:
  int32 flags_ = 0;
  bool revoked_ = false;
  bool permanent_ = false;
  bool request_needed_ = false;
  string link_;
  int64 admin_id_ = 0;
  int32 date_ = 0;
  optional<int32> start_date_;
  optional<int32> expire_date_;
  optional<int32> usage_limit_;
  optional<int32> usage_;
  optional<int32> requested_;
  optional<int32> subscription_expired_;
  optional<string> title_;
  optional<starsSubscriptionPricing> subscription_pricing_;

  static constexpr int32 ID = -1574126186;

  chatInviteExported() = default;

  explicit chatInviteExported(TlParser &parser);
};

class chatInvitePublicJoinRequests {
 public:
  static constexpr int32 ID = -317687113;

  chatInvitePublicJoinRequests() = default;

  explicit chatInvitePublicJoinRequests(TlParser &parser);
};

class ExportedChatInvite final
    : public TlUnion<ExportedChatInvite, chatInviteExported, chatInvitePublicJoinRequests> {
 public:
  using TlUnion::TlUnion;

  static Slice type_name() {
    return Slice("ExportedChatInvite");
  }
};

}  // namespace telegram_api
}  // namespace mtk
