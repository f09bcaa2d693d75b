//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/mtproto/RSA.h"

#include "mtk/utils/common.h"
#include "mtk/utils/Status.h"

#include <memory>

namespace mtk {

// Immutable set of the built-in server keys of the production or the test environment
class PublicRsaKeySharedMain final : public mtproto::PublicRsaKeyInterface {
 public:
  explicit PublicRsaKeySharedMain(vector<RsaKey> &&keys) : keys_(std::move(keys)) {
  }

  // the same table is returned on every call
  static std::shared_ptr<PublicRsaKeySharedMain> create(bool is_test);

  Result<RsaKey> get_rsa_key(const vector<int64> &fingerprints) final;

  void drop_keys() final;

  vector<int64> get_fingerprints() const;

 private:
  vector<RsaKey> keys_;
};

}  // namespace mtk
