//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#pragma once

#include "mtk/utils/common.h"
#include "mtk/utils/Slice.h"
#include "mtk/utils/Status.h"

namespace mtk {

#if MTK_HAVE_OPENSSL

void init_crypto();

void sha1(Slice data, unsigned char output[20]);

string sha1(Slice data);

void sha256(Slice data, MutableSlice output);

string sha256(Slice data);

// consumes the thread's OpenSSL error queue
Status create_openssl_error(int code, Slice message);

void clear_openssl_errors(Slice source);

#endif

}  // namespace mtk
