//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/Random.h"

#if MTK_HAVE_OPENSSL
#include "mtk/utils/logging.h"

#include <openssl/rand.h>

#include <limits>
#endif

namespace mtk {

#if MTK_HAVE_OPENSSL
void Random::secure_bytes(MutableSlice dest) {
  Random::secure_bytes(dest.ubegin(), dest.size());
}

void Random::secure_bytes(unsigned char *ptr, size_t size) {
  while (size > 0) {
    auto chunk = min(size, static_cast<size_t>(std::numeric_limits<int>::max()));
    int err = RAND_bytes(ptr, static_cast<int>(chunk));
    LOG_IF(FATAL, err != 1) << "RAND_bytes failed";
    ptr += chunk;
    size -= chunk;
  }
}
#endif

}  // namespace mtk
