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
#include "mtk/utils/StringBuilder.h"

namespace mtk {

// Error kinds are carried as Status error codes
enum class ErrorKind : int32 {
  None = 0,
  UnknownConstructor = 1,
  UnexpectedEnd = 2,
  Deserialize = 3,
  InvalidKeySize = 4,
  DataTooLarge = 5,
  EncryptionFailed = 6,
  DecryptionFailed = 7,
  InvalidSignature = 8,
  NotImplemented = 9,
  KeyDecode = 10,
  KeyEncode = 11,
  KeyNotFound = 12,
  OperationFailed = 13
};

Slice get_error_kind_name(ErrorKind kind);

StringBuilder &operator<<(StringBuilder &sb, ErrorKind kind);

Status create_error(ErrorKind kind, Slice message);

// returns ErrorKind::None for OK statuses and for codes outside of the taxonomy
ErrorKind get_error_kind(const Status &status);

inline bool is_error_kind(const Status &status, ErrorKind kind) {
  return status.is_error() && get_error_kind(status) == kind;
}

Status unexpected_end_error(size_t offset);

Status invalid_key_size_error(int bits);

Status data_too_large_error(size_t actual, size_t max);

Status not_implemented_error(Slice operation);

}  // namespace mtk
