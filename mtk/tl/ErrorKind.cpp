//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/tl/ErrorKind.h"

#include "mtk/utils/SliceBuilder.h"

namespace mtk {

Slice get_error_kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:
      return Slice("None");
    case ErrorKind::UnknownConstructor:
      return Slice("UnknownConstructor");
    case ErrorKind::UnexpectedEnd:
      return Slice("UnexpectedEnd");
    case ErrorKind::Deserialize:
      return Slice("Deserialize");
    case ErrorKind::InvalidKeySize:
      return Slice("InvalidKeySize");
    case ErrorKind::DataTooLarge:
      return Slice("DataTooLarge");
    case ErrorKind::EncryptionFailed:
      return Slice("EncryptionFailed");
    case ErrorKind::DecryptionFailed:
      return Slice("DecryptionFailed");
    case ErrorKind::InvalidSignature:
      return Slice("InvalidSignature");
    case ErrorKind::NotImplemented:
      return Slice("NotImplemented");
    case ErrorKind::KeyDecode:
      return Slice("KeyDecode");
    case ErrorKind::KeyEncode:
      return Slice("KeyEncode");
    case ErrorKind::KeyNotFound:
      return Slice("KeyNotFound");
    case ErrorKind::OperationFailed:
      return Slice("OperationFailed");
    default:
      UNREACHABLE();
      return Slice();
  }
}

StringBuilder &operator<<(StringBuilder &sb, ErrorKind kind) {
  return sb << get_error_kind_name(kind);
}

Status create_error(ErrorKind kind, Slice message) {
  CHECK(kind != ErrorKind::None);
  return Status::Error(static_cast<int32>(kind), message);
}

ErrorKind get_error_kind(const Status &status) {
  if (status.is_ok()) {
    return ErrorKind::None;
  }
  auto code = status.code();
  if (code < static_cast<int32>(ErrorKind::UnknownConstructor) || code > static_cast<int32>(ErrorKind::OperationFailed)) {
    return ErrorKind::None;
  }
  return static_cast<ErrorKind>(code);
}

Status unexpected_end_error(size_t offset) {
  return create_error(ErrorKind::UnexpectedEnd, PSLICE() << "Not enough data to read at offset " << offset);
}

Status invalid_key_size_error(int bits) {
  return create_error(ErrorKind::InvalidKeySize, PSLICE() << "Invalid RSA key size " << bits);
}

Status data_too_large_error(size_t actual, size_t max) {
  return create_error(ErrorKind::DataTooLarge, PSLICE() << "Data too large: " << actual << " > " << max);
}

Status not_implemented_error(Slice operation) {
  return create_error(ErrorKind::NotImplemented, PSLICE() << operation << " is not implemented");
}

}  // namespace mtk
