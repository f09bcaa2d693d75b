//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/tl/tl_parsers.h"

#include "mtk/utils/SliceBuilder.h"

namespace mtk {

int VERBOSITY_NAME(tl_message) = VERBOSITY_NAME(DEBUG);

alignas(8) const unsigned char TlParser::empty_data_[16] = {};

constexpr int32 TlParser::MAX_NESTING_DEPTH;

TlParser::TlParser(Slice slice) : data_(slice.ubegin()), data_len_(slice.size()), left_len_(slice.size()) {
  if (data_ == nullptr) {
    data_ = empty_data_;
  }
}

void TlParser::set_error(Status error) {
  CHECK(error.is_error());
  if (error_.is_ok()) {
    error_pos_ = get_offset();
    error_ = std::move(error);
    VLOG(tl_message) << "TL parse error at offset " << error_pos_ << ": " << error_;
    left_len_ = 0;
    data_len_ = error_pos_;
  } else {
    LOG_CHECK(error_pos_ != std::numeric_limits<size_t>::max() && left_len_ == 0)
        << error_pos_ << ' ' << left_len_ << ' ' << error_;
  }
  data_ = empty_data_;
}

void TlParser::set_error(ErrorKind kind, Slice message) {
  if (has_error()) {
    data_ = empty_data_;
    return;
  }
  set_error(create_error(kind, PSLICE() << message << " at offset " << get_offset()));
}

Status TlParser::get_status() const {
  return error_.clone();
}

void TlParser::fetch_end() {
  if (left_len_) {
    set_error(ErrorKind::Deserialize, PSLICE() << "Too much data to fetch: " << left_len_ << " bytes left");
  }
}

bool TlParser::enter_nested() {
  if (nesting_depth_ >= MAX_NESTING_DEPTH) {
    set_error(ErrorKind::Deserialize, PSLICE() << "Nesting depth exceeds " << MAX_NESTING_DEPTH);
    return false;
  }
  nesting_depth_++;
  return true;
}

}  // namespace mtk
