//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/StringBuilder.h"

#include "mtk/utils/misc.h"

#include <cstdio>
#include <cstring>
#include <limits>
#include <utility>

namespace mtk {

StringBuilder::StringBuilder(MutableSlice slice, bool use_buffer)
    : begin_ptr_(slice.begin()), current_ptr_(begin_ptr_), use_buffer_(use_buffer) {
  if (slice.size() <= 1) {
    // the builder must always have room for the terminating zero
    buffer_ = std::make_unique<char[]>(RESERVED_SIZE + 1);
    begin_ptr_ = buffer_.get();
    current_ptr_ = begin_ptr_;
    end_ptr_ = begin_ptr_ + RESERVED_SIZE;
    use_buffer_ = true;
  } else {
    end_ptr_ = slice.end() - 1;
  }
}

bool StringBuilder::reserve_inner(size_t size) {
  if (!use_buffer_) {
    return false;
  }

  size_t old_data_size = this->size();
  if (size >= std::numeric_limits<size_t>::max() / 2 - old_data_size - 1) {
    return false;
  }
  size_t need_data_size = old_data_size + size;
  size_t old_buffer_size = static_cast<size_t>(end_ptr_ - begin_ptr_);
  size_t new_buffer_size = max(old_buffer_size * 2, need_data_size) + 1;
  auto new_buffer = std::make_unique<char[]>(new_buffer_size + 1);
  std::memcpy(new_buffer.get(), begin_ptr_, old_data_size);
  buffer_ = std::move(new_buffer);
  begin_ptr_ = buffer_.get();
  current_ptr_ = begin_ptr_ + old_data_size;
  end_ptr_ = begin_ptr_ + new_buffer_size;
  return true;
}

void StringBuilder::append_char(size_t count, char c) {
  if (unlikely(!reserve(count))) {
    on_error();
    return;
  }
  std::memset(current_ptr_, c, count);
  current_ptr_ += count;
}

StringBuilder &StringBuilder::operator<<(Slice slice) {
  size_t size = slice.size();
  if (unlikely(!reserve(size))) {
    if (end_ptr_ < current_ptr_) {
      return on_error();
    }
    auto available_size = static_cast<size_t>(end_ptr_ - current_ptr_);
    std::memcpy(current_ptr_, slice.begin(), available_size);
    current_ptr_ += available_size;
    return on_error();
  }
  std::memcpy(current_ptr_, slice.begin(), size);
  current_ptr_ += size;
  return *this;
}

template <class T>
static char *print_uint(char *current_ptr, T x) {
  if (x < 100) {
    if (x < 10) {
      *current_ptr++ = static_cast<char>('0' + x);
    } else {
      *current_ptr++ = static_cast<char>('0' + x / 10);
      *current_ptr++ = static_cast<char>('0' + x % 10);
    }
    return current_ptr;
  }

  auto begin_ptr = current_ptr;
  do {
    *current_ptr++ = static_cast<char>('0' + x % 10);
    x /= 10;
  } while (x > 0);

  auto end_ptr = current_ptr - 1;
  while (begin_ptr < end_ptr) {
    std::swap(*begin_ptr++, *end_ptr--);
  }

  return current_ptr;
}

template <class T>
static char *print_int(char *current_ptr, T x) {
  using UnsignedT = std::make_unsigned_t<T>;
  if (x < 0) {
    *current_ptr++ = '-';
    // negation in the unsigned type is well-defined for the minimal value too
    return print_uint(current_ptr, static_cast<UnsignedT>(0u - static_cast<UnsignedT>(x)));
  }
  return print_uint(current_ptr, static_cast<UnsignedT>(x));
}

StringBuilder &StringBuilder::operator<<(int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_int(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(unsigned int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_uint(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_int(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long unsigned int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_uint(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long long int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_int(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(long long unsigned int x) {
  if (unlikely(!reserve(RESERVED_SIZE))) {
    return on_error();
  }
  current_ptr_ = print_uint(current_ptr_, x);
  return *this;
}

StringBuilder &StringBuilder::operator<<(FixedDouble x) {
  char buf[512];
  int len = std::snprintf(buf, sizeof(buf), "%.*f", x.precision, x.d);
  if (len < 0) {
    return on_error();
  }
  if (static_cast<size_t>(len) >= sizeof(buf)) {
    on_error();
    len = static_cast<int>(sizeof(buf) - 1);
  }
  return *this << Slice(buf, narrow_cast<size_t>(len));
}

StringBuilder &StringBuilder::operator<<(const void *ptr) {
  char buf[RESERVED_SIZE];
  int len = std::snprintf(buf, sizeof(buf), "%p", ptr);
  if (len < 0 || static_cast<size_t>(len) >= sizeof(buf)) {
    return on_error();
  }
  return *this << Slice(buf, narrow_cast<size_t>(len));
}

}  // namespace mtk
