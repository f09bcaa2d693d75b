//
// Copyright Aliaksei Levin (levlam@telegram.org), Arseny Smirnov (arseny30@gmail.com) 2014-2025
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
#include "mtk/utils/logging.h"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <mutex>

namespace mtk {

LogOptions log_options;

Logger::Logger(LogInterface &log, const LogOptions &options, int log_level, Slice file_name, int line_num,
               Slice comment)
    : Logger(log, options, log_level) {
  if (log_level == VERBOSITY_NAME(PLAIN) && &options == &log_options) {
    return;
  }
  if (!options_.add_info) {
    return;
  }

  // log level
  sb_ << '[';
  if (static_cast<unsigned int>(log_level) < 10) {
    sb_ << ' ' << static_cast<char>('0' + log_level);
  } else {
    sb_ << log_level;
  }
  sb_ << ']';

  // timestamp
  auto now = std::chrono::system_clock::now().time_since_epoch();
  auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
  auto unix_time = static_cast<uint64>(nanoseconds / 1000000000);
  auto fraction = static_cast<uint32>(nanoseconds % 1000000000);
  sb_ << '[' << unix_time << '.';
  uint32 limit = 100000000;
  while (fraction < limit && limit > 1) {
    sb_ << '0';
    limit /= 10;
  }
  sb_ << fraction << ']';

  // file : line
  if (!file_name.empty()) {
    auto last_slash = static_cast<int32>(file_name.size()) - 1;
    while (last_slash >= 0 && file_name[last_slash] != '/' && file_name[last_slash] != '\\') {
      last_slash--;
    }
    file_name = file_name.substr(last_slash + 1);
    sb_ << '[' << file_name << ':' << static_cast<unsigned int>(line_num) << ']';
  }

  // comment (e.g. condition in LOG_IF)
  if (!comment.empty()) {
    sb_ << "[&" << comment << ']';
  }

  sb_ << '\t';
}

Logger::~Logger() {
  if (options_.fix_newlines) {
    sb_ << '\n';
    auto slice = as_cslice();
    if (slice.back() != '\n') {
      slice.back() = '\n';
    }
    while (slice.size() > 1 && slice[slice.size() - 2] == '\n') {
      slice.back() = '\0';
      slice = MutableCSlice(slice.begin(), slice.begin() + slice.size() - 1);
    }
    log_.append(slice, log_level_);
  } else {
    log_.append(as_cslice(), log_level_);
  }
}

namespace {

std::mutex &stderr_mutex() {
  static std::mutex mutex;
  return mutex;
}

void write_stderr(Slice slice) {
  std::lock_guard<std::mutex> guard(stderr_mutex());
  std::fwrite(slice.data(), 1, slice.size(), stderr);
  std::fflush(stderr);
}

}  // namespace

class DefaultLog final : public LogInterface {
 public:
  void append(CSlice slice, int log_level) final {
    Slice color;
    switch (log_level) {
      case VERBOSITY_NAME(FATAL):
      case VERBOSITY_NAME(ERROR):
        color = Slice(TC_RED);
        break;
      case VERBOSITY_NAME(WARNING):
        color = Slice(TC_YELLOW);
        break;
      case VERBOSITY_NAME(INFO):
        color = Slice(TC_CYAN);
        break;
      default:
        break;
    }
    if (color.empty()) {
      write_stderr(slice);
    } else {
      StringBuilder sb;
      if (!slice.empty() && slice.back() == '\n') {
        sb << color << Slice(slice).substr(0, slice.size() - 1) << TC_EMPTY "\n";
      } else {
        sb << color << slice << TC_EMPTY;
      }
      write_stderr(sb.as_cslice());
    }
    if (log_level == VERBOSITY_NAME(FATAL)) {
      process_fatal_error(slice);
    }
  }
};
static DefaultLog default_log;

LogInterface *const default_log_interface = &default_log;
LogInterface *log_interface = default_log_interface;

void process_fatal_error(CSlice message) {
  std::abort();
}

namespace {
std::mutex sdl_mutex;
int sdl_cnt = 0;
int sdl_verbosity = 0;
}  // namespace

ScopedDisableLog::ScopedDisableLog() {
  std::unique_lock<std::mutex> guard(sdl_mutex);
  if (sdl_cnt == 0) {
    sdl_verbosity = set_verbosity_level(std::numeric_limits<int>::min());
  }
  sdl_cnt++;
}

ScopedDisableLog::~ScopedDisableLog() {
  std::unique_lock<std::mutex> guard(sdl_mutex);
  sdl_cnt--;
  if (sdl_cnt == 0) {
    set_verbosity_level(sdl_verbosity);
  }
}

}  // namespace mtk
