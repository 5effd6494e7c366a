/*******************************************************************************
The MIT License (MIT)

Copyright (c) 2026 The Cordon Authors

Permission is hereby granted, free of charge, to any person obtaining a copy
of this software and associated documentation files (the "Software"), to deal
in the Software without restriction, including without limitation the rights
to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
copies of the Software, and to permit persons to whom the Software is
furnished to do so, subject to the following conditions:

The above copyright notice and this permission notice shall be included in all
copies or substantial portions of the Software.

THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
SOFTWARE.
*******************************************************************************/


// This file can not be named `time.h`, since it would interfere with C/C++ standard header.
//
// Trip timestamps are civil date-times without a time zone, as written in the source files.
// They are kept as microseconds since the epoch *as if* they were UTC, so that calendar fields extracted with
// `gmtime_r` are exactly the ones in the source, and no daylight-saving transition ever shifts an hour.

#ifndef CORDON_BRICKS_TIME_CHRONO_H
#define CORDON_BRICKS_TIME_CHRONO_H

#include "../../port.h"

#include <time.h>

#include <atomic>
#include <chrono>
#include <cstring>
#include <string>

#include "../strings/printf.h"
#include "../strings/util.h"
#include "../util/optional.h"
#include "../util/singleton.h"

namespace cordon {
namespace time {

// Since chrono::system_clock is not monotonic, and chrono::steady_clock is not guaranteed to be Epoch,
// use a simple wrapper around chrono::system_clock to make it strictly increasing.
struct EpochClockGuaranteeingMonotonicity {
  mutable std::atomic<int64_t> monotonic_now_us;

  EpochClockGuaranteeingMonotonicity() : monotonic_now_us(0ll) {}

  inline std::chrono::microseconds Now() const {
    int64_t now, previous_now;
    do {
      now = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::system_clock::now().time_since_epoch())
                .count();
      previous_now = monotonic_now_us.load();
      if (!(now > previous_now)) {
        now = previous_now + 1;
      }
    } while (!monotonic_now_us.compare_exchange_strong(previous_now, now));
    return std::chrono::microseconds(now);
  }
};

inline std::chrono::microseconds Now() { return Singleton<EpochClockGuaranteeingMonotonicity>().Now(); }

struct DateTimeFmts {
  constexpr static const char* Civil = "%Y-%m-%d %H:%M:%S";
  constexpr static const char* CivilWithT = "%Y-%m-%dT%H:%M:%S";
  constexpr static const char* Date = "%Y-%m-%d";
};

// Calendar fields of a civil timestamp. `weekday` is 0 for Sunday through 6 for Saturday.
struct CivilFields {
  int year = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  int weekday = 0;
};

inline CivilFields BreakDown(std::chrono::microseconds t) {
  // Floor division, so that pre-epoch timestamps with a fractional second land in the right second.
  int64_t seconds = t.count() / 1000000ll;
  if (t.count() % 1000000ll < 0) {
    --seconds;
  }
  const time_t tt = static_cast<time_t>(seconds);
  std::tm tm;
  ::gmtime_r(&tt, &tm);
  CivilFields result;
  result.year = tm.tm_year + 1900;
  result.month = tm.tm_mon + 1;
  result.day = tm.tm_mday;
  result.hour = tm.tm_hour;
  result.weekday = tm.tm_wday;
  return result;
}

// `timegm()` normalizes out-of-range fields, so `2024-02-30` would come back as `2024-03-01`.
// An input it would shift is not a valid time, and yields no value.
inline Optional<std::chrono::microseconds> FromCivilTm(std::tm tm) {
  const std::tm parsed = tm;
  tm.tm_isdst = 0;
  const time_t tt = ::timegm(&tm);
  std::tm check;
  if (!::gmtime_r(&tt, &check) || check.tm_year != parsed.tm_year || check.tm_mon != parsed.tm_mon ||
      check.tm_mday != parsed.tm_mday || check.tm_hour != parsed.tm_hour || check.tm_min != parsed.tm_min ||
      check.tm_sec != parsed.tm_sec) {
    return nullptr;
  }
  return std::chrono::microseconds(static_cast<int64_t>(tt) * 1000000ll);
}

}  // namespace time

inline std::string FormatDateTime(std::chrono::microseconds t, const char* format_string = time::DateTimeFmts::Civil) {
  const time_t tt = static_cast<time_t>(t.count() / 1000000ll);
  char buf[1025];
  std::tm tm;
  ::gmtime_r(&tt, &tm);
  if (std::strftime(buf, sizeof(buf), format_string, &tm)) {
    return buf;
  } else {
    return ToString(t.count()) + "us";
  }
}

// Parses `YYYY-MM-DD HH:MM:SS` (or with a `T` separator), optionally followed by a fractional second,
// which is dropped. Anything else, including an empty string, yields no value.
inline Optional<std::chrono::microseconds> ParseCivilDateTime(const std::string& input) {
  const std::string datetime = strings::Trim(input);
  if (datetime.empty()) {
    return nullptr;
  }
  const char* format_string =
      (datetime.length() > 10u && datetime[10] == 'T') ? time::DateTimeFmts::CivilWithT : time::DateTimeFmts::Civil;
  std::tm tm;
  std::memset(&tm, 0, sizeof(tm));
  const char* end = ::strptime(datetime.c_str(), format_string, &tm);
  if (!end) {
    return nullptr;
  }
  if (*end == '.') {
    ++end;
    while (*end >= '0' && *end <= '9') {
      ++end;
    }
  }
  if (*end) {
    return nullptr;
  }
  return time::FromCivilTm(tm);
}

// `YYYY-MM-DD` at midnight.
inline Optional<std::chrono::microseconds> ParseCivilDate(const std::string& input) {
  const std::string date = strings::Trim(input);
  std::tm tm;
  std::memset(&tm, 0, sizeof(tm));
  const char* end = ::strptime(date.c_str(), time::DateTimeFmts::Date, &tm);
  if (!end || *end || date.empty()) {
    return nullptr;
  }
  return time::FromCivilTm(tm);
}

inline std::string FormatYearMonth(int year, int month) { return strings::Printf("%04d-%02d", year, month); }

inline std::string FormatYearMonth(std::chrono::microseconds t) {
  const time::CivilFields fields = time::BreakDown(t);
  return FormatYearMonth(fields.year, fields.month);
}

inline std::string FormatDate(std::chrono::microseconds t) {
  const time::CivilFields fields = time::BreakDown(t);
  return strings::Printf("%04d-%02d-%02d", fields.year, fields.month, fields.day);
}

}  // namespace cordon

#endif  // CORDON_BRICKS_TIME_CHRONO_H
