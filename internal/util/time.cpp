#include "time.hpp"

#include <cstdio>
#include <ctime>

namespace relay::util {

namespace {

std::string FormatDate(const std::tm& tm) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday);
  return buf;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos());
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  if (ms == 0) {
    return {};
  }
  return ToProto(FromUnixMillis(ms));
}

std::string FormatIso8601(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);

  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

std::optional<TimePoint> ParseIso8601(const std::string& text) {
  int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
  int consumed = 0;
  if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
    return std::nullopt;
  }

  std::size_t pos = static_cast<std::size_t>(consumed);

  // fractional seconds are accepted and dropped
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') ++pos;
  }

  long offset_seconds = 0;
  if (pos < text.size()) {
    const char designator = text[pos];
    if (designator == 'Z' || designator == 'z') {
      ++pos;
    } else if (designator == '+' || designator == '-') {
      int off_h = 0, off_m = 0;
      if (std::sscanf(text.c_str() + pos + 1, "%2d:%2d", &off_h, &off_m) != 2) {
        return std::nullopt;
      }
      offset_seconds = (off_h * 3600L + off_m * 60L) * (designator == '-' ? -1 : 1);
      pos += 6;
    } else {
      return std::nullopt;
    }
  }
  if (pos != text.size()) {
    return std::nullopt;
  }

  std::tm tm{};
  tm.tm_year = year - 1900;
  tm.tm_mon  = month - 1;
  tm.tm_mday = day;
  tm.tm_hour = hour;
  tm.tm_min  = minute;
  tm.tm_sec  = second;

  const std::time_t utc = timegm(&tm);
  if (utc == static_cast<std::time_t>(-1)) {
    return std::nullopt;
  }
  return Clock::from_time_t(utc - offset_seconds);
}

std::string DateAtOffset(TimePoint tp, std::chrono::hours utc_offset) {
  const std::time_t t = Clock::to_time_t(tp + utc_offset);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  return FormatDate(tm);
}

TimePoint NextMidnightAtOffset(TimePoint tp, std::chrono::hours utc_offset) {
  const std::time_t t = Clock::to_time_t(tp + utc_offset);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  tm.tm_hour = 0;
  tm.tm_min  = 0;
  tm.tm_sec  = 0;
  tm.tm_mday += 1;

  const std::time_t local_midnight = timegm(&tm);
  return Clock::from_time_t(local_midnight) - utc_offset;
}

TimePoint StartOfUtcDay(TimePoint tp) {
  const std::time_t t = Clock::to_time_t(tp);
  std::tm           tm{};
  gmtime_r(&t, &tm);
  tm.tm_hour = 0;
  tm.tm_min  = 0;
  tm.tm_sec  = 0;
  return Clock::from_time_t(timegm(&tm));
}

} // namespace relay::util
