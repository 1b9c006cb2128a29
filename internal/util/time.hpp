#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace relay::util {

/*
  Time helpers shared by stores, scanner and quota tracking.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 0 means "unset" in persisted records.
google::protobuf::Timestamp MillisToProto(uint64_t ms);

// RFC 3339 / ISO 8601 in UTC, e.g. 2024-05-01T10:00:00Z.
std::string              FormatIso8601(TimePoint tp);
std::optional<TimePoint> ParseIso8601(const std::string& text);

// Calendar date (YYYY-MM-DD) of tp in a fixed UTC offset.
std::string DateAtOffset(TimePoint tp, std::chrono::hours utc_offset);

// First midnight strictly after tp in a fixed UTC offset.
TimePoint NextMidnightAtOffset(TimePoint tp, std::chrono::hours utc_offset);

// Start of the UTC day containing tp.
TimePoint StartOfUtcDay(TimePoint tp);

} // namespace relay::util
