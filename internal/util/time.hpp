#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace market::util {

/*
  Time utilities, single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Duration  = std::chrono::milliseconds;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

// Zero or unset durations map to `fallback`.
Duration FromProto(const google::protobuf::Duration& d, Duration fallback);

// TimePoint::max() maps to INT64_MAX and back.
int64_t   ToUnixMicros(TimePoint tp);
TimePoint FromUnixMicros(int64_t micros);

// "2024-05-01T10:00:00.123Z"; TimePoint::max() prints as "max".
std::string FormatTime(TimePoint tp);

// "1h 2m 3.5s" style, used in log fields.
std::string FormatDuration(Duration d);

} // namespace market::util
