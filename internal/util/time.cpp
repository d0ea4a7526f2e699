#include "time.hpp"

#include <ctime>
#include <iomanip>
#include <limits>
#include <sstream>

namespace market::util {

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

Duration FromProto(const google::protobuf::Duration& d, Duration fallback) {
  const auto value = std::chrono::duration_cast<Duration>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  return value.count() > 0 ? value : fallback;
}

int64_t ToUnixMicros(TimePoint tp) {
  if (tp == TimePoint::max()) {
    return std::numeric_limits<int64_t>::max();
  }
  return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMicros(int64_t micros) {
  if (micros == std::numeric_limits<int64_t>::max()) {
    return TimePoint::max();
  }
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::microseconds(micros));
}

std::string FormatTime(TimePoint tp) {
  if (tp == TimePoint::max()) {
    return "max";
  }

  const auto  seconds = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  const auto  millis  = std::chrono::duration_cast<std::chrono::milliseconds>(tp - seconds).count();
  std::time_t t       = Clock::to_time_t(seconds);
  std::tm     tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << (millis < 0 ? 0 : millis) << 'Z';
  return out.str();
}

std::string FormatDuration(Duration d) {
  using namespace std::chrono;

  if (d.count() < 0) {
    return "-" + FormatDuration(-d);
  }

  std::ostringstream out;
  const auto         h = duration_cast<hours>(d);
  const auto         m = duration_cast<minutes>(d - h);
  const auto         ms = d - h - m;
  if (h.count() > 0) {
    out << h.count() << "h ";
  }
  if (h.count() > 0 || m.count() > 0) {
    out << m.count() << "m ";
  }
  out << (ms.count() / 1000);
  if (ms.count() % 1000 != 0) {
    out << '.' << std::setw(3) << std::setfill('0') << (ms.count() % 1000);
  }
  out << 's';
  return out.str();
}

} // namespace market::util
