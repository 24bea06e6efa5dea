#include "time.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace rollout::util {

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
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
  if (ms.count() <= 0) {
    return fallback;
  }
  return ms;
}

std::chrono::milliseconds CapToDeadline(std::chrono::milliseconds limit, TimePoint deadline) {
  if (deadline == TimePoint{}) {
    return limit;
  }
  const auto left = std::max(std::chrono::milliseconds(1),
                             std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Now()));
  if (limit.count() <= 0) {
    return left;
  }
  return std::min(limit, left);
}

std::string CompactStamp(TimePoint tp) {
  const auto  t = Clock::to_time_t(tp);
  std::tm     utc{};
  gmtime_r(&t, &utc);

  const auto millis = ToUnixMillis(tp) % 1000;

  std::ostringstream out;
  out << std::put_time(&utc, "%Y%m%dT%H%M%S") << std::setw(3) << std::setfill('0') << millis << 'Z';
  return out.str();
}

} // namespace rollout::util
