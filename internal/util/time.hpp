#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace rollout::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

// Zero or unset durations resolve to `fallback`.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

// `limit`, shortened to what is left before `deadline` and never below
// 1ms. A default-constructed deadline leaves `limit` as it is.
std::chrono::milliseconds CapToDeadline(std::chrono::milliseconds limit, TimePoint deadline);

// Filesystem-safe UTC stamp, e.g. 20261019T085000123Z
std::string CompactStamp(TimePoint tp);

} // namespace rollout::util
