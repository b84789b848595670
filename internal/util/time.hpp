#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace statecore::util {

/*
  Time utilities. The clock source is controlled here.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

google::protobuf::Timestamp MillisToProto(uint64_t ms);
uint64_t                    ProtoToMillis(const google::protobuf::Timestamp& ts);

// Unset or zero durations fall back to `fallback`.
std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace statecore::util
