#include "time.hpp"

namespace statecore::util {

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

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  google::protobuf::Timestamp ts;
  ts.set_seconds(static_cast<int64_t>(ms / 1000));
  ts.set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
  return ts;
}

uint64_t ProtoToMillis(const google::protobuf::Timestamp& ts) {
  return static_cast<uint64_t>(ts.seconds()) * 1000 + static_cast<uint64_t>(ts.nanos() / 1000000);
}

std::chrono::milliseconds DurationOr(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  const auto ms = std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
  return ms.count() > 0 ? ms : fallback;
}

} // namespace statecore::util
