#include "time.hpp"

namespace ridedispatch::util {

TimePoint SystemClock::Now() const {
  return SystemClockType::now();
}

ManualClock::ManualClock(TimePoint start) : now_(start) {
}

TimePoint ManualClock::Now() const {
  std::scoped_lock lock(mutex_);
  return now_;
}

void ManualClock::Set(TimePoint tp) {
  std::scoped_lock lock(mutex_);
  now_ = tp;
}

void ManualClock::Advance(std::chrono::milliseconds delta) {
  std::scoped_lock lock(mutex_);
  now_ += delta;
}

TimePoint Now() {
  return SystemClockType::now();
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
  return TimePoint{} + std::chrono::duration_cast<TimePoint::duration>(std::chrono::seconds(ts.seconds()) +
                                                                       std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::milliseconds(ms);
}

google::protobuf::Timestamp MillisToProto(uint64_t ms) {
  if (ms == 0) return {};
  return ToProto(FromUnixMillis(ms));
}

} // namespace ridedispatch::util
