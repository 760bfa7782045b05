#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>

#include "google/protobuf/timestamp.pb.h"

namespace ridedispatch::util {

/*
  Time utilities — single place to control clock source.

  Engine components never call the system clock directly; they read an
  injected util::Clock so tests can drive expiry and the 24h windows.
*/

using SystemClockType = std::chrono::system_clock;
using TimePoint       = SystemClockType::time_point;

class Clock {
 public:
  virtual ~Clock() = default;

  virtual TimePoint Now() const = 0;
};

class SystemClock final : public Clock {
 public:
  TimePoint Now() const override;
};

// Settable clock for tests.
class ManualClock final : public Clock {
 public:
  explicit ManualClock(TimePoint start);

  TimePoint Now() const override;

  void Set(TimePoint tp);
  void Advance(std::chrono::milliseconds delta);

 private:
  mutable std::mutex mutex_;
  TimePoint          now_;
};

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

// 0 = unset in record fields
google::protobuf::Timestamp MillisToProto(uint64_t ms);

} // namespace ridedispatch::util
