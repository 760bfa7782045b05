#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace ridedispatch::model {

enum class RideStatus : std::uint8_t {
  kRequested      = 1,
  kMatched        = 2,
  kDriverArriving = 3,
  kInProgress     = 4,
  kCompleted      = 5,
  kCancelled      = 6,
};

enum class DriverStatus : std::uint8_t {
  kAvailable   = 1,
  kBusy        = 2,
  kUnavailable = 3,
};

enum class BroadcastStatus : std::uint8_t {
  kActive    = 1,
  kCancelled = 2,
};

enum class RequestClass : std::uint8_t {
  kRide   = 1,
  kParcel = 2,
};

inline constexpr RideStatus kAllRideStatuses[] = {
    RideStatus::kRequested,  RideStatus::kMatched,   RideStatus::kDriverArriving,
    RideStatus::kInProgress, RideStatus::kCompleted, RideStatus::kCancelled,
};

constexpr bool IsTerminal(RideStatus status) {
  return status == RideStatus::kCompleted || status == RideStatus::kCancelled;
}

/*
  Ride lifecycle transition table.

    REQUESTED       -> MATCHED, CANCELLED
    MATCHED         -> DRIVER_ARRIVING, CANCELLED
    DRIVER_ARRIVING -> IN_PROGRESS, CANCELLED
    IN_PROGRESS     -> COMPLETED
    COMPLETED       -> (none)
    CANCELLED       -> (none)

  Self transitions are not transitions. A driver cancellation moves a matched
  ride back to REQUESTED; that re-dispatch is handled by the cancellation policy
  and is deliberately absent from this table.
*/
constexpr bool CanTransition(RideStatus from, RideStatus to) {
  switch (from) {
    case RideStatus::kRequested:
      return to == RideStatus::kMatched || to == RideStatus::kCancelled;
    case RideStatus::kMatched:
      return to == RideStatus::kDriverArriving || to == RideStatus::kCancelled;
    case RideStatus::kDriverArriving:
      return to == RideStatus::kInProgress || to == RideStatus::kCancelled;
    case RideStatus::kInProgress:
      return to == RideStatus::kCompleted;
    case RideStatus::kCompleted:
    case RideStatus::kCancelled:
      return false;
  }
  return false;
}

// MATCHED or any later non-cancelled state: a driver has been committed.
constexpr bool IsMatchedOrLater(RideStatus status) {
  return status == RideStatus::kMatched || status == RideStatus::kDriverArriving ||
         status == RideStatus::kInProgress || status == RideStatus::kCompleted;
}

constexpr std::string_view ToString(RideStatus status) {
  switch (status) {
    case RideStatus::kRequested:
      return "REQUESTED";
    case RideStatus::kMatched:
      return "MATCHED";
    case RideStatus::kDriverArriving:
      return "DRIVER_ARRIVING";
    case RideStatus::kInProgress:
      return "IN_PROGRESS";
    case RideStatus::kCompleted:
      return "COMPLETED";
    case RideStatus::kCancelled:
      return "CANCELLED";
  }
  return "UNKNOWN";
}

constexpr std::string_view ToString(DriverStatus status) {
  switch (status) {
    case DriverStatus::kAvailable:
      return "available";
    case DriverStatus::kBusy:
      return "busy";
    case DriverStatus::kUnavailable:
      return "unavailable";
  }
  return "unknown";
}

constexpr std::string_view ToString(RequestClass request_class) {
  return request_class == RequestClass::kParcel ? "parcel" : "ride";
}

// Storage codecs (sqlite / postgres persist the numeric value).
inline std::optional<RideStatus> RideStatusFromInt(int value) {
  if (value < 1 || value > 6) return std::nullopt;
  return static_cast<RideStatus>(value);
}

inline std::optional<DriverStatus> DriverStatusFromInt(int value) {
  if (value < 1 || value > 3) return std::nullopt;
  return static_cast<DriverStatus>(value);
}

} // namespace ridedispatch::model
