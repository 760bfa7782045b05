#pragma once

#include <string>

#include "ridedispatch/v1/types.pb.h"

namespace ridedispatch::notify {

inline constexpr const char* kRideRequest   = "ride_request";
inline constexpr const char* kRideMatched   = "ride_matched";
inline constexpr const char* kRideCancelled = "ride_cancelled";

// One queued real-time push.
struct OutboundNotification {
  std::string                          user_id;
  ridedispatch::v1::DispatchNotification payload;
};

} // namespace ridedispatch::notify
