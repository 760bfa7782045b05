#pragma once

#include <cstdint>
#include <string>

#include "internal/model/location.hpp"
#include "internal/model/ride_state.hpp"

namespace ridedispatch::db::model {

// Pending per-driver ride offer. Keyed by (driver_id, ride_id).
struct NotificationRecord {
  std::string driver_id;
  std::string ride_id;

  ridedispatch::model::RequestClass request_class = ridedispatch::model::RequestClass::kRide;

  ridedispatch::model::GeoPoint pickup;
  ridedispatch::model::GeoPoint destination;

  double   estimated_fare        = 0.0;
  double   distance_to_pickup_km = 0.0;
  bool     is_extended_area      = false;
  uint32_t broadcast_round       = 1;

  uint64_t notified_at_ms = 0;
  uint64_t expires_at_ms  = 0;
};

} // namespace ridedispatch::db::model
