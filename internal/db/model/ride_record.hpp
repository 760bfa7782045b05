#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/location.hpp"
#include "internal/model/ride_state.hpp"

namespace ridedispatch::db::model {

struct FareBreakdown {
  double base        = 0.0;
  double per_km      = 0.0;
  double distance_km = 0.0;
  double surge       = 1.0;
  double final_total = 0.0;
};

/*
  Persistent ride row.

  IMPORTANT:
  - driver_id is empty iff no driver is committed (REQUESTED, or CANCELLED
    before a match).
  - Rides are never deleted.
  - version is bumped on every write; status changes go through
    Repository::UpdateRideIfStatus.
*/
struct RideRecord {
  std::string ride_id;
  std::string rider_id;
  std::string driver_id;

  ridedispatch::model::RideStatus   status        = ridedispatch::model::RideStatus::kRequested;
  ridedispatch::model::RequestClass request_class = ridedispatch::model::RequestClass::kRide;

  ridedispatch::model::GeoPoint pickup;
  ridedispatch::model::GeoPoint destination;

  double                estimated_fare = 0.0;
  std::optional<double> final_fare;
  FareBreakdown         fare_breakdown;

  // unix millis, 0 = unset
  uint64_t requested_at_ms           = 0;
  uint64_t matched_at_ms             = 0;
  uint64_t pickup_time_ms            = 0;
  uint64_t start_time_ms             = 0;
  uint64_t completed_at_ms           = 0;
  uint64_t cancellation_timestamp_ms = 0;

  std::string cancelled_by;
  std::string cancellation_reason;
  double      cancellation_fee = 0.0;

  uint64_t version = 0;
};

} // namespace ridedispatch::db::model
