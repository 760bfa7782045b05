#pragma once

#include <cstdint>
#include <string>

#include "internal/model/ride_state.hpp"

namespace ridedispatch::db::model {

struct DriverProfileRecord {
  std::string driver_id;
  std::string name;

  // reporting mirror of the availability registry
  ridedispatch::model::DriverStatus status = ridedispatch::model::DriverStatus::kUnavailable;

  uint32_t cancellation_count = 0;
  uint64_t last_reset_at_ms   = 0;
  bool     is_suspended       = false;
  uint64_t suspended_at_ms    = 0;

  bool accept_extended_area   = true;
  bool accept_parcel_delivery = false;

  std::string vehicle_registration;
  std::string vehicle_make;
  std::string vehicle_model;
  std::string vehicle_color;

  double   rating      = 0.0;
  uint32_t total_rides = 0;

  uint64_t availability_started_at_ms = 0;
  double   daily_availability_hours   = 0.0;
};

} // namespace ridedispatch::db::model
