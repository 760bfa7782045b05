#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/location.hpp"
#include "internal/model/ride_state.hpp"

namespace ridedispatch::db::model {

/*
  Driver availability row. Overwritten on every status or location update.
  A row with expires_at_ms <= now is treated as absent (driver offline).
*/
struct DriverAvailabilityRecord {
  std::string driver_id;

  ridedispatch::model::DriverStatus            status = ridedispatch::model::DriverStatus::kUnavailable;
  std::optional<ridedispatch::model::GeoPoint> location;

  uint64_t updated_at_ms = 0;
  uint64_t expires_at_ms = 0;
};

} // namespace ridedispatch::db::model
