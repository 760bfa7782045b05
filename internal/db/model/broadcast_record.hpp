#pragma once

#include <algorithm>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/location.hpp"
#include "internal/model/ride_state.hpp"

namespace ridedispatch::db::model {

/*
  At most one record per ride_id. notified_driver_ids is kept in notification
  order (closest first per round) and never contains duplicates.

  excluded_driver_ids are never offered this ride in any round and may not
  accept it: the driver who cancelled it, and drivers the first round's
  eligibility filter turned away.
*/
struct BroadcastRecord {
  std::string ride_id;

  ridedispatch::model::RequestClass request_class = ridedispatch::model::RequestClass::kRide;

  ridedispatch::model::GeoPoint pickup;
  ridedispatch::model::GeoPoint destination;

  double estimated_fare   = 0.0;
  double radius_km        = 0.0;
  bool   is_extended_area = false;

  std::vector<std::string> notified_driver_ids;
  std::vector<std::string> excluded_driver_ids;

  ridedispatch::model::BroadcastStatus status = ridedispatch::model::BroadcastStatus::kActive;

  uint32_t broadcast_count = 0;

  uint64_t created_at_ms        = 0;
  uint64_t last_expansion_at_ms = 0;
  uint64_t expires_at_ms        = 0;

  bool Notified(const std::string& driver_id) const {
    return std::find(notified_driver_ids.begin(), notified_driver_ids.end(), driver_id) != notified_driver_ids.end();
  }

  bool Excluded(const std::string& driver_id) const {
    return std::find(excluded_driver_ids.begin(), excluded_driver_ids.end(), driver_id) != excluded_driver_ids.end();
  }
};

} // namespace ridedispatch::db::model
