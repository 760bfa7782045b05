#pragma once

#include <functional>
#include <string>
#include <vector>

#include "internal/model/location.hpp"

namespace ridedispatch::dispatch {

// An available driver inside the search radius, before eligibility filtering.
struct CandidateDriver {
  std::string     driver_id;
  model::GeoPoint location;
  double          distance_km = 0.0;

  bool accept_extended_area   = true;
  bool accept_parcel_delivery = false;
};

using EligibilityFilter = std::function<bool(const CandidateDriver&)>;

struct NotifiedDriver {
  std::string driver_id;
  double      distance_km = 0.0;
};

} // namespace ridedispatch::dispatch
