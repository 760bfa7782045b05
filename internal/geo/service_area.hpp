#pragma once

#include "internal/model/location.hpp"

namespace ridedispatch::geo {

/*
  Operating region: a circle of service_radius_km around the city centre, with
  a rectangular city-limits box inside it. Pickups inside the circle but
  outside the box are "extended area" and get wider dispatch radii and longer
  matching timeouts.

  Defaults describe Indore.
*/
struct ServiceArea {
  model::GeoPoint center{22.7196, 75.8577};
  double          service_radius_km = 20.0;

  double city_min_latitude  = 22.6;
  double city_max_latitude  = 22.8;
  double city_min_longitude = 75.7;
  double city_max_longitude = 75.9;

  bool InCityLimits(const model::GeoPoint& p) const;
  bool InServiceArea(const model::GeoPoint& p) const;
  bool IsExtendedArea(const model::GeoPoint& p) const;
};

} // namespace ridedispatch::geo
