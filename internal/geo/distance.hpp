#pragma once

#include "internal/model/location.hpp"

namespace ridedispatch::geo {

inline constexpr double kEarthRadiusKm = 6371.0;

// Haversine great-circle distance; degrees in.
double DistanceKm(double lat1, double lon1, double lat2, double lon2);

inline double DistanceKm(const model::GeoPoint& a, const model::GeoPoint& b) {
  return DistanceKm(a.latitude, a.longitude, b.latitude, b.longitude);
}

// Finite, lat in [-90, 90], lon in [-180, 180].
bool IsValidCoordinate(double latitude, double longitude);

inline bool IsValidCoordinate(const model::GeoPoint& p) {
  return IsValidCoordinate(p.latitude, p.longitude);
}

} // namespace ridedispatch::geo
