#pragma once

namespace ridedispatch::model {

// WGS84 degrees.
struct GeoPoint {
  double latitude  = 0.0;
  double longitude = 0.0;
};

inline bool operator==(const GeoPoint& a, const GeoPoint& b) {
  return a.latitude == b.latitude && a.longitude == b.longitude;
}

} // namespace ridedispatch::model
