#include "distance.hpp"

#include <cmath>

namespace ridedispatch::geo {

namespace {

constexpr double kPi = 3.14159265358979323846;

double ToRadians(double degrees) {
  return degrees * kPi / 180.0;
}

} // namespace

double DistanceKm(double lat1, double lon1, double lat2, double lon2) {
  const double phi1 = ToRadians(lat1);
  const double phi2 = ToRadians(lat2);
  const double dphi = ToRadians(lat2 - lat1);
  const double dlam = ToRadians(lon2 - lon1);

  const double s1 = std::sin(dphi / 2.0);
  const double s2 = std::sin(dlam / 2.0);
  double       a  = s1 * s1 + std::cos(phi1) * std::cos(phi2) * s2 * s2;

  // rounding can push a just past 1 for antipodal points
  if (a > 1.0) a = 1.0;
  if (a < 0.0) a = 0.0;

  return 2.0 * kEarthRadiusKm * std::atan2(std::sqrt(a), std::sqrt(1.0 - a));
}

bool IsValidCoordinate(double latitude, double longitude) {
  return std::isfinite(latitude) && std::isfinite(longitude) && latitude >= -90.0 && latitude <= 90.0 &&
         longitude >= -180.0 && longitude <= 180.0;
}

} // namespace ridedispatch::geo
