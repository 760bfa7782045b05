#include "service_area.hpp"

#include "distance.hpp"

namespace ridedispatch::geo {

bool ServiceArea::InCityLimits(const model::GeoPoint& p) const {
  return p.latitude >= city_min_latitude && p.latitude <= city_max_latitude && p.longitude >= city_min_longitude &&
         p.longitude <= city_max_longitude;
}

bool ServiceArea::InServiceArea(const model::GeoPoint& p) const {
  return DistanceKm(center, p) <= service_radius_km;
}

bool ServiceArea::IsExtendedArea(const model::GeoPoint& p) const {
  return InServiceArea(p) && !InCityLimits(p);
}

} // namespace ridedispatch::geo
