#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>
#include <vector>

#include "internal/geo/distance.hpp"
#include "internal/geo/service_area.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using ridedispatch::geo::DistanceKm;
using ridedispatch::geo::IsValidCoordinate;
using ridedispatch::geo::ServiceArea;
using ridedispatch::model::GeoPoint;
using ridedispatch::testing::kCityCenter;
using ridedispatch::testing::Near;
using ridedispatch::testing::NorthOf;

void TestDistanceToSelfIsZero() {
  assert(DistanceKm(kCityCenter, kCityCenter) == 0.0);
}

void TestDistanceAlongMeridianMatchesArc() {
  assert(Near(DistanceKm(kCityCenter, NorthOf(kCityCenter, 1.0)), 1.0, 1e-9));
  assert(Near(DistanceKm(kCityCenter, NorthOf(kCityCenter, 7.0)), 7.0, 1e-9));
}

void TestDistanceIsSymmetric() {
  const GeoPoint a{22.7196, 75.8577};
  const GeoPoint b{22.9, 76.1};
  assert(Near(DistanceKm(a, b), DistanceKm(b, a), 1e-12));
}

// Poles, both sides of the antimeridian, near-antipodal pairs and city-scale neighbours.
std::vector<GeoPoint> SpreadOfPoints() {
  return {
      kCityCenter,
      NorthOf(kCityCenter, 0.5),
      {22.9, 76.1},
      {90.0, 0.0},
      {89.9999, 120.0},
      {-90.0, 45.0},
      {0.0, 0.0},
      {0.0001, 179.9999},
      {-0.0001, -179.9999},
      {10.0, 179.9},
      {10.0, -179.9},
      {-33.8688, 151.2093},
      {51.5074, -0.1278},
      {-22.7196, -104.1423},  // antipode of the city centre
  };
}

void TestDistanceIsAMetricOverSpreadOfPoints() {
  const auto   points = SpreadOfPoints();
  const double max_km = ridedispatch::geo::kEarthRadiusKm * 3.14159265358979323846;

  for (const auto& a : points) {
    assert(DistanceKm(a, a) == 0.0);
    for (const auto& b : points) {
      const double ab = DistanceKm(a, b);
      assert(std::isfinite(ab));
      assert(ab >= 0.0 && ab <= max_km + 1e-6);
      assert(Near(ab, DistanceKm(b, a), 1e-9));
      for (const auto& c : points) {
        assert(DistanceKm(a, c) <= ab + DistanceKm(b, c) + 1e-5);
      }
    }
  }
}

void TestAntimeridianAndPoleCrossings() {
  // 0.2 degrees of longitude at 10N, not 359.8
  assert(DistanceKm({10.0, 179.9}, {10.0, -179.9}) < 25.0);
  // every meridian meets at the pole
  assert(Near(DistanceKm({90.0, 0.0}, {90.0, 135.0}), 0.0, 1e-9));
  // over the pole: 0.1 degrees either side is about 22km
  assert(Near(DistanceKm({89.9, 0.0}, {89.9, 180.0}), 22.239, 1e-2));
}

void TestKnownCityPair() {
  // Indore to Bhopal, roughly 170km as the crow flies
  const double d = DistanceKm({22.7196, 75.8577}, {23.2599, 77.4126});
  assert(d > 165.0 && d < 175.0);
}

void TestAntipodalPointsStayFinite() {
  const double d = DistanceKm(0.0, 0.0, 0.0, 180.0);
  assert(std::isfinite(d));
  assert(Near(d, ridedispatch::geo::kEarthRadiusKm * 3.14159265358979323846, 1e-6));
}

void TestCoordinateValidation() {
  assert(IsValidCoordinate(0.0, 0.0));
  assert(IsValidCoordinate(-90.0, 180.0));
  assert(!IsValidCoordinate(90.01, 0.0));
  assert(!IsValidCoordinate(0.0, -180.5));
  assert(!IsValidCoordinate(std::numeric_limits<double>::quiet_NaN(), 0.0));
  assert(!IsValidCoordinate(0.0, std::numeric_limits<double>::infinity()));
}

void TestServiceAreaClassification() {
  ServiceArea area;

  assert(area.InCityLimits(kCityCenter));
  assert(area.InServiceArea(kCityCenter));
  assert(!area.IsExtendedArea(kCityCenter));

  // south of the city box, within the 20km circle
  const GeoPoint outskirts{22.58, 75.8577};
  assert(!area.InCityLimits(outskirts));
  assert(area.InServiceArea(outskirts));
  assert(area.IsExtendedArea(outskirts));

  const GeoPoint far_away{23.2599, 77.4126};
  assert(!area.InServiceArea(far_away));
  assert(!area.IsExtendedArea(far_away));
}

} // namespace

int main() {
  TestDistanceToSelfIsZero();
  TestDistanceAlongMeridianMatchesArc();
  TestDistanceIsSymmetric();
  TestDistanceIsAMetricOverSpreadOfPoints();
  TestAntimeridianAndPoleCrossings();
  TestKnownCityPair();
  TestAntipodalPointsStayFinite();
  TestCoordinateValidation();
  TestServiceAreaClassification();

  std::cout << "ride_dispatch_unit_geo: pass\n";
  return 0;
}
