#include "dispatch_policy.hpp"

#include "config/config.pb.h"
#include "internal/util/errors.hpp"

namespace ridedispatch::config {

namespace {

void Override(double value, double& target) {
  if (value > 0.0) target = value;
}

void Override(uint32_t value, uint32_t& target) {
  if (value > 0) target = value;
}

void Override(const google::protobuf::Duration& value, std::chrono::milliseconds& target) {
  const auto ms = value.seconds() * 1000 + value.nanos() / 1000000;
  if (ms > 0) target = std::chrono::milliseconds(ms);
}

} // namespace

Policy ResolvePolicy(const ridedispatch::runtime::config::RuntimeConfig& config) {
  Policy policy;

  const auto& d  = config.dispatch();
  auto&       dp = policy.dispatch;
  Override(d.city_initial_radius_km(), dp.city_initial_radius_km);
  Override(d.extended_initial_radius_km(), dp.extended_initial_radius_km);
  Override(d.city_expansion_step_km(), dp.city_expansion_step_km);
  Override(d.extended_expansion_step_km(), dp.extended_expansion_step_km);
  Override(d.max_radius_km(), dp.max_radius_km);
  Override(d.max_rounds(), dp.max_rounds);
  Override(d.redispatch_radius_km(), dp.redispatch_radius_km);
  Override(d.average_speed_kmh(), dp.average_speed_kmh);
  Override(d.city_matching_timeout(), dp.city_matching_timeout);
  Override(d.extended_matching_timeout(), dp.extended_matching_timeout);
  Override(d.lease_ttl(), dp.lease_ttl);
  Override(d.broadcast_ttl(), dp.broadcast_ttl);
  Override(d.availability_ttl(), dp.availability_ttl);

  if (d.has_service_area()) {
    const auto& a  = d.service_area();
    auto&       sa = dp.service_area;
    if (a.center_latitude() != 0.0 || a.center_longitude() != 0.0) {
      sa.center = {a.center_latitude(), a.center_longitude()};
    }
    Override(a.service_radius_km(), sa.service_radius_km);
    if (a.city_min_latitude() != 0.0 || a.city_max_latitude() != 0.0) {
      sa.city_min_latitude = a.city_min_latitude();
      sa.city_max_latitude = a.city_max_latitude();
    }
    if (a.city_min_longitude() != 0.0 || a.city_max_longitude() != 0.0) {
      sa.city_min_longitude = a.city_min_longitude();
      sa.city_max_longitude = a.city_max_longitude();
    }
    if (sa.city_min_latitude > sa.city_max_latitude || sa.city_min_longitude > sa.city_max_longitude) {
      throw util::InvalidArgument("dispatch.service_area: city limits box is inverted");
    }
  }

  const auto& f  = config.fares();
  auto&       fp = policy.fares;
  Override(f.base_fare(), fp.base_fare);
  Override(f.per_km(), fp.per_km);
  Override(f.extended_per_km(), fp.extended_per_km);
  Override(f.tier_threshold_km(), fp.tier_threshold_km);
  Override(f.protection_ratio(), fp.protection_ratio);
  Override(f.rider_cancellation_fee(), fp.rider_cancellation_fee);

  const auto& s = config.suspension();
  Override(s.threshold(), policy.suspension.threshold);
  Override(s.window(), policy.suspension.window);
  Override(s.duration(), policy.suspension.duration);

  if (dp.max_radius_km < dp.city_initial_radius_km) {
    throw util::InvalidArgument("dispatch.max_radius_km is below the initial radius");
  }

  return policy;
}

} // namespace ridedispatch::config
