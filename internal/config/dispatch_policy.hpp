#pragma once

#include <chrono>
#include <cstdint>

#include "internal/geo/service_area.hpp"

namespace ridedispatch::runtime::config {
class RuntimeConfig;
}

namespace ridedispatch::config {

struct FarePolicy {
  double base_fare              = 30.0;
  double per_km                 = 12.0;
  double extended_per_km        = 10.0;  // applied past tier_threshold_km
  double tier_threshold_km      = 25.0;
  double protection_ratio       = 0.20;
  double rider_cancellation_fee = 20.0;
};

struct DispatchPolicy {
  double city_initial_radius_km     = 5.0;
  double extended_initial_radius_km = 8.0;
  double city_expansion_step_km     = 2.0;
  double extended_expansion_step_km = 3.0;

  // caps for the sweeper's automatic expansion
  double   max_radius_km = 20.0;
  uint32_t max_rounds    = 5;

  double redispatch_radius_km = 5.0;
  double average_speed_kmh    = 30.0;

  std::chrono::milliseconds city_matching_timeout{std::chrono::seconds(120)};
  std::chrono::milliseconds extended_matching_timeout{std::chrono::seconds(180)};
  std::chrono::milliseconds lease_ttl{std::chrono::seconds(10)};
  std::chrono::milliseconds broadcast_ttl{std::chrono::minutes(10)};
  std::chrono::milliseconds availability_ttl{std::chrono::hours(24)};

  geo::ServiceArea service_area;

  double InitialRadiusKm(bool extended_area) const {
    return extended_area ? extended_initial_radius_km : city_initial_radius_km;
  }

  double ExpansionStepKm(bool extended_area) const {
    return extended_area ? extended_expansion_step_km : city_expansion_step_km;
  }

  std::chrono::milliseconds MatchingTimeout(bool extended_area) const {
    return extended_area ? extended_matching_timeout : city_matching_timeout;
  }
};

struct SuspensionPolicy {
  uint32_t                  threshold = 3;  // suspended once the count exceeds this
  std::chrono::milliseconds window{std::chrono::hours(24)};
  std::chrono::milliseconds duration{std::chrono::hours(24)};
};

struct Policy {
  DispatchPolicy   dispatch;
  FarePolicy       fares;
  SuspensionPolicy suspension;
};

// Unset (zero) config fields keep the defaults above.
Policy ResolvePolicy(const ridedispatch::runtime::config::RuntimeConfig& config);

} // namespace ridedispatch::config
