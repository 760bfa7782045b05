#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "broadcast_coordinator.hpp"
#include "internal/availability/availability_registry.hpp"
#include "internal/lease/lease_manager.hpp"

namespace ridedispatch::dispatch {

enum class AcceptOutcome {
  kWon,
  kAlreadyMatched,
  kBusy,  // another accept holds the lease; retry
  kNotFound,
  kDriverUnavailable,
  kRiderMismatch,
  kNotRequested,  // cancelled before anyone matched
  kDriverExcluded,  // cancelled this ride earlier, or filtered out of its broadcast
};

std::string_view ToString(AcceptOutcome outcome);

struct AcceptResult {
  AcceptOutcome outcome = AcceptOutcome::kNotFound;
  std::string   message;

  // set on kWon
  std::optional<db::model::RideRecord>          ride;
  std::optional<db::model::DriverProfileRecord> driver;
  double                                        distance_to_pickup_km     = 0.0;
  uint32_t                                      estimated_arrival_minutes = 0;
};

/*
  Decides the single winner among drivers accepting the same ride.

  A short lease keyed by the ride serializes contenders across engine
  instances; inside it the REQUESTED -> MATCHED write is a compare-and-set on
  the ride status, so a lease that expired mid-flight still cannot produce two
  winners.
*/
class AcceptanceArbitrator {
 public:
  AcceptanceArbitrator(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                       std::shared_ptr<lease::LeaseManager> leases,
                       std::shared_ptr<availability::AvailabilityRegistry> availability,
                       std::shared_ptr<BroadcastCoordinator> broadcasts,
                       std::shared_ptr<notify::NotificationQueue> queue, config::DispatchPolicy policy);

  AcceptResult Accept(const std::string& ride_id, const std::string& driver_id, const std::string& rider_id);

  static std::string LeaseKey(const std::string& ride_id) {
    return "ride:" + ride_id;
  }

 private:
  AcceptResult Contended(const std::string& ride_id);
  AcceptResult Arbitrate(const std::string& ride_id, const std::string& driver_id, const std::string& rider_id,
                         uint64_t now_ms);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<util::Clock>                        clock_;
  std::shared_ptr<lease::LeaseManager>                leases_;
  std::shared_ptr<availability::AvailabilityRegistry> availability_;
  std::shared_ptr<BroadcastCoordinator>               broadcasts_;
  std::shared_ptr<notify::NotificationQueue>          queue_;
  config::DispatchPolicy                              policy_;
};

} // namespace ridedispatch::dispatch
