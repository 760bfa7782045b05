#pragma once

#include <memory>
#include <optional>
#include <string>

#include "cancellation_policy.hpp"
#include "internal/fare/fare_calculator.hpp"

namespace ridedispatch::lifecycle {

struct CancelResult : LifecycleResult {
  double cancellation_fee = 0.0;
  bool   driver_suspended = false;
  bool   re_dispatched    = false;  // the assigned driver cancelled; ride is REQUESTED again
};

/*
  Post-match ride transitions.

  Every status write is a compare-and-set against the status the checks were
  made on. Rule violations come back as outcomes, never as exceptions.
*/
class RideLifecycle {
 public:
  RideLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                std::shared_ptr<availability::AvailabilityRegistry> availability,
                std::shared_ptr<dispatch::BroadcastCoordinator> broadcasts,
                std::shared_ptr<CancellationPolicy> cancellations, std::shared_ptr<notify::NotificationQueue> queue,
                fare::FareCalculator fares);

  // MATCHED -> DRIVER_ARRIVING
  LifecycleResult MarkArriving(const std::string& ride_id, const std::string& driver_id);

  // MATCHED | DRIVER_ARRIVING -> IN_PROGRESS
  LifecycleResult Start(const std::string& ride_id, const std::string& driver_id);

  // IN_PROGRESS -> COMPLETED; charges the protected fare and frees the driver.
  LifecycleResult Complete(const std::string& ride_id, const std::string& driver_id, double actual_distance_km);

  /*
    Rider or assigned driver. Before the match nobody pays; a rider cancelling
    a matched ride pays the cancellation fee; the assigned driver goes through
    CancellationPolicy::DriverCancel and the ride is re-dispatched.
  */
  CancelResult Cancel(const std::string& ride_id, const std::string& user_id,
                      const std::optional<std::string>& reason = std::nullopt);

 private:
  LifecycleResult Advance(const std::string& ride_id, const std::string& driver_id, model::RideStatus to);

  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<util::Clock>                        clock_;
  std::shared_ptr<availability::AvailabilityRegistry> availability_;
  std::shared_ptr<dispatch::BroadcastCoordinator>     broadcasts_;
  std::shared_ptr<CancellationPolicy>                 cancellations_;
  std::shared_ptr<notify::NotificationQueue>          queue_;
  fare::FareCalculator                                fares_;
};

} // namespace ridedispatch::lifecycle
