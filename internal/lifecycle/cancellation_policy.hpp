#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/availability/availability_registry.hpp"
#include "internal/config/dispatch_policy.hpp"
#include "internal/dispatch/broadcast_coordinator.hpp"
#include "lifecycle_result.hpp"

namespace ridedispatch::lifecycle {

struct DriverCancelResult : LifecycleResult {
  bool     suspended          = false;
  uint32_t cancellation_count = 0;

  // the re-dispatch round
  std::vector<dispatch::NotifiedDriver> notified;
};

/*
  Driver-initiated cancellation of a matched ride.

  Counts cancellations per rolling window (the counter resets once more than
  `window` has passed since last_reset_at), suspends the driver once the count
  exceeds the threshold, puts the ride back to REQUESTED and re-broadcasts it
  without the cancelling driver.
*/
class CancellationPolicy {
 public:
  CancellationPolicy(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                     std::shared_ptr<availability::AvailabilityRegistry> availability,
                     std::shared_ptr<dispatch::BroadcastCoordinator> broadcasts, config::SuspensionPolicy policy);

  DriverCancelResult DriverCancel(const std::string& ride_id, const std::string& driver_id,
                                  const std::optional<std::string>& reason = std::nullopt);

  // Unsuspends drivers suspended more than `duration` ago. Returns their ids.
  std::vector<std::string> LiftExpiredSuspensions();

 private:
  std::shared_ptr<db::Repository>                     repository_;
  std::shared_ptr<util::Clock>                        clock_;
  std::shared_ptr<availability::AvailabilityRegistry> availability_;
  std::shared_ptr<dispatch::BroadcastCoordinator>     broadcasts_;
  config::SuspensionPolicy                            policy_;
};

} // namespace ridedispatch::lifecycle
