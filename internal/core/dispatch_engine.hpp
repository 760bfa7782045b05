#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/availability/availability_registry.hpp"
#include "internal/config/dispatch_policy.hpp"
#include "internal/dispatch/acceptance_arbitrator.hpp"
#include "internal/dispatch/broadcast_coordinator.hpp"
#include "internal/dispatch/radius_expander.hpp"
#include "internal/dispatch/rejection_tracker.hpp"
#include "internal/fare/fare_calculator.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/lifecycle/cancellation_policy.hpp"
#include "internal/lifecycle/ride_lifecycle.hpp"

namespace ridedispatch::core {

struct RideRequest {
  std::string     rider_id;
  model::GeoPoint pickup;
  model::GeoPoint destination;

  double              surge_multiplier = 1.0;
  model::RequestClass request_class    = model::RequestClass::kRide;
};

struct RideRequestOutcome {
  db::model::RideRecord      ride;
  dispatch::BroadcastOutcome broadcast;
};

struct EngineStats {
  uint64_t rides_requested   = 0;
  uint64_t rides_matched     = 0;  // MATCHED or DRIVER_ARRIVING
  uint64_t rides_in_progress = 0;
  uint64_t active_broadcasts = 0;
  uint64_t available_drivers = 0;
  uint64_t suspended_drivers = 0;
};

/*
  Public surface of the dispatch engine.

  Stateless apart from its collaborators: every piece of shared state lives in
  the repository, so several engines over one store behave as one.
*/
class DispatchEngine {
 public:
  DispatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                 std::shared_ptr<notify::NotificationQueue> queue, config::Policy policy);

  // ---------------------------------------------------------------------
  // Intake and matching
  // ---------------------------------------------------------------------

  // InvalidArgument for bad coordinates, a pickup outside the service area,
  // an empty rider or surge below 1.0.
  RideRequestOutcome RequestRide(const RideRequest& request);

  // Re-broadcasts a REQUESTED ride. NotFound / InvalidState otherwise.
  dispatch::BroadcastOutcome Broadcast(const std::string& ride_id, std::optional<double> radius_km = std::nullopt,
                                       dispatch::EligibilityFilter filter = nullptr);

  dispatch::AcceptResult Accept(const std::string& ride_id, const std::string& driver_id,
                                const std::string& rider_id);

  dispatch::RejectResult Reject(const std::string& ride_id, const std::string& driver_id);

  dispatch::ExpandResult Expand(const std::string& ride_id, std::optional<double> current_radius_km = std::nullopt,
                                std::optional<double> increment_km = std::nullopt);

  std::optional<db::model::BroadcastRecord> GetBroadcast(const std::string& ride_id);
  bool                                      CancelBroadcast(const std::string& ride_id);

  // Pending offers for a driver, oldest round first.
  std::vector<db::model::NotificationRecord> PendingNotifications(const std::string& driver_id);

  // ---------------------------------------------------------------------
  // Lifecycle
  // ---------------------------------------------------------------------

  std::optional<db::model::RideRecord> GetRide(const std::string& ride_id);

  lifecycle::LifecycleResult MarkArriving(const std::string& ride_id, const std::string& driver_id);
  lifecycle::LifecycleResult Start(const std::string& ride_id, const std::string& driver_id);
  lifecycle::LifecycleResult Complete(const std::string& ride_id, const std::string& driver_id,
                                      double actual_distance_km);
  lifecycle::CancelResult    Cancel(const std::string& ride_id, const std::string& user_id,
                                    const std::optional<std::string>& reason = std::nullopt);

  lifecycle::DriverCancelResult DriverCancel(const std::string& ride_id, const std::string& driver_id,
                                             const std::optional<std::string>& reason = std::nullopt);

  // ---------------------------------------------------------------------
  // Drivers
  // ---------------------------------------------------------------------

  availability::AvailabilityUpdate SetDriverAvailable(const std::string& driver_id, const model::GeoPoint& location);
  availability::AvailabilityUpdate SetDriverUnavailable(const std::string& driver_id);
  availability::AvailabilityUpdate SetDriverBusy(const std::string& driver_id);
  db::model::DriverAvailabilityRecord UpdateDriverLocation(const std::string& driver_id,
                                                           const model::GeoPoint& location);

  std::optional<db::model::DriverAvailabilityRecord> GetDriverStatus(const std::string& driver_id);
  bool                                               IsDriverAvailable(const std::string& driver_id);

  // Profiles come from the external driver directory.
  void                                          UpsertDriverProfile(const db::model::DriverProfileRecord& profile);
  std::optional<db::model::DriverProfileRecord> GetDriverProfile(const std::string& driver_id);

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  std::vector<std::string> LiftExpiredSuspensions();

  void PurgeExpired();

  // Expands every live broadcast whose round outlived the area's matching
  // timeout, up to max_radius_km / max_rounds. Returns the expansions made.
  std::vector<dispatch::ExpandResult> ExpandStaleBroadcasts();

  EngineStats Stats();

  const config::Policy& Policy() const {
    return policy_;
  }

 private:
  uint64_t NowMs() const;

  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<util::Clock>               clock_;
  std::shared_ptr<notify::NotificationQueue> queue_;
  config::Policy                             policy_;
  fare::FareCalculator                       fares_;

  std::shared_ptr<lease::LeaseManager>                leases_;
  std::shared_ptr<availability::AvailabilityRegistry> availability_;
  std::shared_ptr<dispatch::BroadcastCoordinator>     broadcasts_;
  std::shared_ptr<dispatch::AcceptanceArbitrator>     arbitrator_;
  std::shared_ptr<dispatch::RejectionTracker>         rejections_;
  std::shared_ptr<dispatch::RadiusExpander>           expander_;
  std::shared_ptr<lifecycle::CancellationPolicy>      cancellations_;
  std::shared_ptr<lifecycle::RideLifecycle>           lifecycle_;
};

} // namespace ridedispatch::core
