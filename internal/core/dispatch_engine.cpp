#include "dispatch_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/geo/distance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace ridedispatch::core {

DispatchEngine::DispatchEngine(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                               std::shared_ptr<notify::NotificationQueue> queue, config::Policy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), queue_(std::move(queue)),
      policy_(std::move(policy)), fares_(policy_.fares) {
  const auto& dp = policy_.dispatch;

  leases_       = std::make_shared<lease::LeaseManager>(repository_, clock_, dp.lease_ttl);
  availability_ = std::make_shared<availability::AvailabilityRegistry>(repository_, clock_, dp.availability_ttl);
  broadcasts_   = std::make_shared<dispatch::BroadcastCoordinator>(repository_, clock_, queue_, dp);
  arbitrator_   = std::make_shared<dispatch::AcceptanceArbitrator>(repository_, clock_, leases_, availability_,
                                                                   broadcasts_, queue_, dp);
  rejections_   = std::make_shared<dispatch::RejectionTracker>(repository_, clock_, dp);
  expander_     = std::make_shared<dispatch::RadiusExpander>(repository_, clock_, broadcasts_);
  cancellations_ = std::make_shared<lifecycle::CancellationPolicy>(repository_, clock_, availability_, broadcasts_,
                                                                   policy_.suspension);
  lifecycle_ = std::make_shared<lifecycle::RideLifecycle>(repository_, clock_, availability_, broadcasts_,
                                                          cancellations_, queue_, fares_);
}

uint64_t DispatchEngine::NowMs() const {
  return util::ToUnixMillis(clock_->Now());
}

// ------------------------------------------------------------
// Intake and matching
// ------------------------------------------------------------

RideRequestOutcome DispatchEngine::RequestRide(const RideRequest& request) {
  observability::SpanScope span("engine.request_ride");

  if (request.rider_id.empty()) throw util::InvalidArgument("rider_id is required");
  if (!geo::IsValidCoordinate(request.pickup) || !geo::IsValidCoordinate(request.destination)) {
    throw util::InvalidArgument("invalid pickup or destination coordinates");
  }
  if (!policy_.dispatch.service_area.InServiceArea(request.pickup)) {
    throw util::InvalidArgument("pickup is outside the service area");
  }

  const auto quote = fares_.Estimate(geo::DistanceKm(request.pickup, request.destination), request.surge_multiplier);
  const auto now_ms = NowMs();

  db::model::RideRecord ride;
  ride.ride_id         = util::NewId();
  ride.rider_id        = request.rider_id;
  ride.status          = model::RideStatus::kRequested;
  ride.request_class   = request.request_class;
  ride.pickup          = request.pickup;
  ride.destination     = request.destination;
  ride.estimated_fare  = quote.total;
  ride.fare_breakdown  = quote.breakdown;
  ride.requested_at_ms = now_ms;

  span.SetAttribute("ride_id", ride.ride_id);

  RideRequestOutcome outcome = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto inserted = repository_->InsertRide(tx, ride);
    if (!inserted) throw std::runtime_error("insert ride " + ride.ride_id + ": " + inserted.message);

    dispatch::BroadcastRequest broadcast;
    broadcast.ride_id        = ride.ride_id;
    broadcast.pickup         = ride.pickup;
    broadcast.destination    = ride.destination;
    broadcast.estimated_fare = ride.estimated_fare;
    broadcast.request_class  = ride.request_class;

    RideRequestOutcome r;
    r.broadcast = broadcasts_->BroadcastTx(tx, broadcast, now_ms);
    r.ride      = *repository_->GetRide(tx, ride.ride_id);
    return r;
  });

  broadcasts_->Publish(outcome.broadcast.broadcast, outcome.broadcast.notified, now_ms);

  RIDEDISPATCH_LOG_INFO("ride requested",
                        {observability::StringField("ride_id", outcome.ride.ride_id),
                         observability::StringField("rider_id", request.rider_id),
                         observability::DoubleField("estimated_fare", outcome.ride.estimated_fare),
                         observability::IntField("notified", static_cast<int64_t>(outcome.broadcast.notified.size()))});
  return outcome;
}

dispatch::BroadcastOutcome DispatchEngine::Broadcast(const std::string& ride_id, std::optional<double> radius_km,
                                                     dispatch::EligibilityFilter filter) {
  auto ride = GetRide(ride_id);
  if (!ride) throw util::NotFound("ride not found: " + ride_id);
  if (ride->status != model::RideStatus::kRequested) {
    throw util::InvalidState("ride " + ride_id + " is " + std::string(model::ToString(ride->status)));
  }

  dispatch::BroadcastRequest request;
  request.ride_id        = ride_id;
  request.pickup         = ride->pickup;
  request.destination    = ride->destination;
  request.estimated_fare = ride->estimated_fare;
  request.radius_km      = radius_km;
  request.request_class  = ride->request_class;
  request.filter         = std::move(filter);
  return broadcasts_->Broadcast(request);
}

dispatch::AcceptResult DispatchEngine::Accept(const std::string& ride_id, const std::string& driver_id,
                                              const std::string& rider_id) {
  return arbitrator_->Accept(ride_id, driver_id, rider_id);
}

dispatch::RejectResult DispatchEngine::Reject(const std::string& ride_id, const std::string& driver_id) {
  return rejections_->Reject(ride_id, driver_id);
}

dispatch::ExpandResult DispatchEngine::Expand(const std::string& ride_id, std::optional<double> current_radius_km,
                                              std::optional<double> increment_km) {
  auto result = expander_->Expand(ride_id, current_radius_km, increment_km);
  if (result.outcome == dispatch::ExpandOutcome::kExpanded) {
    observability::Metrics::Instance().RecordRadiusExpansion("request");
  }
  return result;
}

std::optional<db::model::BroadcastRecord> DispatchEngine::GetBroadcast(const std::string& ride_id) {
  return broadcasts_->GetBroadcast(ride_id);
}

bool DispatchEngine::CancelBroadcast(const std::string& ride_id) {
  return broadcasts_->CancelBroadcast(ride_id);
}

std::vector<db::model::NotificationRecord> DispatchEngine::PendingNotifications(const std::string& driver_id) {
  const auto now_ms = NowMs();
  auto       pending = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ListNotificationsForDriver(tx, driver_id, now_ms);
  });
  std::stable_sort(pending.begin(), pending.end(),
                   [](const auto& a, const auto& b) { return a.notified_at_ms < b.notified_at_ms; });
  return pending;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

std::optional<db::model::RideRecord> DispatchEngine::GetRide(const std::string& ride_id) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) { return repository_->GetRide(tx, ride_id); });
}

lifecycle::LifecycleResult DispatchEngine::MarkArriving(const std::string& ride_id, const std::string& driver_id) {
  return lifecycle_->MarkArriving(ride_id, driver_id);
}

lifecycle::LifecycleResult DispatchEngine::Start(const std::string& ride_id, const std::string& driver_id) {
  return lifecycle_->Start(ride_id, driver_id);
}

lifecycle::LifecycleResult DispatchEngine::Complete(const std::string& ride_id, const std::string& driver_id,
                                                    double actual_distance_km) {
  return lifecycle_->Complete(ride_id, driver_id, actual_distance_km);
}

lifecycle::CancelResult DispatchEngine::Cancel(const std::string& ride_id, const std::string& user_id,
                                               const std::optional<std::string>& reason) {
  return lifecycle_->Cancel(ride_id, user_id, reason);
}

lifecycle::DriverCancelResult DispatchEngine::DriverCancel(const std::string& ride_id, const std::string& driver_id,
                                                           const std::optional<std::string>& reason) {
  return cancellations_->DriverCancel(ride_id, driver_id, reason);
}

// ------------------------------------------------------------
// Drivers
// ------------------------------------------------------------

availability::AvailabilityUpdate DispatchEngine::SetDriverAvailable(const std::string& driver_id,
                                                                    const model::GeoPoint& location) {
  return availability_->SetAvailable(driver_id, location);
}

availability::AvailabilityUpdate DispatchEngine::SetDriverUnavailable(const std::string& driver_id) {
  return availability_->SetUnavailable(driver_id);
}

availability::AvailabilityUpdate DispatchEngine::SetDriverBusy(const std::string& driver_id) {
  return availability_->SetBusy(driver_id);
}

db::model::DriverAvailabilityRecord DispatchEngine::UpdateDriverLocation(const std::string& driver_id,
                                                                         const model::GeoPoint& location) {
  return availability_->UpdateLocation(driver_id, location);
}

std::optional<db::model::DriverAvailabilityRecord> DispatchEngine::GetDriverStatus(const std::string& driver_id) {
  return availability_->GetStatus(driver_id);
}

bool DispatchEngine::IsDriverAvailable(const std::string& driver_id) {
  return availability_->IsAvailable(driver_id);
}

void DispatchEngine::UpsertDriverProfile(const db::model::DriverProfileRecord& profile) {
  if (profile.driver_id.empty()) throw util::InvalidArgument("driver_id is required");

  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto merged = profile;
    // counters and availability bookkeeping are owned by the engine
    if (auto existing = repository_->GetDriverProfile(tx, profile.driver_id)) {
      merged.status                     = existing->status;
      merged.cancellation_count         = existing->cancellation_count;
      merged.last_reset_at_ms           = existing->last_reset_at_ms;
      merged.is_suspended               = existing->is_suspended;
      merged.suspended_at_ms            = existing->suspended_at_ms;
      merged.total_rides                = std::max(existing->total_rides, profile.total_rides);
      merged.availability_started_at_ms = existing->availability_started_at_ms;
      merged.daily_availability_hours   = existing->daily_availability_hours;
    }
    auto stored = repository_->UpsertDriverProfile(tx, merged);
    if (!stored) throw std::runtime_error("upsert driver profile " + profile.driver_id + ": " + stored.message);
  });
}

std::optional<db::model::DriverProfileRecord> DispatchEngine::GetDriverProfile(const std::string& driver_id) {
  return db::RunInTransaction(*repository_,
                              [&](db::Transaction& tx) { return repository_->GetDriverProfile(tx, driver_id); });
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

std::vector<std::string> DispatchEngine::LiftExpiredSuspensions() {
  return cancellations_->LiftExpiredSuspensions();
}

void DispatchEngine::PurgeExpired() {
  const auto now_ms = NowMs();
  db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto purged = repository_->PurgeExpired(tx, now_ms);
    if (!purged) throw std::runtime_error("purge expired rows: " + purged.message);
  });
}

std::vector<dispatch::ExpandResult> DispatchEngine::ExpandStaleBroadcasts() {
  const auto  now_ms = NowMs();
  const auto& dp     = policy_.dispatch;

  auto live = db::RunInTransaction(*repository_,
                                   [&](db::Transaction& tx) { return repository_->ListActiveBroadcasts(tx, now_ms); });

  std::vector<dispatch::ExpandResult> expanded;
  for (const auto& b : live) {
    const uint64_t round_started = b.last_expansion_at_ms != 0 ? b.last_expansion_at_ms : b.created_at_ms;
    const auto     timeout_ms    = static_cast<uint64_t>(dp.MatchingTimeout(b.is_extended_area).count());
    if (now_ms < round_started + timeout_ms) continue;
    if (b.radius_km >= dp.max_radius_km || b.broadcast_count >= dp.max_rounds) continue;

    const double step = std::min(dp.ExpansionStepKm(b.is_extended_area), dp.max_radius_km - b.radius_km);
    try {
      auto result = expander_->Expand(b.ride_id, b.radius_km, step);
      if (result.outcome == dispatch::ExpandOutcome::kExpanded) {
        observability::Metrics::Instance().RecordRadiusExpansion("sweep");
        expanded.push_back(std::move(result));
      }
    } catch (const std::exception& e) {
      // one failing ride must not stall the sweep
      RIDEDISPATCH_LOG_WARN("scheduled expansion failed", {observability::StringField("ride_id", b.ride_id),
                                                           observability::StringField("error", e.what())});
    }
  }
  return expanded;
}

EngineStats DispatchEngine::Stats() {
  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    EngineStats stats;
    stats.rides_requested   = repository_->ListRidesByStatus(tx, model::RideStatus::kRequested).size();
    stats.rides_matched     = repository_->ListRidesByStatus(tx, model::RideStatus::kMatched).size() +
                          repository_->ListRidesByStatus(tx, model::RideStatus::kDriverArriving).size();
    stats.rides_in_progress = repository_->ListRidesByStatus(tx, model::RideStatus::kInProgress).size();
    stats.active_broadcasts = repository_->ListActiveBroadcasts(tx, now_ms).size();
    stats.available_drivers = repository_->ListAvailableDrivers(tx, now_ms).size();
    stats.suspended_drivers = repository_->ListSuspendedDrivers(tx).size();
    return stats;
  });
}

} // namespace ridedispatch::core
