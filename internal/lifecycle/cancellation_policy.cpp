#include "cancellation_policy.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ridedispatch::lifecycle {

namespace {

constexpr const char* kDefaultDriverReason = "Driver cancelled";

} // namespace

CancellationPolicy::CancellationPolicy(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                       std::shared_ptr<availability::AvailabilityRegistry> availability,
                                       std::shared_ptr<dispatch::BroadcastCoordinator> broadcasts,
                                       config::SuspensionPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), availability_(std::move(availability)),
      broadcasts_(std::move(broadcasts)), policy_(policy) {
}

DriverCancelResult CancellationPolicy::DriverCancel(const std::string& ride_id, const std::string& driver_id,
                                                    const std::optional<std::string>& reason) {
  observability::SpanScope span("lifecycle.driver_cancel");
  span.SetAttribute("ride_id", ride_id);

  const auto  now_ms    = util::ToUnixMillis(clock_->Now());
  const auto  window_ms = static_cast<uint64_t>(policy_.window.count());
  const auto& dispatch  = broadcasts_->Policy();

  db::model::BroadcastRecord broadcast;
  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    DriverCancelResult r;

    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) {
      r.outcome = LifecycleOutcome::kNotFound;
      r.message = "ride not found: " + ride_id;
      return r;
    }
    if (ride->driver_id.empty() || ride->driver_id != driver_id) {
      r.outcome = LifecycleOutcome::kNotParticipant;
      r.message = "ride " + ride_id + " is not assigned to driver " + driver_id;
      return r;
    }
    const auto previous = ride->status;
    if (previous != model::RideStatus::kMatched && previous != model::RideStatus::kDriverArriving) {
      r.outcome = LifecycleOutcome::kInvalidState;
      r.message = "ride cannot be cancelled by the driver while " + std::string(model::ToString(previous));
      return r;
    }
    auto found = repository_->GetDriverProfile(tx, driver_id);
    if (!found) {
      r.outcome = LifecycleOutcome::kNotFound;
      r.message = "driver not found: " + driver_id;
      return r;
    }

    auto profile = std::move(*found);
    if (profile.last_reset_at_ms == 0) {
      profile.last_reset_at_ms = now_ms;
    } else if (now_ms > profile.last_reset_at_ms && now_ms - profile.last_reset_at_ms > window_ms) {
      profile.cancellation_count = 0;
      profile.last_reset_at_ms   = now_ms;
    }
    profile.cancellation_count += 1;

    r.suspended          = profile.cancellation_count > policy_.threshold;
    r.cancellation_count = profile.cancellation_count;
    if (r.suspended) {
      profile.is_suspended    = true;
      profile.suspended_at_ms = now_ms;
    }

    // status write first: it rewrites the profile's status and hours
    availability_->SetStatusTx(tx, driver_id,
                               r.suspended ? model::DriverStatus::kUnavailable : model::DriverStatus::kAvailable,
                               now_ms);
    auto mirrored                      = repository_->GetDriverProfile(tx, driver_id);
    profile.status                     = mirrored->status;
    profile.availability_started_at_ms = mirrored->availability_started_at_ms;
    profile.daily_availability_hours   = mirrored->daily_availability_hours;
    auto stored                        = repository_->UpsertDriverProfile(tx, profile);
    if (!stored) throw std::runtime_error("update driver profile " + driver_id + ": " + stored.message);

    auto reverted                      = *ride;
    reverted.status                    = model::RideStatus::kRequested;
    reverted.driver_id.clear();
    reverted.matched_at_ms             = 0;
    reverted.cancelled_by              = driver_id;
    reverted.cancellation_reason       = reason && !reason->empty() ? *reason : kDefaultDriverReason;
    reverted.cancellation_timestamp_ms = now_ms;

    auto cas = repository_->UpdateRideIfStatus(tx, reverted, previous);
    if (cas.code == db::ErrorCode::Conflict) {
      throw db::TransactionConflict("ride " + ride_id + " changed during driver cancellation");
    }
    if (!cas) throw std::runtime_error("revert ride " + ride_id + ": " + cas.message);

    dispatch::BroadcastRequest request;
    request.ride_id        = ride_id;
    request.pickup         = ride->pickup;
    request.destination    = ride->destination;
    request.estimated_fare = ride->estimated_fare;
    request.radius_km      = dispatch.redispatch_radius_km;
    request.request_class  = ride->request_class;
    request.excluded_driver_ids.push_back(driver_id);

    auto outcome = broadcasts_->BroadcastTx(tx, request, now_ms);
    broadcast    = outcome.broadcast;
    r.notified   = std::move(outcome.notified);
    r.ride       = repository_->GetRide(tx, ride_id);
    r.message    = r.suspended ? "driver cancellation recorded, driver suspended" : "driver cancellation recorded";
    return r;
  });

  if (result.ok()) {
    broadcasts_->Publish(broadcast, result.notified, now_ms);
    observability::Metrics::Instance().RecordDriverCancellation(result.suspended);
    RIDEDISPATCH_LOG_INFO("driver cancelled ride",
                          {observability::StringField("ride_id", ride_id),
                           observability::StringField("driver_id", driver_id),
                           observability::IntField("cancellation_count", result.cancellation_count),
                           observability::BoolField("suspended", result.suspended),
                           observability::IntField("renotified", static_cast<int64_t>(result.notified.size()))});
  }
  return result;
}

std::vector<std::string> CancellationPolicy::LiftExpiredSuspensions() {
  const auto now_ms      = util::ToUnixMillis(clock_->Now());
  const auto duration_ms = static_cast<uint64_t>(policy_.duration.count());

  auto lifted = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    std::vector<std::string> ids;
    for (auto profile : repository_->ListSuspendedDrivers(tx)) {
      if (now_ms <= profile.suspended_at_ms || now_ms - profile.suspended_at_ms <= duration_ms) continue;

      profile.is_suspended       = false;
      profile.suspended_at_ms    = 0;
      profile.cancellation_count = 0;
      profile.last_reset_at_ms   = now_ms;

      auto stored = repository_->UpsertDriverProfile(tx, profile);
      if (!stored) throw std::runtime_error("lift suspension " + profile.driver_id + ": " + stored.message);
      ids.push_back(profile.driver_id);
    }
    return ids;
  });

  for (const auto& id : lifted) {
    RIDEDISPATCH_LOG_INFO("suspension lifted", {observability::StringField("driver_id", id)});
  }
  return lifted;
}

} // namespace ridedispatch::lifecycle
