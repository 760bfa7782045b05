#include "ride_lifecycle.hpp"

#include <cmath>
#include <stdexcept>

#include "internal/notify/payloads.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ridedispatch::lifecycle {

namespace {

template <typename R>
R Reject(LifecycleOutcome outcome, std::string message) {
  R r;
  r.outcome = outcome;
  r.message = std::move(message);
  return r;
}

void CommitStatus(db::Repository& repository, db::Transaction& tx, const db::model::RideRecord& ride,
                  model::RideStatus expected) {
  auto cas = repository.UpdateRideIfStatus(tx, ride, expected);
  if (cas.code == db::ErrorCode::Conflict) {
    throw db::TransactionConflict("ride " + ride.ride_id + " changed concurrently");
  }
  if (!cas) throw std::runtime_error("update ride " + ride.ride_id + ": " + cas.message);
}

} // namespace

RideLifecycle::RideLifecycle(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                             std::shared_ptr<availability::AvailabilityRegistry> availability,
                             std::shared_ptr<dispatch::BroadcastCoordinator> broadcasts,
                             std::shared_ptr<CancellationPolicy> cancellations,
                             std::shared_ptr<notify::NotificationQueue> queue, fare::FareCalculator fares)
    : repository_(std::move(repository)), clock_(std::move(clock)), availability_(std::move(availability)),
      broadcasts_(std::move(broadcasts)), cancellations_(std::move(cancellations)), queue_(std::move(queue)),
      fares_(std::move(fares)) {
}

LifecycleResult RideLifecycle::Advance(const std::string& ride_id, const std::string& driver_id,
                                       model::RideStatus to) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) return Reject<LifecycleResult>(LifecycleOutcome::kNotFound, "ride not found: " + ride_id);
    if (ride->driver_id.empty() || ride->driver_id != driver_id) {
      return Reject<LifecycleResult>(LifecycleOutcome::kNotParticipant,
                                     "ride " + ride_id + " is not assigned to driver " + driver_id);
    }

    const auto from = ride->status;
    // starting straight from MATCHED implies the driver arrived
    const bool implied_arrival = from == model::RideStatus::kMatched && to == model::RideStatus::kInProgress;
    if (!model::CanTransition(from, to) && !implied_arrival) {
      return Reject<LifecycleResult>(LifecycleOutcome::kInvalidState, "cannot move ride from " +
                                                                          std::string(model::ToString(from)) + " to " +
                                                                          std::string(model::ToString(to)));
    }

    ride->status = to;
    if (to == model::RideStatus::kInProgress) {
      ride->start_time_ms = now_ms;
      if (ride->pickup_time_ms == 0) ride->pickup_time_ms = now_ms;
    }
    CommitStatus(*repository_, tx, *ride, from);

    LifecycleResult r;
    r.message = "ride " + std::string(model::ToString(to));
    r.ride    = repository_->GetRide(tx, ride_id);
    return r;
  });

  if (result.ok()) {
    RIDEDISPATCH_LOG_INFO("ride status changed", {observability::StringField("ride_id", ride_id),
                                                  observability::StringField("status", model::ToString(to))});
  }
  return result;
}

LifecycleResult RideLifecycle::MarkArriving(const std::string& ride_id, const std::string& driver_id) {
  observability::SpanScope span("lifecycle.mark_arriving");
  return Advance(ride_id, driver_id, model::RideStatus::kDriverArriving);
}

LifecycleResult RideLifecycle::Start(const std::string& ride_id, const std::string& driver_id) {
  observability::SpanScope span("lifecycle.start");
  return Advance(ride_id, driver_id, model::RideStatus::kInProgress);
}

LifecycleResult RideLifecycle::Complete(const std::string& ride_id, const std::string& driver_id,
                                        double actual_distance_km) {
  observability::SpanScope span("lifecycle.complete");
  if (!std::isfinite(actual_distance_km) || actual_distance_km < 0.0) {
    return Reject<LifecycleResult>(LifecycleOutcome::kInvalidArgument, "actual distance must be non-negative");
  }

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  bool fare_protected = false;
  auto result         = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) return Reject<LifecycleResult>(LifecycleOutcome::kNotFound, "ride not found: " + ride_id);
    if (ride->driver_id.empty() || ride->driver_id != driver_id) {
      return Reject<LifecycleResult>(LifecycleOutcome::kNotParticipant,
                                     "ride " + ride_id + " is not assigned to driver " + driver_id);
    }
    if (ride->status != model::RideStatus::kInProgress) {
      return Reject<LifecycleResult>(LifecycleOutcome::kInvalidState,
                                     "ride is " + std::string(model::ToString(ride->status)) + ", not IN_PROGRESS");
    }

    const double surge = ride->fare_breakdown.surge >= 1.0 ? ride->fare_breakdown.surge : 1.0;
    const auto   quote = fares_.Actual(actual_distance_km, ride->estimated_fare, surge);
    fare_protected     = quote.fare_protected;

    ride->status          = model::RideStatus::kCompleted;
    ride->final_fare      = quote.total;
    ride->fare_breakdown  = quote.breakdown;
    ride->completed_at_ms = now_ms;
    CommitStatus(*repository_, tx, *ride, model::RideStatus::kInProgress);

    availability_->SetStatusTx(tx, driver_id, model::DriverStatus::kAvailable, now_ms);
    if (auto profile = repository_->GetDriverProfile(tx, driver_id)) {
      profile->total_rides += 1;
      auto stored = repository_->UpsertDriverProfile(tx, *profile);
      if (!stored) throw std::runtime_error("update driver profile " + driver_id + ": " + stored.message);
    }

    LifecycleResult r;
    r.message = "ride completed";
    r.ride    = repository_->GetRide(tx, ride_id);
    return r;
  });

  if (result.ok()) {
    const double final_fare = *result.ride->final_fare;
    observability::Metrics::Instance().ObserveCompletedFare(final_fare, fare_protected);
    RIDEDISPATCH_LOG_INFO("ride completed", {observability::StringField("ride_id", ride_id),
                                             observability::DoubleField("actual_distance_km", actual_distance_km),
                                             observability::DoubleField("final_fare", final_fare),
                                             observability::BoolField("fare_protected", fare_protected)});
  }
  return result;
}

CancelResult RideLifecycle::Cancel(const std::string& ride_id, const std::string& user_id,
                                   const std::optional<std::string>& reason) {
  observability::SpanScope span("lifecycle.cancel");
  span.SetAttribute("ride_id", ride_id);

  const auto now_ms = util::ToUnixMillis(clock_->Now());

  bool delegate = false;
  auto result   = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    delegate  = false;
    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) return Reject<CancelResult>(LifecycleOutcome::kNotFound, "ride not found: " + ride_id);

    const bool is_rider  = ride->rider_id == user_id;
    const bool is_driver = !ride->driver_id.empty() && ride->driver_id == user_id;
    if (!is_rider && !is_driver) {
      return Reject<CancelResult>(LifecycleOutcome::kNotParticipant, "not authorized to cancel ride " + ride_id);
    }

    const auto from = ride->status;
    if (!model::CanTransition(from, model::RideStatus::kCancelled)) {
      return Reject<CancelResult>(LifecycleOutcome::kInvalidState,
                                  "cannot cancel a ride that is " + std::string(model::ToString(from)));
    }

    if (is_driver && !is_rider) {
      delegate = true;
      return CancelResult{};
    }

    CancelResult r;
    r.cancellation_fee = from == model::RideStatus::kRequested ? 0.0 : fares_.RiderCancellationFee();

    const std::string assigned = ride->driver_id;
    ride->status                    = model::RideStatus::kCancelled;
    ride->cancelled_by              = user_id;
    ride->cancellation_reason       = reason.value_or("");
    ride->cancellation_fee          = r.cancellation_fee;
    ride->cancellation_timestamp_ms = now_ms;
    CommitStatus(*repository_, tx, *ride, from);

    broadcasts_->CancelBroadcastTx(tx, ride_id, now_ms);
    if (!assigned.empty()) {
      availability_->SetStatusTx(tx, assigned, model::DriverStatus::kAvailable, now_ms);
    }

    r.message = "ride cancelled";
    r.ride    = repository_->GetRide(tx, ride_id);
    return r;
  });

  if (delegate) {
    auto driver = cancellations_->DriverCancel(ride_id, user_id, reason);

    CancelResult r;
    r.outcome          = driver.outcome;
    r.message          = driver.message;
    r.ride             = driver.ride;
    r.driver_suspended = driver.suspended;
    r.re_dispatched    = driver.ok();
    return r;
  }

  if (result.ok()) {
    if (!result.ride->driver_id.empty()) {
      queue_->Enqueue(notify::MakeRideCancelled(*result.ride, result.ride->driver_id, now_ms));
    }
    RIDEDISPATCH_LOG_INFO("ride cancelled", {observability::StringField("ride_id", ride_id),
                                             observability::StringField("cancelled_by", user_id),
                                             observability::DoubleField("fee", result.cancellation_fee)});
  }
  return result;
}

} // namespace ridedispatch::lifecycle
