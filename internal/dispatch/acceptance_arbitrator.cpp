#include "acceptance_arbitrator.hpp"

#include <stdexcept>

#include "internal/geo/distance.hpp"
#include "internal/notify/payloads.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ridedispatch::dispatch {

namespace {

AcceptResult Outcome(AcceptOutcome outcome, std::string message) {
  AcceptResult result;
  result.outcome = outcome;
  result.message = std::move(message);
  return result;
}

} // namespace

std::string_view ToString(AcceptOutcome outcome) {
  switch (outcome) {
    case AcceptOutcome::kWon:
      return "won";
    case AcceptOutcome::kAlreadyMatched:
      return "already_matched";
    case AcceptOutcome::kBusy:
      return "busy";
    case AcceptOutcome::kNotFound:
      return "not_found";
    case AcceptOutcome::kDriverUnavailable:
      return "driver_unavailable";
    case AcceptOutcome::kRiderMismatch:
      return "rider_mismatch";
    case AcceptOutcome::kNotRequested:
      return "not_requested";
    case AcceptOutcome::kDriverExcluded:
      return "driver_excluded";
  }
  return "unknown";
}

AcceptanceArbitrator::AcceptanceArbitrator(std::shared_ptr<db::Repository> repository,
                                           std::shared_ptr<util::Clock> clock,
                                           std::shared_ptr<lease::LeaseManager> leases,
                                           std::shared_ptr<availability::AvailabilityRegistry> availability,
                                           std::shared_ptr<BroadcastCoordinator> broadcasts,
                                           std::shared_ptr<notify::NotificationQueue> queue,
                                           config::DispatchPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), leases_(std::move(leases)),
      availability_(std::move(availability)), broadcasts_(std::move(broadcasts)), queue_(std::move(queue)),
      policy_(std::move(policy)) {
}

AcceptResult AcceptanceArbitrator::Accept(const std::string& ride_id, const std::string& driver_id,
                                          const std::string& rider_id) {
  observability::SpanScope span("dispatch.accept");
  span.SetAttribute("ride_id", ride_id);
  span.SetAttribute("driver_id", driver_id);

  AcceptResult result;
  {
    auto lease = leases_->TryAcquireScoped(LeaseKey(ride_id));
    if (!lease) {
      result = Contended(ride_id);
    } else {
      result = Arbitrate(ride_id, driver_id, rider_id, util::ToUnixMillis(clock_->Now()));
    }
  }

  observability::Metrics::Instance().RecordArbitrationOutcome(ToString(result.outcome));
  span.SetAttribute("outcome", ToString(result.outcome));

  if (result.outcome == AcceptOutcome::kWon) {
    queue_->Enqueue(notify::MakeRideMatched(*result.ride, result.distance_to_pickup_km,
                                            result.estimated_arrival_minutes, result.ride->matched_at_ms));
    RIDEDISPATCH_LOG_INFO("ride matched", {observability::StringField("ride_id", ride_id),
                                           observability::StringField("driver_id", driver_id),
                                           observability::DoubleField("distance_km", result.distance_to_pickup_km)});
  } else {
    RIDEDISPATCH_LOG_DEBUG("accept lost", {observability::StringField("ride_id", ride_id),
                                           observability::StringField("driver_id", driver_id),
                                           observability::StringField("outcome", ToString(result.outcome))});
  }
  return result;
}

AcceptResult AcceptanceArbitrator::Contended(const std::string& ride_id) {
  auto ride = db::RunInTransaction(*repository_,
                                   [&](db::Transaction& tx) { return repository_->GetRide(tx, ride_id); });
  if (ride && model::IsMatchedOrLater(ride->status)) {
    return Outcome(AcceptOutcome::kAlreadyMatched, "ride already matched to another driver");
  }
  return Outcome(AcceptOutcome::kBusy, "ride is being matched, retry");
}

AcceptResult AcceptanceArbitrator::Arbitrate(const std::string& ride_id, const std::string& driver_id,
                                             const std::string& rider_id, uint64_t now_ms) {
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) -> AcceptResult {
    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) return Outcome(AcceptOutcome::kNotFound, "ride not found: " + ride_id);

    if (model::IsMatchedOrLater(ride->status)) {
      return Outcome(AcceptOutcome::kAlreadyMatched, "ride already matched to another driver");
    }
    if (ride->status != model::RideStatus::kRequested) {
      return Outcome(AcceptOutcome::kNotRequested, "ride is no longer requested");
    }
    if (ride->rider_id != rider_id) {
      return Outcome(AcceptOutcome::kRiderMismatch, "rider does not own ride " + ride_id);
    }

    if (auto broadcast = repository_->GetBroadcast(tx, ride_id, now_ms); broadcast && broadcast->Excluded(driver_id)) {
      return Outcome(AcceptOutcome::kDriverExcluded, "driver is excluded from ride " + ride_id);
    }

    auto availability = repository_->GetAvailability(tx, driver_id, now_ms);
    if (!availability || availability->status != model::DriverStatus::kAvailable) {
      return Outcome(AcceptOutcome::kDriverUnavailable, "driver is not available: " + driver_id);
    }

    AcceptResult result;
    result.outcome = AcceptOutcome::kWon;
    result.message = "ride matched";

    if (availability->location) {
      result.distance_to_pickup_km = geo::DistanceKm(*availability->location, ride->pickup);
      result.estimated_arrival_minutes =
          static_cast<uint32_t>(result.distance_to_pickup_km / policy_.average_speed_kmh * 60.0);
    }

    auto matched          = *ride;
    matched.status        = model::RideStatus::kMatched;
    matched.driver_id     = driver_id;
    matched.matched_at_ms = now_ms;

    auto cas = repository_->UpdateRideIfStatus(tx, matched, model::RideStatus::kRequested);
    if (cas.code == db::ErrorCode::Conflict) {
      return Outcome(AcceptOutcome::kAlreadyMatched, "ride already matched to another driver");
    }
    if (!cas) throw std::runtime_error("match ride " + ride_id + ": " + cas.message);

    availability_->SetStatusTx(tx, driver_id, model::DriverStatus::kBusy, now_ms);
    broadcasts_->CancelBroadcastTx(tx, ride_id, now_ms);

    result.ride   = repository_->GetRide(tx, ride_id);
    result.driver = repository_->GetDriverProfile(tx, driver_id);
    return result;
  });
}

} // namespace ridedispatch::dispatch
