#include "broadcast_coordinator.hpp"

#include <algorithm>

#include "internal/geo/distance.hpp"
#include "internal/notify/payloads.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ridedispatch::dispatch {

BroadcastCoordinator::BroadcastCoordinator(std::shared_ptr<db::Repository> repository,
                                           std::shared_ptr<util::Clock> clock,
                                           std::shared_ptr<notify::NotificationQueue> queue,
                                           config::DispatchPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), queue_(std::move(queue)),
      policy_(std::move(policy)) {
}

std::vector<CandidateDriver> BroadcastCoordinator::FindCandidates(db::Transaction& tx, const model::GeoPoint& pickup,
                                                                  double radius_km, bool is_extended_area,
                                                                  model::RequestClass request_class,
                                                                  const std::vector<std::string>& excluded,
                                                                  const EligibilityFilter& filter, uint64_t now_ms,
                                                                  std::vector<std::string>* filtered_out) {
  std::vector<CandidateDriver> candidates;

  for (const auto& record : repository_->ListAvailableDrivers(tx, now_ms)) {
    if (!record.location) continue;
    if (std::find(excluded.begin(), excluded.end(), record.driver_id) != excluded.end()) continue;

    const double distance = geo::DistanceKm(pickup, *record.location);
    if (distance > radius_km) continue;

    auto profile = repository_->GetDriverProfile(tx, record.driver_id);
    if (!profile || profile->is_suspended) continue;

    CandidateDriver candidate;
    candidate.driver_id              = record.driver_id;
    candidate.location               = *record.location;
    candidate.distance_km            = distance;
    candidate.accept_extended_area   = profile->accept_extended_area;
    candidate.accept_parcel_delivery = profile->accept_parcel_delivery;

    if (is_extended_area && !candidate.accept_extended_area) continue;
    if (request_class == model::RequestClass::kParcel && !candidate.accept_parcel_delivery) continue;
    if (filter && !filter(candidate)) {
      if (filtered_out != nullptr) filtered_out->push_back(candidate.driver_id);
      continue;
    }

    candidates.push_back(std::move(candidate));
  }

  std::sort(candidates.begin(), candidates.end(), [](const CandidateDriver& a, const CandidateDriver& b) {
    if (a.distance_km != b.distance_km) return a.distance_km < b.distance_km;
    return a.driver_id < b.driver_id;
  });
  return candidates;
}

void BroadcastCoordinator::RecordNotifications(db::Transaction& tx, const db::model::BroadcastRecord& broadcast,
                                               const std::vector<NotifiedDriver>& drivers, uint64_t now_ms) {
  for (const auto& driver : drivers) {
    db::model::NotificationRecord n;
    n.driver_id             = driver.driver_id;
    n.ride_id               = broadcast.ride_id;
    n.request_class         = broadcast.request_class;
    n.pickup                = broadcast.pickup;
    n.destination           = broadcast.destination;
    n.estimated_fare        = broadcast.estimated_fare;
    n.distance_to_pickup_km = driver.distance_km;
    n.is_extended_area      = broadcast.is_extended_area;
    n.broadcast_round       = broadcast.broadcast_count;
    n.notified_at_ms        = now_ms;
    n.expires_at_ms         = broadcast.expires_at_ms;
    db::ThrowIfError(repository_->UpsertNotification(tx, n), "record notification for " + driver.driver_id);
  }
}

BroadcastOutcome BroadcastCoordinator::BroadcastTx(db::Transaction& tx, const BroadcastRequest& request,
                                                   uint64_t now_ms) {
  if (!geo::IsValidCoordinate(request.pickup) || !geo::IsValidCoordinate(request.destination)) {
    throw util::InvalidArgument("invalid pickup or destination for ride " + request.ride_id);
  }

  const bool   extended = policy_.service_area.IsExtendedArea(request.pickup);
  const double radius   = request.radius_km.value_or(policy_.InitialRadiusKm(extended));
  if (!(radius > 0.0)) throw util::InvalidArgument("broadcast radius must be positive");

  BroadcastOutcome outcome;
  auto&            b = outcome.broadcast;

  // a re-broadcast keeps the exclusions of the broadcast it replaces
  if (auto previous = repository_->GetBroadcast(tx, request.ride_id, now_ms)) {
    b.excluded_driver_ids = std::move(previous->excluded_driver_ids);
  }
  for (const auto& id : request.excluded_driver_ids) {
    if (!b.Excluded(id)) b.excluded_driver_ids.push_back(id);
  }

  std::vector<std::string> filtered_out;
  auto candidates = FindCandidates(tx, request.pickup, radius, extended, request.request_class,
                                   b.excluded_driver_ids, request.filter, now_ms, &filtered_out);
  for (auto& id : filtered_out) {
    if (!b.Excluded(id)) b.excluded_driver_ids.push_back(std::move(id));
  }

  b.ride_id          = request.ride_id;
  b.request_class    = request.request_class;
  b.pickup           = request.pickup;
  b.destination      = request.destination;
  b.estimated_fare   = request.estimated_fare;
  b.radius_km        = radius;
  b.is_extended_area = extended;
  b.status           = model::BroadcastStatus::kActive;
  b.broadcast_count  = 1;
  b.created_at_ms    = now_ms;
  b.expires_at_ms    = now_ms + static_cast<uint64_t>(policy_.broadcast_ttl.count());

  for (const auto& c : candidates) {
    b.notified_driver_ids.push_back(c.driver_id);
    outcome.notified.push_back({c.driver_id, c.distance_km});
  }

  // offers from a replaced broadcast are void
  db::ThrowIfError(repository_->DeleteNotificationsForRide(tx, request.ride_id), "clear notifications for " + request.ride_id);
  db::ThrowIfError(repository_->UpsertBroadcast(tx, b), "store broadcast " + request.ride_id);
  RecordNotifications(tx, b, outcome.notified, now_ms);

  return outcome;
}

BroadcastOutcome BroadcastCoordinator::Broadcast(const BroadcastRequest& request) {
  observability::SpanScope span("dispatch.broadcast");
  span.SetAttribute("ride_id", request.ride_id);

  const auto now_ms  = util::ToUnixMillis(clock_->Now());
  auto       outcome = db::RunInTransaction(
      *repository_, [&](db::Transaction& tx) { return BroadcastTx(tx, request, now_ms); });

  Publish(outcome.broadcast, outcome.notified, now_ms);

  RIDEDISPATCH_LOG_INFO("ride broadcast",
                        {observability::StringField("ride_id", request.ride_id),
                         observability::DoubleField("radius_km", outcome.broadcast.radius_km),
                         observability::IntField("notified", static_cast<int64_t>(outcome.notified.size()))});
  return outcome;
}

void BroadcastCoordinator::Publish(const db::model::BroadcastRecord& broadcast,
                                   const std::vector<NotifiedDriver>& drivers, uint64_t now_ms) {
  for (const auto& driver : drivers) {
    queue_->Enqueue(notify::MakeRideRequest(broadcast, driver.driver_id, driver.distance_km, now_ms));
  }
  observability::Metrics::Instance().ObserveBroadcastFanout(broadcast.broadcast_count > 1 ? "expand" : "initial",
                                                            drivers.size());
}

std::optional<db::model::BroadcastRecord> BroadcastCoordinator::GetBroadcast(const std::string& ride_id) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  return db::RunInTransaction(*repository_,
                              [&](db::Transaction& tx) { return repository_->GetBroadcast(tx, ride_id, now_ms); });
}

bool BroadcastCoordinator::CancelBroadcastTx(db::Transaction& tx, const std::string& ride_id, uint64_t now_ms) {
  auto broadcast = repository_->GetBroadcast(tx, ride_id, now_ms);
  if (!broadcast || broadcast->status != model::BroadcastStatus::kActive) return false;

  broadcast->status = model::BroadcastStatus::kCancelled;
  db::ThrowIfError(repository_->UpsertBroadcast(tx, *broadcast), "cancel broadcast " + ride_id);
  db::ThrowIfError(repository_->DeleteNotificationsForRide(tx, ride_id), "clear notifications for " + ride_id);
  return true;
}

bool BroadcastCoordinator::CancelBroadcast(const std::string& ride_id) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  return db::RunInTransaction(*repository_,
                              [&](db::Transaction& tx) { return CancelBroadcastTx(tx, ride_id, now_ms); });
}

} // namespace ridedispatch::dispatch
