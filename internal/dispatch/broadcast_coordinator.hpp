#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "candidate.hpp"
#include "internal/config/dispatch_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/util/time.hpp"

namespace ridedispatch::dispatch {

struct BroadcastRequest {
  std::string ride_id;

  model::GeoPoint pickup;
  model::GeoPoint destination;
  double          estimated_fare = 0.0;

  // unset = initial radius for the pickup's area
  std::optional<double> radius_km;

  model::RequestClass request_class = model::RequestClass::kRide;

  // extra caller predicate, applied after the area/parcel rules; drivers
  // within the radius that it rejects are excluded for later rounds too
  EligibilityFilter filter;

  // never offered, in this or any later round
  std::vector<std::string> excluded_driver_ids;
};

struct BroadcastOutcome {
  db::model::BroadcastRecord  broadcast;
  std::vector<NotifiedDriver> notified;  // closest first
};

/*
  Selects eligible available drivers around a pickup and fans the offer out.

  Persistence (broadcast record + one pending notification per driver) is
  transactional; real-time pushes are queued only after the commit and never
  fail the broadcast.
*/
class BroadcastCoordinator {
 public:
  BroadcastCoordinator(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                       std::shared_ptr<notify::NotificationQueue> queue, config::DispatchPolicy policy);

  BroadcastOutcome Broadcast(const BroadcastRequest& request);

  // Persists inside the caller's transaction. The caller publishes after commit.
  BroadcastOutcome BroadcastTx(db::Transaction& tx, const BroadcastRequest& request, uint64_t now_ms);

  // Available, located, unsuspended drivers within radius_km of pickup that
  // pass the area/parcel rules, are not in excluded, and pass the optional
  // filter, closest first. Drivers turned away by the filter alone are
  // appended to filtered_out when it is given.
  std::vector<CandidateDriver> FindCandidates(db::Transaction& tx, const model::GeoPoint& pickup, double radius_km,
                                              bool is_extended_area, model::RequestClass request_class,
                                              const std::vector<std::string>& excluded,
                                              const EligibilityFilter& filter, uint64_t now_ms,
                                              std::vector<std::string>* filtered_out = nullptr);

  // Persists a pending notification for each driver at the broadcast's current round.
  void RecordNotifications(db::Transaction& tx, const db::model::BroadcastRecord& broadcast,
                           const std::vector<NotifiedDriver>& drivers, uint64_t now_ms);

  // Queues the real-time offer for each driver.
  void Publish(const db::model::BroadcastRecord& broadcast, const std::vector<NotifiedDriver>& drivers,
               uint64_t now_ms);

  std::optional<db::model::BroadcastRecord> GetBroadcast(const std::string& ride_id);

  // false when there is no active, unexpired broadcast for the ride
  bool CancelBroadcast(const std::string& ride_id);
  bool CancelBroadcastTx(db::Transaction& tx, const std::string& ride_id, uint64_t now_ms);

  const config::DispatchPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<db::Repository>            repository_;
  std::shared_ptr<util::Clock>               clock_;
  std::shared_ptr<notify::NotificationQueue> queue_;
  config::DispatchPolicy                     policy_;
};

} // namespace ridedispatch::dispatch
