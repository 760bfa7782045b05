#include "rejection_tracker.hpp"

#include <set>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace ridedispatch::dispatch {

std::string_view ToString(RejectOutcome outcome) {
  switch (outcome) {
    case RejectOutcome::kRecorded:
      return "recorded";
    case RejectOutcome::kNotFound:
      return "not_found";
    case RejectOutcome::kNotNotified:
      return "not_notified";
    case RejectOutcome::kAlreadyResolved:
      return "already_resolved";
  }
  return "unknown";
}

RejectionTracker::RejectionTracker(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                                   config::DispatchPolicy policy)
    : repository_(std::move(repository)), clock_(std::move(clock)), policy_(std::move(policy)) {
}

RejectResult RejectionTracker::Reject(const std::string& ride_id, const std::string& driver_id) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());

  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    RejectResult r;

    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) {
      r.message = "ride not found: " + ride_id;
      return r;
    }
    if (ride->status != model::RideStatus::kRequested) {
      r.outcome = RejectOutcome::kAlreadyResolved;
      r.message = "ride is " + std::string(model::ToString(ride->status));
      return r;
    }

    auto broadcast = repository_->GetBroadcast(tx, ride_id, now_ms);
    if (!broadcast || broadcast->status != model::BroadcastStatus::kActive) {
      r.message = "no active broadcast for ride " + ride_id;
      return r;
    }
    if (!broadcast->Notified(driver_id)) {
      r.outcome = RejectOutcome::kNotNotified;
      r.message = "driver was not offered ride " + ride_id;
      return r;
    }

    db::model::RejectionRecord rejection;
    rejection.ride_id        = ride_id;
    rejection.driver_id      = driver_id;
    rejection.rejected_at_ms = now_ms;
    rejection.expires_at_ms  = now_ms + static_cast<uint64_t>(policy_.broadcast_ttl.count());

    auto inserted = repository_->InsertRejection(tx, rejection);
    if (!inserted) throw std::runtime_error("record rejection: " + inserted.message);
    auto removed = repository_->DeleteNotification(tx, driver_id, ride_id);
    if (!removed && removed.code != db::ErrorCode::NotFound) {
      throw std::runtime_error("remove notification: " + removed.message);
    }

    std::set<std::string> declined;
    for (const auto& rec : repository_->ListRejections(tx, ride_id, now_ms)) declined.insert(rec.driver_id);

    uint32_t remaining = 0;
    for (const auto& id : broadcast->notified_driver_ids) {
      if (!declined.count(id)) ++remaining;
    }

    r.outcome           = RejectOutcome::kRecorded;
    r.message           = "rejection recorded";
    r.rejection_count   = static_cast<uint32_t>(declined.size());
    r.remaining_drivers = remaining;
    return r;
  });

  RIDEDISPATCH_LOG_DEBUG("ride rejected", {observability::StringField("ride_id", ride_id),
                                           observability::StringField("driver_id", driver_id),
                                           observability::StringField("outcome", ToString(result.outcome))});
  return result;
}

} // namespace ridedispatch::dispatch
