#include "radius_expander.hpp"

#include <algorithm>
#include <cmath>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace ridedispatch::dispatch {

std::string_view ToString(ExpandOutcome outcome) {
  switch (outcome) {
    case ExpandOutcome::kExpanded:
      return "expanded";
    case ExpandOutcome::kNotFound:
      return "not_found";
    case ExpandOutcome::kNotRequested:
      return "not_requested";
  }
  return "unknown";
}

RadiusExpander::RadiusExpander(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                               std::shared_ptr<BroadcastCoordinator> broadcasts)
    : repository_(std::move(repository)), clock_(std::move(clock)), broadcasts_(std::move(broadcasts)) {
}

ExpandResult RadiusExpander::Expand(const std::string& ride_id, std::optional<double> current_radius_km,
                                    std::optional<double> increment_km) {
  if (increment_km && !(*increment_km > 0.0 && std::isfinite(*increment_km))) {
    throw util::InvalidArgument("expansion increment must be positive");
  }
  if (current_radius_km && !(*current_radius_km >= 0.0 && std::isfinite(*current_radius_km))) {
    throw util::InvalidArgument("current radius must be non-negative");
  }

  observability::SpanScope span("dispatch.expand");
  span.SetAttribute("ride_id", ride_id);

  const auto  now_ms = util::ToUnixMillis(clock_->Now());
  const auto& policy = broadcasts_->Policy();

  db::model::BroadcastRecord updated;
  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    ExpandResult r;

    auto ride = repository_->GetRide(tx, ride_id);
    if (!ride) {
      r.message = "ride not found: " + ride_id;
      return r;
    }
    if (ride->status != model::RideStatus::kRequested) {
      r.outcome = ExpandOutcome::kNotRequested;
      r.message = "ride is " + std::string(model::ToString(ride->status));
      return r;
    }

    auto broadcast = repository_->GetBroadcast(tx, ride_id, now_ms);
    if (!broadcast || broadcast->status != model::BroadcastStatus::kActive) {
      r.message = "no active broadcast for ride " + ride_id;
      return r;
    }

    const double current = current_radius_km.value_or(broadcast->radius_km);
    const double step    = increment_km.value_or(policy.ExpansionStepKm(broadcast->is_extended_area));
    const double radius  = current + step;

    auto candidates = broadcasts_->FindCandidates(tx, broadcast->pickup, radius, broadcast->is_extended_area,
                                                  broadcast->request_class, broadcast->excluded_driver_ids, nullptr,
                                                  now_ms);
    for (const auto& c : candidates) {
      if (broadcast->Notified(c.driver_id)) continue;
      broadcast->notified_driver_ids.push_back(c.driver_id);
      r.newly_included.push_back({c.driver_id, c.distance_km});
    }

    broadcast->radius_km            = std::max(broadcast->radius_km, radius);
    broadcast->broadcast_count     += 1;
    broadcast->last_expansion_at_ms = now_ms;
    broadcast->expires_at_ms        = now_ms + static_cast<uint64_t>(policy.broadcast_ttl.count());

    db::ThrowIfError(repository_->UpsertBroadcast(tx, *broadcast), "store broadcast " + ride_id);
    broadcasts_->RecordNotifications(tx, *broadcast, r.newly_included, now_ms);

    r.outcome            = ExpandOutcome::kExpanded;
    r.message            = "radius expanded";
    r.previous_radius_km = current;
    r.new_radius_km      = radius;
    r.broadcast_count    = broadcast->broadcast_count;
    r.total_notified     = static_cast<uint32_t>(broadcast->notified_driver_ids.size());
    updated              = *broadcast;
    return r;
  });

  if (result.outcome == ExpandOutcome::kExpanded) {
    broadcasts_->Publish(updated, result.newly_included, now_ms);
    RIDEDISPATCH_LOG_INFO("broadcast expanded",
                          {observability::StringField("ride_id", ride_id),
                           observability::DoubleField("radius_km", result.new_radius_km),
                           observability::IntField("round", result.broadcast_count),
                           observability::IntField("newly_notified", static_cast<int64_t>(result.newly_included.size()))});
  }
  return result;
}

} // namespace ridedispatch::dispatch
