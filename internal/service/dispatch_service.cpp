#include "dispatch_service.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace ridedispatch::service {

using namespace ridedispatch::services::v1;

namespace {

AcceptOutcome ToProto(dispatch::AcceptOutcome outcome) {
  switch (outcome) {
    case dispatch::AcceptOutcome::kWon:
      return ACCEPT_OUTCOME_WON;
    case dispatch::AcceptOutcome::kAlreadyMatched:
      return ACCEPT_OUTCOME_ALREADY_MATCHED;
    case dispatch::AcceptOutcome::kBusy:
      return ACCEPT_OUTCOME_BUSY;
    case dispatch::AcceptOutcome::kNotFound:
      return ACCEPT_OUTCOME_NOT_FOUND;
    case dispatch::AcceptOutcome::kDriverUnavailable:
      return ACCEPT_OUTCOME_DRIVER_UNAVAILABLE;
    case dispatch::AcceptOutcome::kRiderMismatch:
      return ACCEPT_OUTCOME_RIDER_MISMATCH;
    case dispatch::AcceptOutcome::kNotRequested:
      return ACCEPT_OUTCOME_NOT_REQUESTED;
    case dispatch::AcceptOutcome::kDriverExcluded:
      return ACCEPT_OUTCOME_DRIVER_EXCLUDED;
  }
  return ACCEPT_OUTCOME_UNSPECIFIED;
}

RejectOutcome ToProto(dispatch::RejectOutcome outcome) {
  switch (outcome) {
    case dispatch::RejectOutcome::kRecorded:
      return REJECT_OUTCOME_RECORDED;
    case dispatch::RejectOutcome::kNotFound:
      return REJECT_OUTCOME_NOT_FOUND;
    case dispatch::RejectOutcome::kNotNotified:
      return REJECT_OUTCOME_NOT_NOTIFIED;
    case dispatch::RejectOutcome::kAlreadyResolved:
      return REJECT_OUTCOME_ALREADY_RESOLVED;
  }
  return REJECT_OUTCOME_UNSPECIFIED;
}

void RequireId(const std::string& value, const char* field) {
  if (value.empty()) throw util::InvalidArgument(std::string(field) + " is required");
}

} // namespace

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RequestRideResponse DispatchService::RequestRide(const RequestRideRequest& req) {
  return ObserveRpc("DispatchService.RequestRide", [&] {
    if (!req.has_pickup() || !req.has_destination()) {
      throw util::InvalidArgument("pickup and destination are required");
    }

    core::RideRequest request;
    request.rider_id         = req.rider_id();
    request.pickup           = FromProto(req.pickup());
    request.destination      = FromProto(req.destination());
    request.surge_multiplier = req.surge_multiplier() == 0.0 ? 1.0 : req.surge_multiplier();
    request.request_class    = FromProto(req.request_class());

    auto outcome = ctx_.engine->RequestRide(request);

    RequestRideResponse resp;
    *resp.mutable_ride() = service::ToProto(outcome.ride);
    resp.set_radius_km(outcome.broadcast.broadcast.radius_km);
    AppendNotified(outcome.broadcast.notified, resp.mutable_notified_drivers());
    return resp;
  });
}

BroadcastResponse DispatchService::Broadcast(const BroadcastRequest& req) {
  return ObserveRpc("DispatchService.Broadcast", [&] {
    RequireId(req.ride_id(), "ride_id");
    if (req.radius_km() < 0.0) throw util::InvalidArgument("radius_km must not be negative");

    std::optional<double> radius;
    if (req.radius_km() > 0.0) radius = req.radius_km();
    auto outcome = ctx_.engine->Broadcast(req.ride_id(), radius);

    BroadcastResponse resp;
    resp.set_ride_id(req.ride_id());
    resp.set_radius_km(outcome.broadcast.radius_km);
    resp.set_is_extended_area(outcome.broadcast.is_extended_area);
    AppendNotified(outcome.notified, resp.mutable_notified_drivers());
    return resp;
  });
}

AcceptResponse DispatchService::Accept(const AcceptRequest& req) {
  return ObserveRpc("DispatchService.Accept", [&] {
    RequireId(req.ride_id(), "ride_id");
    RequireId(req.driver_id(), "driver_id");

    auto result = ctx_.engine->Accept(req.ride_id(), req.driver_id(), req.rider_id());

    AcceptResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_message(result.message);
    if (result.outcome == dispatch::AcceptOutcome::kWon) {
      resp.set_matched_driver_id(result.ride->driver_id);
      resp.set_distance_to_pickup_km(result.distance_to_pickup_km);
      resp.set_estimated_arrival_minutes(result.estimated_arrival_minutes);
      if (result.driver) *resp.mutable_driver() = service::ToProto(*result.driver);
    }
    return resp;
  });
}

RejectResponse DispatchService::Reject(const RejectRequest& req) {
  return ObserveRpc("DispatchService.Reject", [&] {
    RequireId(req.ride_id(), "ride_id");
    RequireId(req.driver_id(), "driver_id");

    auto result = ctx_.engine->Reject(req.ride_id(), req.driver_id());

    RejectResponse resp;
    resp.set_outcome(ToProto(result.outcome));
    resp.set_message(result.message);
    resp.set_rejection_count(result.rejection_count);
    resp.set_remaining_drivers(result.remaining_drivers);
    return resp;
  });
}

ExpandResponse DispatchService::Expand(const ExpandRequest& req) {
  return ObserveRpc("DispatchService.Expand", [&] {
    RequireId(req.ride_id(), "ride_id");

    std::optional<double> current;
    std::optional<double> increment;
    if (req.current_radius_km() > 0.0) current = req.current_radius_km();
    if (req.increment_km() != 0.0) increment = req.increment_km();

    auto result = ctx_.engine->Expand(req.ride_id(), current, increment);
    switch (result.outcome) {
      case dispatch::ExpandOutcome::kNotFound:
        throw util::NotFound(result.message);
      case dispatch::ExpandOutcome::kNotRequested:
        throw util::InvalidState(result.message);
      case dispatch::ExpandOutcome::kExpanded:
        break;
    }

    ExpandResponse resp;
    resp.set_previous_radius_km(result.previous_radius_km);
    resp.set_new_radius_km(result.new_radius_km);
    resp.set_broadcast_count(result.broadcast_count);
    for (const auto& driver : result.newly_included) resp.add_newly_included_driver_ids(driver.driver_id);
    resp.set_total_notified_drivers(result.total_notified);
    return resp;
  });
}

GetBroadcastResponse DispatchService::GetBroadcast(const GetBroadcastRequest& req) {
  return ObserveRpc("DispatchService.GetBroadcast", [&] {
    RequireId(req.ride_id(), "ride_id");

    auto broadcast = ctx_.engine->GetBroadcast(req.ride_id());
    if (!broadcast) throw util::NotFound("no broadcast for ride " + req.ride_id());

    GetBroadcastResponse resp;
    *resp.mutable_broadcast() = service::ToProto(*broadcast);
    return resp;
  });
}

} // namespace ridedispatch::service
