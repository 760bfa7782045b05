#include "ride_service.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace ridedispatch::service {

using namespace ridedispatch::services::v1;

namespace {

void ThrowIfFailed(const lifecycle::LifecycleResult& result) {
  switch (result.outcome) {
    case lifecycle::LifecycleOutcome::kOk:
      return;
    case lifecycle::LifecycleOutcome::kNotFound:
      throw util::NotFound(result.message);
    case lifecycle::LifecycleOutcome::kNotParticipant:
      throw util::PermissionDenied(result.message);
    case lifecycle::LifecycleOutcome::kInvalidState:
      throw util::InvalidState(result.message);
    case lifecycle::LifecycleOutcome::kInvalidArgument:
      throw util::InvalidArgument(result.message);
  }
  throw std::runtime_error("unknown lifecycle outcome");
}

RideResponse ToResponse(const lifecycle::LifecycleResult& result) {
  ThrowIfFailed(result);
  RideResponse resp;
  if (result.ride) *resp.mutable_ride() = ToProto(*result.ride);
  return resp;
}

std::optional<std::string> OptionalReason(const std::string& reason) {
  if (reason.empty()) return std::nullopt;
  return reason;
}

void RequireIds(const std::string& ride_id, const std::string& user_id) {
  if (ride_id.empty() || user_id.empty()) throw util::InvalidArgument("ride and caller ids are required");
}

} // namespace

RideService::RideService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RideResponse RideService::GetRide(const GetRideRequest& req) {
  return ObserveRpc("RideService.GetRide", [&] {
    if (req.ride_id().empty()) throw util::InvalidArgument("ride_id is required");

    auto ride = ctx_.engine->GetRide(req.ride_id());
    if (!ride) throw util::NotFound("ride not found: " + req.ride_id());

    RideResponse resp;
    *resp.mutable_ride() = ToProto(*ride);
    return resp;
  });
}

RideResponse RideService::MarkArriving(const MarkArrivingRequest& req) {
  return ObserveRpc("RideService.MarkArriving", [&] {
    RequireIds(req.ride_id(), req.driver_id());
    return ToResponse(ctx_.engine->MarkArriving(req.ride_id(), req.driver_id()));
  });
}

RideResponse RideService::Start(const StartRideRequest& req) {
  return ObserveRpc("RideService.Start", [&] {
    RequireIds(req.ride_id(), req.driver_id());
    return ToResponse(ctx_.engine->Start(req.ride_id(), req.driver_id()));
  });
}

RideResponse RideService::Complete(const CompleteRideRequest& req) {
  return ObserveRpc("RideService.Complete", [&] {
    RequireIds(req.ride_id(), req.driver_id());
    return ToResponse(ctx_.engine->Complete(req.ride_id(), req.driver_id(), req.actual_distance_km()));
  });
}

CancelRideResponse RideService::Cancel(const CancelRideRequest& req) {
  return ObserveRpc("RideService.Cancel", [&] {
    RequireIds(req.ride_id(), req.user_id());

    auto result = ctx_.engine->Cancel(req.ride_id(), req.user_id(), OptionalReason(req.reason()));
    ThrowIfFailed(result);

    CancelRideResponse resp;
    if (result.ride) *resp.mutable_ride() = ToProto(*result.ride);
    resp.set_cancellation_fee(result.cancellation_fee);
    resp.set_driver_suspended(result.driver_suspended);
    resp.set_re_dispatched(result.re_dispatched);
    return resp;
  });
}

DriverCancelResponse RideService::DriverCancel(const DriverCancelRequest& req) {
  return ObserveRpc("RideService.DriverCancel", [&] {
    RequireIds(req.ride_id(), req.driver_id());

    auto result = ctx_.engine->DriverCancel(req.ride_id(), req.driver_id(), OptionalReason(req.reason()));
    ThrowIfFailed(result);

    DriverCancelResponse resp;
    resp.set_suspended(result.suspended);
    resp.set_cancellation_count(result.cancellation_count);
    if (result.ride) *resp.mutable_ride() = ToProto(*result.ride);
    AppendNotified(result.notified, resp.mutable_notified_drivers());
    return resp;
  });
}

} // namespace ridedispatch::service
