#include "driver_service.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/notify/payloads.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "observe_rpc.hpp"
#include "proto_mapping.hpp"

namespace ridedispatch::service {

using namespace ridedispatch::services::v1;

namespace {

void RequireDriver(const std::string& driver_id) {
  if (driver_id.empty()) throw util::InvalidArgument("driver_id is required");
}

DriverStatusResponse Found(const db::model::DriverAvailabilityRecord& record) {
  DriverStatusResponse resp;
  resp.set_found(true);
  *resp.mutable_availability() = ToProto(record);
  return resp;
}

} // namespace

DriverService::DriverService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

DriverStatusResponse DriverService::SetAvailable(const SetAvailableRequest& req) {
  return ObserveRpc("DriverService.SetAvailable", [&] {
    RequireDriver(req.driver_id());
    if (!req.has_location()) throw util::InvalidArgument("location is required");

    auto update = ctx_.engine->SetDriverAvailable(req.driver_id(), FromProto(req.location()));
    return Found(update.record);
  });
}

DriverStatusResponse DriverService::SetUnavailable(const DriverIdRequest& req) {
  return ObserveRpc("DriverService.SetUnavailable", [&] {
    RequireDriver(req.driver_id());
    auto update = ctx_.engine->SetDriverUnavailable(req.driver_id());
    RIDEDISPATCH_LOG_DEBUG("driver went offline", {observability::StringField("driver_id", req.driver_id()),
                                                   observability::DoubleField("daily_hours", update.total_daily_hours)});
    return Found(update.record);
  });
}

DriverStatusResponse DriverService::SetBusy(const DriverIdRequest& req) {
  return ObserveRpc("DriverService.SetBusy", [&] {
    RequireDriver(req.driver_id());
    return Found(ctx_.engine->SetDriverBusy(req.driver_id()).record);
  });
}

DriverStatusResponse DriverService::UpdateLocation(const UpdateLocationRequest& req) {
  return ObserveRpc("DriverService.UpdateLocation", [&] {
    RequireDriver(req.driver_id());
    if (!req.has_location()) throw util::InvalidArgument("location is required");

    return Found(ctx_.engine->UpdateDriverLocation(req.driver_id(), FromProto(req.location())));
  });
}

DriverStatusResponse DriverService::GetDriverStatus(const DriverIdRequest& req) {
  return ObserveRpc("DriverService.GetDriverStatus", [&] {
    RequireDriver(req.driver_id());

    auto record = ctx_.engine->GetDriverStatus(req.driver_id());
    if (!record) {
      DriverStatusResponse resp;
      resp.set_found(false);
      return resp;
    }
    return Found(*record);
  });
}

void DriverService::UpsertProfile(const UpsertProfileRequest& req) {
  ObserveRpc("DriverService.UpsertProfile", [&] {
    if (!req.has_profile()) throw util::InvalidArgument("profile is required");
    RequireDriver(req.profile().driver_id());
    ctx_.engine->UpsertDriverProfile(FromProto(req.profile()));
  });
}

std::shared_ptr<notify::Subscription> DriverService::Subscribe(
    const std::string& user_id, std::vector<ridedispatch::v1::DispatchNotification>* backlog) {
  return ObserveRpc("DriverService.SubscribeNotifications", [&] {
    if (user_id.empty()) throw util::InvalidArgument("user_id is required");
    if (!ctx_.subscriptions) throw util::Unavailable("notification streams are disabled");

    auto subscription = ctx_.subscriptions->Subscribe(user_id);
    if (backlog) {
      for (const auto& offer : ctx_.engine->PendingNotifications(user_id)) {
        backlog->push_back(notify::MakeRideRequest(offer).payload);
      }
    }

    RIDEDISPATCH_LOG_INFO("notification stream opened",
                          {observability::StringField("user_id", user_id),
                           observability::IntField("backlog", backlog ? static_cast<int64_t>(backlog->size()) : 0)});
    return subscription;
  });
}

void DriverService::Unsubscribe(const std::string& user_id, const std::shared_ptr<notify::Subscription>& subscription) {
  if (!ctx_.subscriptions || !subscription) return;
  ctx_.subscriptions->Unsubscribe(user_id, subscription);
  RIDEDISPATCH_LOG_INFO("notification stream closed", {observability::StringField("user_id", user_id)});
}

} // namespace ridedispatch::service
