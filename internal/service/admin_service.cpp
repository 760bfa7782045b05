#include "admin_service.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/notify/notification_dispatcher.hpp"
#include "observe_rpc.hpp"

namespace ridedispatch::service {

using namespace ridedispatch::services::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

StatsResponse AdminService::Stats(const StatsRequest&) {
  return ObserveRpc("AdminService.Stats", [&] {
    const auto stats = ctx_.engine->Stats();

    StatsResponse resp;
    resp.set_rides_requested(stats.rides_requested);
    resp.set_rides_matched(stats.rides_matched);
    resp.set_rides_in_progress(stats.rides_in_progress);
    resp.set_active_broadcasts(stats.active_broadcasts);
    resp.set_available_drivers(stats.available_drivers);
    resp.set_suspended_drivers(stats.suspended_drivers);

    if (ctx_.notifications) {
      resp.set_notifications_delivered(ctx_.notifications->Delivered());
      resp.set_notifications_failed(ctx_.notifications->Failed());
      resp.set_notifications_pending(ctx_.notifications->Queue()->Pending());
    }
    return resp;
  });
}

LiftSuspensionsResponse AdminService::LiftSuspensions(const LiftSuspensionsRequest&) {
  return ObserveRpc("AdminService.LiftSuspensions", [&] {
    LiftSuspensionsResponse resp;
    for (const auto& driver_id : ctx_.engine->LiftExpiredSuspensions()) resp.add_driver_ids(driver_id);
    return resp;
  });
}

} // namespace ridedispatch::service
