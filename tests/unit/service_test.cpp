#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/grpc/grpc_error.hpp"
#include "internal/notify/notification_dispatcher.hpp"
#include "internal/notify/subscription_hub.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/proto_mapping.hpp"
#include "internal/service/ride_service.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using namespace ridedispatch::services::v1;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

struct Services {
  EngineFixture                                   f;
  std::shared_ptr<notify::SubscriptionHub>        hub = std::make_shared<notify::SubscriptionHub>();
  std::shared_ptr<notify::NotificationDispatcher> dispatcher =
      std::make_shared<notify::NotificationDispatcher>(f.queue, hub);

  service::ServiceContext Context() {
    service::ServiceContext ctx;
    ctx.engine        = f.engine;
    ctx.notifications = dispatcher;
    ctx.subscriptions = hub;
    return ctx;
  }

  service::DispatchService dispatch{Context()};
  service::RideService     rides{Context()};
  service::DriverService   drivers{Context()};
  service::AdminService    admin{Context()};

  void OnboardDriver(const std::string& id, const model::GeoPoint& at, bool parcel = false) {
    UpsertProfileRequest profile;
    profile.mutable_profile()->set_driver_id(id);
    profile.mutable_profile()->set_name("Driver " + id);
    profile.mutable_profile()->set_accept_extended_area(true);
    profile.mutable_profile()->set_accept_parcel_delivery(parcel);
    profile.mutable_profile()->mutable_vehicle()->set_registration_number("MP09-" + id);
    drivers.UpsertProfile(profile);

    SetAvailableRequest available;
    available.set_driver_id(id);
    available.mutable_location()->set_latitude(at.latitude);
    available.mutable_location()->set_longitude(at.longitude);
    drivers.SetAvailable(available);
  }

  RequestRideResponse RequestRide(const std::string& rider) {
    RequestRideRequest req;
    req.set_rider_id(rider);
    req.mutable_pickup()->set_latitude(kCityCenter.latitude);
    req.mutable_pickup()->set_longitude(kCityCenter.longitude);
    const auto dest = NorthOf(kCityCenter, 5.0);
    req.mutable_destination()->set_latitude(dest.latitude);
    req.mutable_destination()->set_longitude(dest.longitude);
    return dispatch.RequestRide(req);
  }
};

// Runs fn and returns the status code the gRPC adapter would send.
template <typename Fn>
::grpc::StatusCode CodeOf(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception& e) {
    return ridedispatch::grpc::ToStatus(e).error_code();
  }
  return ::grpc::StatusCode::OK;
}

void TestRequestAcceptAndCompleteOverRpcTypes() {
  Services s;
  s.OnboardDriver("d1", NorthOf(kCityCenter, 1.0));

  auto requested = s.RequestRide("rider-1");
  assert(requested.ride().status() == ridedispatch::v1::RIDE_STATUS_REQUESTED);
  assert(Near(requested.ride().estimated_fare(), 90.0));
  assert(Near(requested.radius_km(), 5.0));
  assert(requested.notified_drivers_size() == 1);
  const auto ride_id = requested.ride().ride_id();

  AcceptRequest accept;
  accept.set_ride_id(ride_id);
  accept.set_driver_id("d1");
  accept.set_rider_id("rider-1");
  auto won = s.dispatch.Accept(accept);
  assert(won.outcome() == ACCEPT_OUTCOME_WON);
  assert(won.matched_driver_id() == "d1");
  assert(won.driver().vehicle().registration_number() == "MP09-d1");

  auto lost = s.dispatch.Accept(accept);
  assert(lost.outcome() == ACCEPT_OUTCOME_ALREADY_MATCHED);
  assert(lost.matched_driver_id().empty());

  StartRideRequest start;
  start.set_ride_id(ride_id);
  start.set_driver_id("d1");
  assert(s.rides.Start(start).ride().status() == ridedispatch::v1::RIDE_STATUS_IN_PROGRESS);

  CompleteRideRequest complete;
  complete.set_ride_id(ride_id);
  complete.set_driver_id("d1");
  complete.set_actual_distance_km(5.0);
  auto done = s.rides.Complete(complete);
  assert(done.ride().status() == ridedispatch::v1::RIDE_STATUS_COMPLETED);
  assert(Near(done.ride().final_fare(), 90.0));
  assert(done.ride().has_completed_at());
}

void TestErrorsMapToStatusCodes() {
  Services s;
  s.OnboardDriver("d1", NorthOf(kCityCenter, 1.0));
  const auto ride_id = s.RequestRide("rider-1").ride().ride_id();

  GetRideRequest missing;
  missing.set_ride_id("missing");
  assert(CodeOf([&] { s.rides.GetRide(missing); }) == ::grpc::StatusCode::NOT_FOUND);

  RequestRideRequest no_pickup;
  no_pickup.set_rider_id("rider-2");
  assert(CodeOf([&] { s.dispatch.RequestRide(no_pickup); }) == ::grpc::StatusCode::INVALID_ARGUMENT);

  BroadcastRequest negative;
  negative.set_ride_id(ride_id);
  negative.set_radius_km(-1.0);
  assert(CodeOf([&] { s.dispatch.Broadcast(negative); }) == ::grpc::StatusCode::INVALID_ARGUMENT);

  ExpandRequest expand_missing;
  expand_missing.set_ride_id("missing");
  assert(CodeOf([&] { s.dispatch.Expand(expand_missing); }) == ::grpc::StatusCode::NOT_FOUND);

  MarkArrivingRequest stranger;
  stranger.set_ride_id(ride_id);
  stranger.set_driver_id("d1");
  assert(CodeOf([&] { s.rides.MarkArriving(stranger); }) == ::grpc::StatusCode::PERMISSION_DENIED);

  CancelRideRequest cancel;
  cancel.set_ride_id(ride_id);
  cancel.set_user_id("rider-1");
  assert(CodeOf([&] { s.rides.Cancel(cancel); }) == ::grpc::StatusCode::OK);
  assert(CodeOf([&] { s.rides.Cancel(cancel); }) == ::grpc::StatusCode::FAILED_PRECONDITION);

  ExpandRequest expand_cancelled;
  expand_cancelled.set_ride_id(ride_id);
  assert(CodeOf([&] { s.dispatch.Expand(expand_cancelled); }) == ::grpc::StatusCode::FAILED_PRECONDITION);

  SetAvailableRequest unknown;
  unknown.set_driver_id("ghost");
  unknown.mutable_location()->set_latitude(kCityCenter.latitude);
  unknown.mutable_location()->set_longitude(kCityCenter.longitude);
  assert(CodeOf([&] { s.drivers.SetAvailable(unknown); }) == ::grpc::StatusCode::NOT_FOUND);
}

void TestRejectAndExpandResponses() {
  Services s;
  s.OnboardDriver("near", NorthOf(kCityCenter, 1.0));
  s.OnboardDriver("ring", NorthOf(kCityCenter, 6.0));
  const auto ride_id = s.RequestRide("rider-1").ride().ride_id();

  RejectRequest reject;
  reject.set_ride_id(ride_id);
  reject.set_driver_id("near");
  auto rejected = s.dispatch.Reject(reject);
  assert(rejected.outcome() == REJECT_OUTCOME_RECORDED);
  assert(rejected.rejection_count() == 1);
  assert(rejected.remaining_drivers() == 0);

  ExpandRequest expand;
  expand.set_ride_id(ride_id);
  auto expanded = s.dispatch.Expand(expand);
  assert(Near(expanded.new_radius_km(), 7.0));
  assert(expanded.newly_included_driver_ids_size() == 1);
  assert(expanded.newly_included_driver_ids(0) == "ring");

  GetBroadcastRequest get;
  get.set_ride_id(ride_id);
  auto broadcast = s.dispatch.GetBroadcast(get).broadcast();
  assert(broadcast.broadcast_count() == 2);
  assert(broadcast.notified_driver_ids_size() == 2);
  assert(broadcast.status() == ridedispatch::v1::BROADCAST_STATUS_ACTIVE);
}

void TestDriverStatusAndCancellation() {
  Services s;
  s.OnboardDriver("d1", NorthOf(kCityCenter, 1.0));

  DriverIdRequest id;
  id.set_driver_id("d1");
  auto status = s.drivers.GetDriverStatus(id);
  assert(status.found());
  assert(status.availability().status() == ridedispatch::v1::DRIVER_STATUS_AVAILABLE);
  assert(status.availability().has_location());

  DriverIdRequest nobody;
  nobody.set_driver_id("nobody");
  assert(!s.drivers.GetDriverStatus(nobody).found());

  const auto ride_id = s.RequestRide("rider-1").ride().ride_id();
  AcceptRequest accept;
  accept.set_ride_id(ride_id);
  accept.set_driver_id("d1");
  accept.set_rider_id("rider-1");
  s.dispatch.Accept(accept);
  assert(s.drivers.GetDriverStatus(id).availability().status() == ridedispatch::v1::DRIVER_STATUS_BUSY);

  DriverCancelRequest cancel;
  cancel.set_ride_id(ride_id);
  cancel.set_driver_id("d1");
  auto cancelled = s.rides.DriverCancel(cancel);
  assert(cancelled.cancellation_count() == 1);
  assert(!cancelled.suspended());
  assert(cancelled.ride().status() == ridedispatch::v1::RIDE_STATUS_REQUESTED);
  assert(cancelled.ride().cancellation_reason() == "Driver cancelled");
  assert(cancelled.notified_drivers_size() == 0);

  // the canceller is back to available but may not take the ride again
  auto again = s.dispatch.Accept(accept);
  assert(again.outcome() == ACCEPT_OUTCOME_DRIVER_EXCLUDED);
}

void TestAvailabilityLocationPresence() {
  db::model::DriverAvailabilityRecord located;
  located.driver_id = "d1";
  located.status    = model::DriverStatus::kAvailable;
  located.location  = model::GeoPoint{22.7196, 75.8577};

  const auto with_location = service::ToProto(located);
  assert(with_location.has_location());
  assert(Near(with_location.location().latitude(), 22.7196));

  auto unlocated     = located;
  unlocated.location = std::nullopt;
  assert(!service::ToProto(unlocated).has_location());
}

void TestSubscribeReplaysPendingOffers() {
  Services s;
  s.OnboardDriver("d1", NorthOf(kCityCenter, 1.0));
  s.RequestRide("rider-1");
  s.RequestRide("rider-2");

  std::vector<ridedispatch::v1::DispatchNotification> backlog;
  auto stream = s.drivers.Subscribe("d1", &backlog);
  assert(stream);
  assert(backlog.size() == 2);
  assert(backlog[0].type() == "ride_request");

  s.dispatcher->Start(1);
  // the queued live pushes reach the stream as well
  auto live = stream->Next(std::chrono::seconds(5));
  assert(live && live->type() == "ride_request");

  s.drivers.Unsubscribe("d1", stream);
  assert(stream->Closed());
  s.dispatcher->Stop();

  service::ServiceContext no_streams;
  no_streams.engine = s.f.engine;
  service::DriverService disabled(no_streams);
  assert(CodeOf([&] { disabled.Subscribe("d1", nullptr); }) == ::grpc::StatusCode::UNAVAILABLE);
}

void TestAdminStatsAndLift() {
  Services s;
  s.OnboardDriver("d1", NorthOf(kCityCenter, 1.0));
  s.OnboardDriver("d2", NorthOf(kCityCenter, 2.0));
  s.RequestRide("rider-1");

  auto stats = s.admin.Stats(StatsRequest{});
  assert(stats.rides_requested() == 1);
  assert(stats.active_broadcasts() == 1);
  assert(stats.available_drivers() == 2);
  assert(stats.notifications_pending() == 2);

  assert(s.admin.LiftSuspensions(LiftSuspensionsRequest{}).driver_ids_size() == 0);
}

} // namespace

int main() {
  TestRequestAcceptAndCompleteOverRpcTypes();
  TestErrorsMapToStatusCodes();
  TestRejectAndExpandResponses();
  TestDriverStatusAndCancellation();
  TestAvailabilityLocationPresence();
  TestSubscribeReplaysPendingOffers();
  TestAdminStatsAndLift();

  std::cout << "ride_dispatch_unit_service: pass\n";
  return 0;
}
