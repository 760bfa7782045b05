#include <cassert>
#include <iostream>
#include <limits>
#include <string>

#include "internal/notify/notification.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using lifecycle::LifecycleOutcome;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

void TestHappyPath() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.Drain();

  f.Advance(std::chrono::minutes(2));
  auto arriving = f.engine->MarkArriving(ride.ride_id, "d1");
  assert(arriving.ok());
  assert(arriving.ride->status == model::RideStatus::kDriverArriving);

  f.Advance(std::chrono::minutes(3));
  auto started = f.engine->Start(ride.ride_id, "d1");
  assert(started.ok());
  assert(started.ride->status == model::RideStatus::kInProgress);
  assert(started.ride->start_time_ms == 1700000300000ULL);
  assert(started.ride->pickup_time_ms == started.ride->start_time_ms);

  f.Advance(std::chrono::minutes(15));
  auto done = f.engine->Complete(ride.ride_id, "d1", 5.0);
  assert(done.ok());
  assert(done.ride->status == model::RideStatus::kCompleted);
  assert(done.ride->final_fare.has_value());
  assert(Near(*done.ride->final_fare, 90.0));
  assert(done.ride->completed_at_ms == 1700001200000ULL);

  // the driver is free again and credited with the trip
  assert(f.engine->IsDriverAvailable("d1"));
  assert(f.engine->GetDriverProfile("d1")->total_rides == 1);
}

void TestStartFromMatchedImpliesArrival() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");

  auto started = f.engine->Start(ride.ride_id, "d1");
  assert(started.ok());
  assert(started.ride->status == model::RideStatus::kInProgress);
  assert(started.ride->pickup_time_ms != 0);
}

void TestFareProtectionOnCompletion() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.engine->Start(ride.ride_id, "d1");

  // 8km would cost 126, more than 20% over the 90 quoted
  auto done = f.engine->Complete(ride.ride_id, "d1", 8.0);
  assert(Near(*done.ride->final_fare, 90.0));
  assert(Near(done.ride->fare_breakdown.distance_km, 8.0));

  EngineFixture g;
  auto          other = g.Matched("rider-2", "d2");
  g.engine->Start(other.ride_id, "d2");
  auto within = g.engine->Complete(other.ride_id, "d2", 5.5);
  assert(Near(*within.ride->final_fare, 96.0));
}

void TestInvalidTransitionsAreRejected() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");

  // only IN_PROGRESS rides complete
  auto early = f.engine->Complete(ride.ride_id, "d1", 5.0);
  assert(early.outcome == LifecycleOutcome::kInvalidState);
  assert(!early.ride.has_value());

  f.engine->Start(ride.ride_id, "d1");
  assert(f.engine->MarkArriving(ride.ride_id, "d1").outcome == LifecycleOutcome::kInvalidState);
  assert(f.engine->Start(ride.ride_id, "d1").outcome == LifecycleOutcome::kInvalidState);

  // an in-progress ride cannot be cancelled by anyone
  assert(f.engine->Cancel(ride.ride_id, "rider-1").outcome == LifecycleOutcome::kInvalidState);

  f.engine->Complete(ride.ride_id, "d1", 5.0);
  assert(f.engine->Complete(ride.ride_id, "d1", 5.0).outcome == LifecycleOutcome::kInvalidState);
  assert(f.engine->Cancel(ride.ride_id, "rider-1").outcome == LifecycleOutcome::kInvalidState);
  assert(f.engine->GetRide(ride.ride_id)->status == model::RideStatus::kCompleted);
}

void TestOnlyTheAssignedDriverMovesTheRide() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));

  assert(f.engine->MarkArriving(ride.ride_id, "d2").outcome == LifecycleOutcome::kNotParticipant);
  assert(f.engine->Start(ride.ride_id, "rider-1").outcome == LifecycleOutcome::kNotParticipant);
  assert(f.engine->Cancel(ride.ride_id, "d2").outcome == LifecycleOutcome::kNotParticipant);
  assert(f.engine->MarkArriving("missing", "d1").outcome == LifecycleOutcome::kNotFound);

  // nobody is assigned before the match
  auto requested = f.Request("rider-2");
  assert(f.engine->Start(requested.ride.ride_id, "d2").outcome == LifecycleOutcome::kNotParticipant);
}

void TestCompleteValidatesDistance() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.engine->Start(ride.ride_id, "d1");

  assert(f.engine->Complete(ride.ride_id, "d1", -1.0).outcome == LifecycleOutcome::kInvalidArgument);
  assert(f.engine->Complete(ride.ride_id, "d1", std::numeric_limits<double>::quiet_NaN()).outcome ==
         LifecycleOutcome::kInvalidArgument);
  assert(f.engine->GetRide(ride.ride_id)->status == model::RideStatus::kInProgress);
}

void TestRiderCancelBeforeMatchIsFree() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  auto requested = f.Request("rider-1");
  f.Drain();

  auto cancelled = f.engine->Cancel(requested.ride.ride_id, "rider-1", "changed plans");
  assert(cancelled.ok());
  assert(Near(cancelled.cancellation_fee, 0.0));
  assert(cancelled.ride->status == model::RideStatus::kCancelled);
  assert(cancelled.ride->cancelled_by == "rider-1");
  assert(cancelled.ride->cancellation_reason == "changed plans");
  assert(cancelled.ride->cancellation_timestamp_ms == 1700000000000ULL);

  assert(f.engine->GetBroadcast(requested.ride.ride_id)->status == model::BroadcastStatus::kCancelled);
  assert(f.engine->PendingNotifications("d1").empty());
  assert(f.Drain().empty());
}

void TestRiderCancelAfterMatchPaysFee() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.engine->MarkArriving(ride.ride_id, "d1");
  f.Drain();

  auto cancelled = f.engine->Cancel(ride.ride_id, "rider-1");
  assert(cancelled.ok());
  assert(Near(cancelled.cancellation_fee, 20.0));
  assert(Near(cancelled.ride->cancellation_fee, 20.0));
  assert(cancelled.ride->cancellation_reason.empty());
  assert(!cancelled.re_dispatched);

  assert(f.engine->IsDriverAvailable("d1"));

  auto pushes = f.Drain();
  assert(pushes.size() == 1);
  assert(pushes[0].user_id == "d1");
  assert(pushes[0].payload.type() == notify::kRideCancelled);
}

void TestDriverCancelThroughCancelRedispatches() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));

  auto cancelled = f.engine->Cancel(ride.ride_id, "d1", "flat tyre");
  assert(cancelled.ok());
  assert(cancelled.re_dispatched);
  assert(!cancelled.driver_suspended);
  assert(Near(cancelled.cancellation_fee, 0.0));
  assert(cancelled.ride->status == model::RideStatus::kRequested);
  assert(cancelled.ride->driver_id.empty());
  assert(cancelled.ride->cancellation_reason == "flat tyre");
}

} // namespace

int main() {
  TestHappyPath();
  TestStartFromMatchedImpliesArrival();
  TestFareProtectionOnCompletion();
  TestInvalidTransitionsAreRejected();
  TestOnlyTheAssignedDriverMovesTheRide();
  TestCompleteValidatesDistance();
  TestRiderCancelBeforeMatchIsFree();
  TestRiderCancelAfterMatchPaysFee();
  TestDriverCancelThroughCancelRedispatches();

  std::cout << "ride_dispatch_unit_ride_lifecycle: pass\n";
  return 0;
}
