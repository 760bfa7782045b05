#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using lifecycle::LifecycleOutcome;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::NorthOf;

constexpr uint64_t kStartMs = 1700000000000ULL;

lifecycle::DriverCancelResult MatchAndCancel(EngineFixture& f, const std::string& driver) {
  auto ride = f.Matched("rider", driver);
  return f.engine->DriverCancel(ride.ride_id, driver);
}

void TestCancellationRedispatchesWithoutCancellingDriver() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));
  f.AddDriver("d3", NorthOf(kCityCenter, 4.0));

  auto ride = f.Matched("rider-1", "d1");
  f.Drain();

  auto result = f.engine->DriverCancel(ride.ride_id, "d1");
  assert(result.ok());
  assert(!result.suspended);
  assert(result.cancellation_count == 1);

  assert(result.ride->status == model::RideStatus::kRequested);
  assert(result.ride->driver_id.empty());
  assert(result.ride->matched_at_ms == 0);
  assert(result.ride->cancelled_by == "d1");
  assert(result.ride->cancellation_reason == "Driver cancelled");

  // fresh round without d1
  assert(result.notified.size() == 2);
  assert(result.notified[0].driver_id == "d2");
  auto broadcast = f.engine->GetBroadcast(ride.ride_id);
  assert(broadcast->status == model::BroadcastStatus::kActive);
  assert(broadcast->broadcast_count == 1);
  assert(!broadcast->Notified("d1"));

  auto pushes = f.Drain();
  assert(pushes.size() == 2);

  // the driver is back in the pool for other riders
  assert(f.engine->IsDriverAvailable("d1"));
  auto profile = f.engine->GetDriverProfile("d1");
  assert(profile->cancellation_count == 1);
  assert(profile->last_reset_at_ms == kStartMs);

  // another driver can now take the ride
  assert(f.engine->Accept(ride.ride_id, "d2", "rider-1").outcome == dispatch::AcceptOutcome::kWon);
}

void TestCancellingDriverIsNeverOfferedTheRideAgain() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("d2", NorthOf(kCityCenter, 6.0));

  auto ride = f.Matched("rider-1", "d1");
  auto result = f.engine->DriverCancel(ride.ride_id, "d1");
  assert(result.ok());
  assert(result.notified.empty());  // d2 is beyond the 5km redispatch radius
  assert(f.engine->IsDriverAvailable("d1"));
  f.Drain();

  // d1 is inside every later radius but stays out of the broadcast
  for (int round = 0; round < 2; ++round) {
    auto expanded = f.engine->Expand(ride.ride_id);
    assert(expanded.outcome == dispatch::ExpandOutcome::kExpanded);
    for (const auto& driver : expanded.newly_included) assert(driver.driver_id != "d1");
  }
  auto broadcast = f.engine->GetBroadcast(ride.ride_id);
  assert(broadcast->Notified("d2"));
  assert(!broadcast->Notified("d1"));
  assert(broadcast->Excluded("d1"));
  assert(f.engine->PendingNotifications("d1").empty());
  for (const auto& push : f.Drain()) assert(push.user_id != "d1");

  assert(f.engine->Accept(ride.ride_id, "d1", "rider-1").outcome == dispatch::AcceptOutcome::kDriverExcluded);
  assert(f.engine->GetRide(ride.ride_id)->status == model::RideStatus::kRequested);
  assert(f.engine->Accept(ride.ride_id, "d2", "rider-1").outcome == dispatch::AcceptOutcome::kWon);
}

void TestSuspendedAfterMoreThanThreeCancellations() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  for (uint32_t i = 1; i <= 3; ++i) {
    auto r = MatchAndCancel(f, "d1");
    assert(r.ok());
    assert(r.cancellation_count == i);
    assert(!r.suspended);
    f.Advance(std::chrono::hours(1));
  }

  auto fourth = MatchAndCancel(f, "d1");
  assert(fourth.suspended);
  assert(fourth.cancellation_count == 4);

  auto profile = f.engine->GetDriverProfile("d1");
  assert(profile->is_suspended);
  assert(profile->suspended_at_ms == kStartMs + 3 * 3600 * 1000ULL);
  assert(!f.engine->IsDriverAvailable("d1"));
  assert(f.engine->GetDriverStatus("d1")->status == model::DriverStatus::kUnavailable);

  // suspended drivers cannot come back online
  bool threw = false;
  try {
    f.engine->SetDriverAvailable("d1", kCityCenter);
  } catch (const util::Conflict&) {
    threw = true;
  }
  assert(threw);
  assert(f.engine->Stats().suspended_drivers == 1);
}

void TestWindowResetsCounter() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  for (int i = 0; i < 3; ++i) MatchAndCancel(f, "d1");

  // exactly 24h later the window is still open
  f.Advance(std::chrono::hours(24));
  f.engine->SetDriverAvailable("d1", NorthOf(kCityCenter, 1.0));
  auto boundary = MatchAndCancel(f, "d1");
  assert(boundary.suspended);

  EngineFixture g;
  g.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  for (int i = 0; i < 3; ++i) MatchAndCancel(g, "d1");

  g.Advance(std::chrono::hours(24) + std::chrono::milliseconds(1));
  g.engine->SetDriverAvailable("d1", NorthOf(kCityCenter, 1.0));
  auto fresh = MatchAndCancel(g, "d1");
  assert(!fresh.suspended);
  assert(fresh.cancellation_count == 1);
  assert(g.engine->GetDriverProfile("d1")->last_reset_at_ms == kStartMs + 24 * 3600 * 1000ULL + 1);
}

void TestSuspensionLiftsAfterDuration() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  for (int i = 0; i < 4; ++i) MatchAndCancel(f, "d1");
  assert(f.engine->GetDriverProfile("d1")->is_suspended);

  f.Advance(std::chrono::hours(24));
  assert(f.engine->LiftExpiredSuspensions().empty());

  f.Advance(std::chrono::minutes(1));
  auto lifted = f.engine->LiftExpiredSuspensions();
  assert(lifted.size() == 1 && lifted[0] == "d1");

  auto profile = f.engine->GetDriverProfile("d1");
  assert(!profile->is_suspended);
  assert(profile->cancellation_count == 0);
  assert(profile->suspended_at_ms == 0);

  // lifting does not put the driver online by itself
  assert(!f.engine->IsDriverAvailable("d1"));
  f.engine->SetDriverAvailable("d1", kCityCenter);
  assert(f.engine->IsDriverAvailable("d1"));
}

void TestDriverCancelOutcomes() {
  EngineFixture f;
  auto          ride = f.Matched("rider-1", "d1");
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));

  assert(f.engine->DriverCancel("missing", "d1").outcome == LifecycleOutcome::kNotFound);
  assert(f.engine->DriverCancel(ride.ride_id, "d2").outcome == LifecycleOutcome::kNotParticipant);

  f.engine->Start(ride.ride_id, "d1");
  assert(f.engine->DriverCancel(ride.ride_id, "d1").outcome == LifecycleOutcome::kInvalidState);
  assert(f.engine->GetDriverProfile("d1")->cancellation_count == 0);
}

} // namespace

int main() {
  TestCancellationRedispatchesWithoutCancellingDriver();
  TestCancellingDriverIsNeverOfferedTheRideAgain();
  TestSuspendedAfterMoreThanThreeCancellations();
  TestWindowResetsCounter();
  TestSuspensionLiftsAfterDuration();
  TestDriverCancelOutcomes();

  std::cout << "ride_dispatch_unit_cancellation_policy: pass\n";
  return 0;
}
