#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/dispatch/acceptance_arbitrator.hpp"
#include "internal/notify/notification.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using dispatch::AcceptOutcome;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

void TestWinnerIsMatchedAndBroadcastClosed() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 2.25));
  f.AddDriver("d2", NorthOf(kCityCenter, 3.0));

  auto requested = f.Request("rider-1");
  f.Drain();

  auto result = f.engine->Accept(requested.ride.ride_id, "d1", "rider-1");
  assert(result.outcome == AcceptOutcome::kWon);
  assert(result.ride.has_value());
  assert(result.ride->status == model::RideStatus::kMatched);
  assert(result.ride->driver_id == "d1");
  assert(result.ride->matched_at_ms == 1700000000000ULL);
  assert(result.driver.has_value() && result.driver->name == "Driver d1");
  assert(Near(result.distance_to_pickup_km, 2.25, 1e-3));
  assert(result.estimated_arrival_minutes == 4);  // 2.25km at 30km/h

  auto status = f.engine->GetDriverStatus("d1");
  assert(status && status->status == model::DriverStatus::kBusy);
  assert(f.engine->GetDriverProfile("d1")->status == model::DriverStatus::kBusy);

  assert(f.engine->GetBroadcast(requested.ride.ride_id)->status == model::BroadcastStatus::kCancelled);
  assert(f.engine->PendingNotifications("d2").empty());

  auto pushes = f.Drain();
  assert(pushes.size() == 1);
  assert(pushes[0].user_id == "rider-1");
  assert(pushes[0].payload.type() == notify::kRideMatched);
  assert(pushes[0].payload.driver_id() == "d1");
  assert(pushes[0].payload.estimated_arrival_minutes() == 4);
}

void TestLateAcceptIsAlreadyMatched() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));

  auto requested = f.Request("rider-1");
  assert(f.engine->Accept(requested.ride.ride_id, "d1", "rider-1").outcome == AcceptOutcome::kWon);

  auto late = f.engine->Accept(requested.ride.ride_id, "d2", "rider-1");
  assert(late.outcome == AcceptOutcome::kAlreadyMatched);
  assert(!late.ride.has_value());
  assert(f.engine->GetRide(requested.ride.ride_id)->driver_id == "d1");
  assert(f.engine->IsDriverAvailable("d2"));
}

void TestRejectedOutcomes() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("offline", NorthOf(kCityCenter, 1.5));

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;

  assert(f.engine->Accept("missing", "d1", "rider-1").outcome == AcceptOutcome::kNotFound);
  assert(f.engine->Accept(id, "d1", "someone-else").outcome == AcceptOutcome::kRiderMismatch);

  f.engine->SetDriverUnavailable("offline");
  assert(f.engine->Accept(id, "offline", "rider-1").outcome == AcceptOutcome::kDriverUnavailable);
  assert(f.engine->Accept(id, "never-seen", "rider-1").outcome == AcceptOutcome::kDriverUnavailable);

  // none of the failed attempts touched the ride
  auto ride = f.engine->GetRide(id);
  assert(ride->status == model::RideStatus::kRequested);
  assert(ride->driver_id.empty());

  f.engine->Cancel(id, "rider-1");
  assert(f.engine->Accept(id, "d1", "rider-1").outcome == AcceptOutcome::kNotRequested);
}

void TestHeldLeaseReportsBusy() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  auto requested = f.Request("rider-1");

  lease::LeaseManager other(f.repository, f.clock, std::chrono::seconds(10));
  auto held = other.TryAcquireScoped(dispatch::AcceptanceArbitrator::LeaseKey(requested.ride.ride_id));
  assert(held);

  assert(f.engine->Accept(requested.ride.ride_id, "d1", "rider-1").outcome == AcceptOutcome::kBusy);

  held.Release();
  assert(f.engine->Accept(requested.ride.ride_id, "d1", "rider-1").outcome == AcceptOutcome::kWon);
}

void TestExpiredLeaseDoesNotBlockForever() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  auto requested = f.Request("rider-1");

  // a holder that crashed without releasing
  lease::LeaseManager crashed(f.repository, f.clock, std::chrono::seconds(10));
  assert(crashed.TryAcquire(dispatch::AcceptanceArbitrator::LeaseKey(requested.ride.ride_id)).has_value());
  assert(f.engine->Accept(requested.ride.ride_id, "d1", "rider-1").outcome == AcceptOutcome::kBusy);

  f.Advance(std::chrono::seconds(11));
  assert(f.engine->Accept(requested.ride.ride_id, "d1", "rider-1").outcome == AcceptOutcome::kWon);
}

void TestConcurrentAcceptsProduceOneWinner() {
  constexpr int kDrivers = 8;

  EngineFixture f;
  for (int i = 0; i < kDrivers; ++i) {
    f.AddDriver("d" + std::to_string(i), NorthOf(kCityCenter, 0.5 + 0.25 * i));
  }
  auto requested = f.Request("rider-1");
  assert(requested.broadcast.notified.size() == static_cast<size_t>(kDrivers));

  std::atomic<int>         start{0};
  std::atomic<int>         won{0};
  std::atomic<int>         lost{0};
  std::vector<std::thread> threads;
  std::vector<std::string> winners(kDrivers);

  for (int i = 0; i < kDrivers; ++i) {
    threads.emplace_back([&, i] {
      start.fetch_add(1);
      while (start.load() < kDrivers) std::this_thread::yield();

      const std::string driver = "d" + std::to_string(i);
      auto              r      = f.engine->Accept(requested.ride.ride_id, driver, "rider-1");
      if (r.outcome == AcceptOutcome::kWon) {
        won.fetch_add(1);
        winners[i] = driver;
      } else {
        assert(r.outcome == AcceptOutcome::kAlreadyMatched || r.outcome == AcceptOutcome::kBusy);
        lost.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(won.load() == 1);
  assert(lost.load() == kDrivers - 1);

  auto ride = f.engine->GetRide(requested.ride.ride_id);
  assert(ride->status == model::RideStatus::kMatched);

  int busy = 0;
  for (int i = 0; i < kDrivers; ++i) {
    const std::string driver = "d" + std::to_string(i);
    if (f.engine->GetDriverStatus(driver)->status == model::DriverStatus::kBusy) {
      ++busy;
      assert(ride->driver_id == driver);
      assert(winners[i] == driver);
    }
  }
  assert(busy == 1);
}

} // namespace

int main() {
  TestWinnerIsMatchedAndBroadcastClosed();
  TestLateAcceptIsAlreadyMatched();
  TestRejectedOutcomes();
  TestHeldLeaseReportsBusy();
  TestExpiredLeaseDoesNotBlockForever();
  TestConcurrentAcceptsProduceOneWinner();

  std::cout << "ride_dispatch_unit_acceptance_arbitrator: pass\n";
  return 0;
}
