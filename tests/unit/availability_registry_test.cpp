#include <cassert>
#include <chrono>
#include <iostream>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

void TestUnknownDriverIsRejected() {
  EngineFixture f;

  bool threw = false;
  try {
    f.engine->SetDriverAvailable("ghost", kCityCenter);
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.engine->SetDriverUnavailable("ghost");
  } catch (const util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestAvailableThenOffline() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  auto status = f.engine->GetDriverStatus("d1");
  assert(status && status->status == model::DriverStatus::kAvailable);
  assert(status->location && *status->location == kCityCenter);
  assert(f.engine->IsDriverAvailable("d1"));
  assert(f.engine->GetDriverProfile("d1")->status == model::DriverStatus::kAvailable);

  f.engine->SetDriverUnavailable("d1");
  assert(!f.engine->IsDriverAvailable("d1"));
  assert(f.engine->GetDriverProfile("d1")->status == model::DriverStatus::kUnavailable);
  // location survives a status-only write
  assert(f.engine->GetDriverStatus("d1")->location.has_value());
}

void TestInvalidLocationIsRejected() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  bool threw = false;
  try {
    f.engine->SetDriverAvailable("d1", {95.0, 10.0});
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestSuspendedDriverCannotGoOnline() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  auto profile         = *f.engine->GetDriverProfile("d1");
  profile.is_suspended = true;
  auto tx              = f.repository->Begin();
  f.repository->UpsertDriverProfile(*tx, profile);
  tx->Commit();
  tx.reset();

  bool threw = false;
  try {
    f.engine->SetDriverAvailable("d1", kCityCenter);
  } catch (const util::Conflict&) {
    threw = true;
  }
  assert(threw);
}

void TestRecordExpiresAfterTtl() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  f.Advance(std::chrono::hours(24) - std::chrono::milliseconds(1));
  assert(f.engine->IsDriverAvailable("d1"));

  f.Advance(std::chrono::milliseconds(1));
  assert(!f.engine->IsDriverAvailable("d1"));
  assert(!f.engine->GetDriverStatus("d1").has_value());
}

void TestLocationUpdateKeepsStatusAndRefreshesExpiry() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  f.Advance(std::chrono::hours(20));
  const auto moved = NorthOf(kCityCenter, 2.0);
  auto       rec   = f.engine->UpdateDriverLocation("d1", moved);
  assert(rec.status == model::DriverStatus::kAvailable);
  assert(*rec.location == moved);

  f.Advance(std::chrono::hours(20));
  assert(f.engine->IsDriverAvailable("d1"));
}

void TestLocationUpdateWithoutRecordIsUnavailable() {
  EngineFixture f;

  auto rec = f.engine->UpdateDriverLocation("d9", kCityCenter);
  assert(rec.status == model::DriverStatus::kUnavailable);
  assert(!f.engine->IsDriverAvailable("d9"));
}

void TestAvailableHoursAccumulate() {
  EngineFixture f;
  f.AddDriver("d1", kCityCenter);

  f.Advance(std::chrono::minutes(90));
  auto update = f.engine->SetDriverUnavailable("d1");
  assert(Near(update.hours_accumulated, 1.5));
  assert(Near(update.total_daily_hours, 1.5));

  // time spent offline is not counted
  f.Advance(std::chrono::hours(3));
  f.engine->SetDriverAvailable("d1", kCityCenter);
  f.Advance(std::chrono::minutes(30));
  update = f.engine->SetDriverBusy("d1");
  assert(Near(update.hours_accumulated, 0.5));
  assert(Near(update.total_daily_hours, 2.0));
  assert(Near(f.engine->GetDriverProfile("d1")->daily_availability_hours, 2.0));
}

} // namespace

int main() {
  TestUnknownDriverIsRejected();
  TestAvailableThenOffline();
  TestInvalidLocationIsRejected();
  TestSuspendedDriverCannotGoOnline();
  TestRecordExpiresAfterTtl();
  TestLocationUpdateKeepsStatusAndRefreshesExpiry();
  TestLocationUpdateWithoutRecordIsUnavailable();
  TestAvailableHoursAccumulate();

  std::cout << "ride_dispatch_unit_availability_registry: pass\n";
  return 0;
}
