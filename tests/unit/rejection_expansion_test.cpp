#include <cassert>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using dispatch::ExpandOutcome;
using dispatch::RejectOutcome;
using testing::EngineFixture;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

void TestRejectionsAreCountedOncePerDriver() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("d2", NorthOf(kCityCenter, 2.0));
  f.AddDriver("d3", NorthOf(kCityCenter, 3.0));

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;

  auto first = f.engine->Reject(id, "d1");
  assert(first.outcome == RejectOutcome::kRecorded);
  assert(first.rejection_count == 1);
  assert(first.remaining_drivers == 2);
  assert(f.engine->PendingNotifications("d1").empty());

  auto again = f.engine->Reject(id, "d1");
  assert(again.outcome == RejectOutcome::kRecorded);
  assert(again.rejection_count == 1);

  auto second = f.engine->Reject(id, "d2");
  assert(second.rejection_count == 2);
  assert(second.remaining_drivers == 1);

  // rejecting never moves the ride
  assert(f.engine->GetRide(id)->status == model::RideStatus::kRequested);
  assert(f.engine->PendingNotifications("d3").size() == 1);
}

void TestRejectOutcomes() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));
  f.AddDriver("stranger", NorthOf(kCityCenter, 9.0));

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;

  assert(f.engine->Reject("missing", "d1").outcome == RejectOutcome::kNotFound);
  assert(f.engine->Reject(id, "stranger").outcome == RejectOutcome::kNotNotified);

  f.engine->Accept(id, "d1", "rider-1");
  assert(f.engine->Reject(id, "d1").outcome == RejectOutcome::kAlreadyResolved);
}

void TestExpansionNotifiesOnlyNewDrivers() {
  EngineFixture f;
  f.AddDriver("inner", NorthOf(kCityCenter, 3.0));
  f.AddDriver("ring", NorthOf(kCityCenter, 6.0));
  f.AddDriver("outer", NorthOf(kCityCenter, 8.5));

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;
  f.Drain();

  f.Advance(std::chrono::seconds(30));
  auto grown = f.engine->Expand(id);
  assert(grown.outcome == ExpandOutcome::kExpanded);
  assert(Near(grown.previous_radius_km, 5.0));
  assert(Near(grown.new_radius_km, 7.0));
  assert(grown.broadcast_count == 2);
  assert(grown.newly_included.size() == 1);
  assert(grown.newly_included[0].driver_id == "ring");
  assert(grown.total_notified == 2);

  auto pushes = f.Drain();
  assert(pushes.size() == 1);
  assert(pushes[0].user_id == "ring");
  assert(pushes[0].payload.broadcast_round() == 2);

  auto broadcast = f.engine->GetBroadcast(id);
  assert(Near(broadcast->radius_km, 7.0));
  assert(broadcast->last_expansion_at_ms == 1700000030000ULL);
  assert(f.engine->PendingNotifications("ring")[0].broadcast_round == 2);

  auto wider = f.engine->Expand(id, std::nullopt, 3.0);
  assert(Near(wider.new_radius_km, 10.0));
  assert(wider.newly_included.size() == 1);
  assert(wider.newly_included[0].driver_id == "outer");
  assert(wider.total_notified == 3);
}

void TestRepeatedExpansionIsIdempotentForRecipients() {
  EngineFixture f;
  f.AddDriver("ring", NorthOf(kCityCenter, 6.0));

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;

  auto first = f.engine->Expand(id, 5.0, 2.0);
  assert(first.newly_included.size() == 1);
  f.Drain();

  auto repeat = f.engine->Expand(id, 5.0, 2.0);
  assert(repeat.outcome == ExpandOutcome::kExpanded);
  assert(repeat.newly_included.empty());
  assert(repeat.total_notified == 1);
  assert(f.Drain().empty());

  // a smaller explicit radius never shrinks the stored one
  f.engine->Expand(id, 1.0, 1.0);
  assert(Near(f.engine->GetBroadcast(id)->radius_km, 7.0));
}

void TestExpandOutcomes() {
  EngineFixture f;
  f.AddDriver("d1", NorthOf(kCityCenter, 1.0));

  assert(f.engine->Expand("missing").outcome == ExpandOutcome::kNotFound);

  auto requested = f.Request("rider-1");
  const auto& id = requested.ride.ride_id;

  bool threw = false;
  try {
    f.engine->Expand(id, std::nullopt, 0.0);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.engine->Expand(id, -1.0, 2.0);
  } catch (const util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  f.engine->Accept(id, "d1", "rider-1");
  assert(f.engine->Expand(id).outcome == ExpandOutcome::kNotRequested);
}

void TestExtendedAreaExpandsByLargerStep() {
  EngineFixture f;

  const model::GeoPoint outskirts{22.58, 75.8577};
  auto                  requested = f.Request("rider-1", outskirts);
  auto                  grown     = f.engine->Expand(requested.ride.ride_id);
  assert(Near(grown.previous_radius_km, 8.0));
  assert(Near(grown.new_radius_km, 11.0));
}

} // namespace

int main() {
  TestRejectionsAreCountedOncePerDriver();
  TestRejectOutcomes();
  TestExpansionNotifiesOnlyNewDrivers();
  TestRepeatedExpansionIsIdempotentForRecipients();
  TestExpandOutcomes();
  TestExtendedAreaExpandsByLargerStep();

  std::cout << "ride_dispatch_unit_rejection_expansion: pass\n";
  return 0;
}
