#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/maintenance/dispatch_sweeper.hpp"
#include "internal/notify/notification_dispatcher.hpp"
#include "internal/notify/subscription_hub.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/ride_service.hpp"
#include "tests/support/engine_fixture.hpp"

namespace {

using namespace ridedispatch;
using namespace ridedispatch::services::v1;
using testing::kCityCenter;
using testing::Near;
using testing::NorthOf;

constexpr std::chrono::seconds kWait{5};

constexpr const char* kConfigYaml = R"(
server:
  bind_address: 127.0.0.1:0
database:
  memory: {}
logging:
  level: warn
dispatch:
  city_matching_timeout: 120s
notifications:
  workers: 2
maintenance:
  sweep_interval: 3600s
)";

runtime::config::RuntimeConfig LoadConfig() {
  auto config = config::ConfigLoader::LoadFromYamlString(kConfigYaml);
  config::ConfigLoader::Normalize(config);
  return config;
}

void Onboard(factory::RuntimeDependencies& deps, const std::string& id, const model::GeoPoint& at) {
  UpsertProfileRequest profile;
  profile.mutable_profile()->set_driver_id(id);
  profile.mutable_profile()->set_name("Driver " + id);
  profile.mutable_profile()->set_accept_extended_area(true);
  deps.driver_service->UpsertProfile(profile);

  SetAvailableRequest available;
  available.set_driver_id(id);
  available.mutable_location()->set_latitude(at.latitude);
  available.mutable_location()->set_longitude(at.longitude);
  deps.driver_service->SetAvailable(available);
}

// Next payload of the given type; other payloads are skipped.
std::optional<ridedispatch::v1::DispatchNotification> Await(notify::Subscription& stream, const std::string& type) {
  while (auto n = stream.Next(kWait)) {
    if (n->type() == type) return n;
  }
  return std::nullopt;
}

void TestRequestExpandAcceptComplete() {
  const auto config = LoadConfig();
  auto       clock  = std::make_shared<util::ManualClock>(util::FromUnixMillis(1700000000000ULL));
  auto       deps   = factory::BuildRuntime(config, clock);
  deps.Start(config);

  Onboard(deps, "near", NorthOf(kCityCenter, 1.0));
  Onboard(deps, "ring", NorthOf(kCityCenter, 6.0));

  auto rider_stream = deps.subscriptions->Subscribe("rider-1");
  auto near_stream  = deps.subscriptions->Subscribe("near");
  auto ring_stream  = deps.subscriptions->Subscribe("ring");

  RequestRideRequest request;
  request.set_rider_id("rider-1");
  request.mutable_pickup()->set_latitude(kCityCenter.latitude);
  request.mutable_pickup()->set_longitude(kCityCenter.longitude);
  const auto dest = NorthOf(kCityCenter, 5.0);
  request.mutable_destination()->set_latitude(dest.latitude);
  request.mutable_destination()->set_longitude(dest.longitude);
  auto requested = deps.dispatch_service->RequestRide(request);
  assert(requested.notified_drivers_size() == 1);
  const auto ride_id = requested.ride().ride_id();

  auto offer = Await(*near_stream, "ride_request");
  assert(offer && offer->ride_id() == ride_id);

  RejectRequest reject;
  reject.set_ride_id(ride_id);
  reject.set_driver_id("near");
  assert(deps.dispatch_service->Reject(reject).outcome() == REJECT_OUTCOME_RECORDED);

  // nobody accepted within the city timeout: the sweep widens to 7km
  clock->Advance(std::chrono::seconds(121));
  auto report = deps.sweeper->RunOnce();
  assert(report.expanded_broadcasts == 1);

  auto widened = Await(*ring_stream, "ride_request");
  assert(widened && widened->broadcast_round() == 2);

  AcceptRequest accept;
  accept.set_ride_id(ride_id);
  accept.set_driver_id("ring");
  accept.set_rider_id("rider-1");
  auto won = deps.dispatch_service->Accept(accept);
  assert(won.outcome() == ACCEPT_OUTCOME_WON);

  auto matched = Await(*rider_stream, "ride_matched");
  assert(matched && matched->driver_id() == "ring");

  StartRideRequest start;
  start.set_ride_id(ride_id);
  start.set_driver_id("ring");
  deps.ride_service->Start(start);

  CompleteRideRequest complete;
  complete.set_ride_id(ride_id);
  complete.set_driver_id("ring");
  complete.set_actual_distance_km(5.0);
  auto done = deps.ride_service->Complete(complete);
  assert(done.ride().status() == ridedispatch::v1::RIDE_STATUS_COMPLETED);
  assert(Near(done.ride().final_fare(), 90.0));

  auto stats = deps.admin_service->Stats(StatsRequest{});
  assert(stats.rides_requested() == 0);
  assert(stats.active_broadcasts() == 0);
  assert(stats.available_drivers() == 2);
  assert(stats.notifications_failed() == 0);

  deps.Stop();
  assert(rider_stream->Closed());
  deps.Stop();
}

void TestDefaultsFromEmptyConfig() {
  auto config = config::ConfigLoader::LoadFromYamlString("{}");
  config::ConfigLoader::Normalize(config);
  assert(config.server().bind_address() == "0.0.0.0:50061");

  auto deps = factory::BuildRuntime(config);
  assert(Near(deps.policy.dispatch.city_initial_radius_km, 5.0));
  assert(deps.repository);
  deps.Start(config);
  deps.Stop();
}

} // namespace

int main() {
  TestRequestExpandAcceptComplete();
  TestDefaultsFromEmptyConfig();

  std::cout << "ride_dispatch_integration_runtime_flow: pass\n";
  return 0;
}
