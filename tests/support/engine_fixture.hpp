#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/config/dispatch_policy.hpp"
#include "internal/core/dispatch_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/util/time.hpp"

namespace ridedispatch::testing {

// City centre of the default service area.
inline const model::GeoPoint kCityCenter{22.7196, 75.8577};

inline constexpr double kKmPerDegreeLatitude = 6371.0 * 3.14159265358979323846 / 180.0;

// Along a meridian the haversine distance equals the latitude arc exactly.
inline model::GeoPoint NorthOf(const model::GeoPoint& base, double km) {
  return {base.latitude + km / kKmPerDegreeLatitude, base.longitude};
}

inline bool Near(double a, double b, double eps = 1e-6) {
  return a > b ? a - b < eps : b - a < eps;
}

struct EngineFixture {
  explicit EngineFixture(config::Policy policy = {})
      : clock(std::make_shared<util::ManualClock>(util::FromUnixMillis(1700000000000ULL))),
        repository(std::make_shared<db::memory::MemoryRepository>()),
        queue(std::make_shared<notify::NotificationQueue>()),
        engine(std::make_shared<core::DispatchEngine>(repository, clock, queue, policy)) {
  }

  void AddDriver(const std::string& id, const model::GeoPoint& location, bool extended = true, bool parcel = false) {
    db::model::DriverProfileRecord profile;
    profile.driver_id              = id;
    profile.name                   = "Driver " + id;
    profile.accept_extended_area   = extended;
    profile.accept_parcel_delivery = parcel;
    engine->UpsertDriverProfile(profile);
    engine->SetDriverAvailable(id, location);
  }

  core::RideRequestOutcome Request(const std::string& rider_id, const model::GeoPoint& pickup = kCityCenter) {
    core::RideRequest request;
    request.rider_id    = rider_id;
    request.pickup      = pickup;
    request.destination = NorthOf(pickup, 5.0);
    return engine->RequestRide(request);
  }

  // Matched ride: requested by `rider_id`, won by `driver_id` standing 1km away.
  db::model::RideRecord Matched(const std::string& rider_id, const std::string& driver_id) {
    if (!engine->GetDriverProfile(driver_id)) AddDriver(driver_id, NorthOf(kCityCenter, 1.0));
    auto requested = Request(rider_id);
    auto accepted  = engine->Accept(requested.ride.ride_id, driver_id, rider_id);
    return *accepted.ride;
  }

  std::vector<notify::OutboundNotification> Drain() {
    std::vector<notify::OutboundNotification> out;
    while (auto n = queue->TryDequeue()) out.push_back(std::move(*n));
    return out;
  }

  void Advance(std::chrono::milliseconds delta) {
    clock->Advance(delta);
  }

  std::shared_ptr<util::ManualClock>            clock;
  std::shared_ptr<db::memory::MemoryRepository> repository;
  std::shared_ptr<notify::NotificationQueue>    queue;
  std::shared_ptr<core::DispatchEngine>         engine;
};

} // namespace ridedispatch::testing
