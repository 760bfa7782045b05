#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace ridedispatch::db::memory {

namespace {

bool Live(uint64_t expires_at_ms, uint64_t now_ms) {
  return expires_at_ms > now_ms;
}

template <typename Map, typename Pred>
void EraseIf(Map& map, Pred pred) {
  for (auto it = map.begin(); it != map.end();) {
    if (pred(it->second)) {
      it = map.erase(it);
    } else {
      ++it;
    }
  }
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------
// Rides
// ------------------------------------------------------------

Result MemoryRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.rides.contains(r.ride_id)) return Result::Err(ErrorCode::AlreadyExists, "ride exists: " + r.ride_id);
  s.rides[r.ride_id] = r;
  return Result::Ok();
}

std::optional<model::RideRecord> MemoryRepository::GetRide(Transaction& t, const std::string& ride_id) {
  const auto& s  = TX(t).View();
  auto        it = s.rides.find(ride_id);
  if (it == s.rides.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateRide(Transaction& t, const model::RideRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.rides.find(r.ride_id);
  if (it == s.rides.end()) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
  const uint64_t version = it->second.version + 1;
  it->second             = r;
  it->second.version     = version;
  return Result::Ok();
}

Result MemoryRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, ridedispatch::model::RideStatus expected) {
  auto& s  = TX(t).Mutable();
  auto  it = s.rides.find(r.ride_id);
  if (it == s.rides.end()) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
  if (it->second.status != expected) return Result::Err(ErrorCode::Conflict, "ride status changed: " + r.ride_id);
  const uint64_t version = it->second.version + 1;
  it->second             = r;
  it->second.version     = version;
  return Result::Ok();
}

std::vector<model::RideRecord> MemoryRepository::ListRidesByStatus(Transaction& t, ridedispatch::model::RideStatus status) {
  std::vector<model::RideRecord> out;
  for (const auto& [_, ride] : TX(t).View().rides)
    if (ride.status == status) out.push_back(ride);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ride_id < b.ride_id; });
  return out;
}

// ------------------------------------------------------------
// Driver profiles
// ------------------------------------------------------------

Result MemoryRepository::UpsertDriverProfile(Transaction& t, const model::DriverProfileRecord& r) {
  TX(t).Mutable().profiles[r.driver_id] = r;
  return Result::Ok();
}

std::optional<model::DriverProfileRecord> MemoryRepository::GetDriverProfile(Transaction& t, const std::string& driver_id) {
  const auto& s  = TX(t).View();
  auto        it = s.profiles.find(driver_id);
  if (it == s.profiles.end()) return std::nullopt;
  return it->second;
}

std::vector<model::DriverProfileRecord> MemoryRepository::ListSuspendedDrivers(Transaction& t) {
  std::vector<model::DriverProfileRecord> out;
  for (const auto& [_, profile] : TX(t).View().profiles)
    if (profile.is_suspended) out.push_back(profile);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.driver_id < b.driver_id; });
  return out;
}

// ------------------------------------------------------------
// Availability
// ------------------------------------------------------------

Result MemoryRepository::UpsertAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  TX(t).Mutable().availability[r.driver_id] = r;
  return Result::Ok();
}

std::optional<model::DriverAvailabilityRecord> MemoryRepository::GetAvailability(Transaction& t, const std::string& driver_id,
                                                                                  uint64_t now_ms) {
  const auto& s  = TX(t).View();
  auto        it = s.availability.find(driver_id);
  if (it == s.availability.end() || !Live(it->second.expires_at_ms, now_ms)) return std::nullopt;
  return it->second;
}

std::vector<model::DriverAvailabilityRecord> MemoryRepository::ListAvailableDrivers(Transaction& t, uint64_t now_ms) {
  std::vector<model::DriverAvailabilityRecord> out;
  for (const auto& [_, record] : TX(t).View().availability) {
    if (record.status == ridedispatch::model::DriverStatus::kAvailable && record.location &&
        Live(record.expires_at_ms, now_ms)) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.driver_id < b.driver_id; });
  return out;
}

// ------------------------------------------------------------
// Broadcasts
// ------------------------------------------------------------

Result MemoryRepository::UpsertBroadcast(Transaction& t, const model::BroadcastRecord& r) {
  TX(t).Mutable().broadcasts[r.ride_id] = r;
  return Result::Ok();
}

std::optional<model::BroadcastRecord> MemoryRepository::GetBroadcast(Transaction& t, const std::string& ride_id,
                                                                     uint64_t now_ms) {
  const auto& s  = TX(t).View();
  auto        it = s.broadcasts.find(ride_id);
  if (it == s.broadcasts.end() || !Live(it->second.expires_at_ms, now_ms)) return std::nullopt;
  return it->second;
}

std::vector<model::BroadcastRecord> MemoryRepository::ListActiveBroadcasts(Transaction& t, uint64_t now_ms) {
  std::vector<model::BroadcastRecord> out;
  for (const auto& [_, record] : TX(t).View().broadcasts) {
    if (record.status == ridedispatch::model::BroadcastStatus::kActive && Live(record.expires_at_ms, now_ms)) {
      out.push_back(record);
    }
  }
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ride_id < b.ride_id; });
  return out;
}

// ------------------------------------------------------------
// Notifications
// ------------------------------------------------------------

Result MemoryRepository::UpsertNotification(Transaction& t, const model::NotificationRecord& r) {
  TX(t).Mutable().notifications[{r.driver_id, r.ride_id}] = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteNotification(Transaction& t, const std::string& driver_id, const std::string& ride_id) {
  TX(t).Mutable().notifications.erase({driver_id, ride_id});
  return Result::Ok();
}

Result MemoryRepository::DeleteNotificationsForRide(Transaction& t, const std::string& ride_id) {
  EraseIf(TX(t).Mutable().notifications, [&](const auto& n) { return n.ride_id == ride_id; });
  return Result::Ok();
}

std::vector<model::NotificationRecord> MemoryRepository::ListNotificationsForDriver(Transaction& t,
                                                                                    const std::string& driver_id,
                                                                                    uint64_t now_ms) {
  std::vector<model::NotificationRecord> out;
  const auto&                            notifications = TX(t).View().notifications;
  for (auto it = notifications.lower_bound({driver_id, std::string{}});
       it != notifications.end() && it->first.first == driver_id; ++it) {
    if (Live(it->second.expires_at_ms, now_ms)) out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------
// Rejections
// ------------------------------------------------------------

Result MemoryRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  TX(t).Mutable().rejections[{r.ride_id, r.driver_id}] = r;
  return Result::Ok();
}

std::vector<model::RejectionRecord> MemoryRepository::ListRejections(Transaction& t, const std::string& ride_id,
                                                                     uint64_t now_ms) {
  std::vector<model::RejectionRecord> out;
  const auto&                         rejections = TX(t).View().rejections;
  for (auto it = rejections.lower_bound({ride_id, std::string{}}); it != rejections.end() && it->first.first == ride_id;
       ++it) {
    if (Live(it->second.expires_at_ms, now_ms)) out.push_back(it->second);
  }
  return out;
}

// ------------------------------------------------------------
// Leases
// ------------------------------------------------------------

Result MemoryRepository::TryAcquireLease(Transaction& t, const model::LeaseRecord& r, uint64_t now_ms) {
  auto& leases = TX(t).Mutable().leases;
  auto  it     = leases.find(r.key);
  if (it != leases.end() && Live(it->second.expires_at_ms, now_ms)) {
    return Result::Err(ErrorCode::Conflict, "lease held: " + r.key);
  }
  leases[r.key] = r;
  return Result::Ok();
}

Result MemoryRepository::ReleaseLease(Transaction& t, const std::string& key, const std::string& owner) {
  auto& leases = TX(t).Mutable().leases;
  auto  it     = leases.find(key);
  if (it == leases.end() || it->second.owner != owner) return Result::Err(ErrorCode::NotFound, "lease not held: " + key);
  leases.erase(it);
  return Result::Ok();
}

std::optional<model::LeaseRecord> MemoryRepository::GetLease(Transaction& t, const std::string& key, uint64_t now_ms) {
  const auto& leases = TX(t).View().leases;
  auto        it     = leases.find(key);
  if (it == leases.end() || !Live(it->second.expires_at_ms, now_ms)) return std::nullopt;
  return it->second;
}

// ------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------

Result MemoryRepository::PurgeExpired(Transaction& t, uint64_t now_ms) {
  auto& s       = TX(t).Mutable();
  auto  expired = [now_ms](const auto& r) { return !Live(r.expires_at_ms, now_ms); };
  EraseIf(s.availability, expired);
  EraseIf(s.broadcasts, expired);
  EraseIf(s.notifications, expired);
  EraseIf(s.rejections, expired);
  EraseIf(s.leases, expired);
  return Result::Ok();
}

} // namespace ridedispatch::db::memory
