#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/broadcast_record.hpp"
#include "internal/db/model/driver_availability_record.hpp"
#include "internal/db/model/driver_profile_record.hpp"
#include "internal/db/model/lease_record.hpp"
#include "internal/db/model/notification_record.hpp"
#include "internal/db/model/rejection_record.hpp"
#include "internal/db/model/ride_record.hpp"

namespace ridedispatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - UpdateRideIfStatus is an atomic compare-and-set on ride status
  - TryAcquireLease is atomic: at most one unexpired lease per key

  The DB is the source of truth for:
    rides, driver profiles
    availability (+ the available-drivers index)
    broadcasts, pending notifications, rejections
    arbitration leases

  Rows carrying expires_at_ms are invisible to reads taking now_ms once
  expires_at_ms <= now_ms; PurgeExpired physically removes them.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Rides
  // ---------------------------------------------------------------------

  virtual Result InsertRide(Transaction&, const model::RideRecord&) = 0;

  virtual std::optional<model::RideRecord> GetRide(Transaction&, const std::string& ride_id) = 0;

  // Unconditional overwrite; NotFound if the ride does not exist.
  virtual Result UpdateRide(Transaction&, const model::RideRecord&) = 0;

  // Overwrite only if the stored status equals expected; Conflict otherwise.
  virtual Result UpdateRideIfStatus(Transaction&, const model::RideRecord&, ridedispatch::model::RideStatus expected) = 0;

  virtual std::vector<model::RideRecord> ListRidesByStatus(Transaction&, ridedispatch::model::RideStatus status) = 0;

  // ---------------------------------------------------------------------
  // Driver profiles
  // ---------------------------------------------------------------------

  virtual Result UpsertDriverProfile(Transaction&, const model::DriverProfileRecord&) = 0;

  virtual std::optional<model::DriverProfileRecord> GetDriverProfile(Transaction&, const std::string& driver_id) = 0;

  virtual std::vector<model::DriverProfileRecord> ListSuspendedDrivers(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Availability
  // ---------------------------------------------------------------------

  virtual Result UpsertAvailability(Transaction&, const model::DriverAvailabilityRecord&) = 0;

  virtual std::optional<model::DriverAvailabilityRecord> GetAvailability(Transaction&, const std::string& driver_id,
                                                                         uint64_t now_ms) = 0;

  // The available-drivers index: status = available, unexpired, located.
  virtual std::vector<model::DriverAvailabilityRecord> ListAvailableDrivers(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Broadcasts
  // ---------------------------------------------------------------------

  virtual Result UpsertBroadcast(Transaction&, const model::BroadcastRecord&) = 0;

  virtual std::optional<model::BroadcastRecord> GetBroadcast(Transaction&, const std::string& ride_id, uint64_t now_ms) = 0;

  virtual std::vector<model::BroadcastRecord> ListActiveBroadcasts(Transaction&, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Pending notifications
  // ---------------------------------------------------------------------

  // Keyed by (driver_id, ride_id); a later round replaces the earlier row.
  virtual Result UpsertNotification(Transaction&, const model::NotificationRecord&) = 0;

  virtual Result DeleteNotification(Transaction&, const std::string& driver_id, const std::string& ride_id) = 0;

  virtual Result DeleteNotificationsForRide(Transaction&, const std::string& ride_id) = 0;

  virtual std::vector<model::NotificationRecord> ListNotificationsForDriver(Transaction&, const std::string& driver_id,
                                                                            uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Rejections
  // ---------------------------------------------------------------------

  // Idempotent per (ride_id, driver_id).
  virtual Result InsertRejection(Transaction&, const model::RejectionRecord&) = 0;

  virtual std::vector<model::RejectionRecord> ListRejections(Transaction&, const std::string& ride_id, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Leases
  // ---------------------------------------------------------------------

  // Ok if acquired; Conflict if an unexpired lease with the key exists.
  virtual Result TryAcquireLease(Transaction&, const model::LeaseRecord&, uint64_t now_ms) = 0;

  virtual Result ReleaseLease(Transaction&, const std::string& key, const std::string& owner) = 0;

  virtual std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string& key, uint64_t now_ms) = 0;

  // ---------------------------------------------------------------------
  // Maintenance
  // ---------------------------------------------------------------------

  // Removes expired availability, broadcast, notification, rejection and
  // lease rows. Rides and profiles are never purged.
  virtual Result PurgeExpired(Transaction&, uint64_t now_ms) = 0;
};

} // namespace ridedispatch::db
