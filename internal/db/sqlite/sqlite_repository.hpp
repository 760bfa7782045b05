#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace ridedispatch::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertRide(Transaction&, const model::RideRecord&) override;
  std::optional<model::RideRecord> GetRide(Transaction&, const std::string&) override;
  Result UpdateRide(Transaction&, const model::RideRecord&) override;
  Result UpdateRideIfStatus(Transaction&, const model::RideRecord&, ridedispatch::model::RideStatus) override;
  std::vector<model::RideRecord> ListRidesByStatus(Transaction&, ridedispatch::model::RideStatus) override;

  Result UpsertDriverProfile(Transaction&, const model::DriverProfileRecord&) override;
  std::optional<model::DriverProfileRecord> GetDriverProfile(Transaction&, const std::string&) override;
  std::vector<model::DriverProfileRecord> ListSuspendedDrivers(Transaction&) override;

  Result UpsertAvailability(Transaction&, const model::DriverAvailabilityRecord&) override;
  std::optional<model::DriverAvailabilityRecord> GetAvailability(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::DriverAvailabilityRecord> ListAvailableDrivers(Transaction&, uint64_t) override;

  Result UpsertBroadcast(Transaction&, const model::BroadcastRecord&) override;
  std::optional<model::BroadcastRecord> GetBroadcast(Transaction&, const std::string&, uint64_t) override;
  std::vector<model::BroadcastRecord> ListActiveBroadcasts(Transaction&, uint64_t) override;

  Result UpsertNotification(Transaction&, const model::NotificationRecord&) override;
  Result DeleteNotification(Transaction&, const std::string& driver_id, const std::string& ride_id) override;
  Result DeleteNotificationsForRide(Transaction&, const std::string&) override;
  std::vector<model::NotificationRecord> ListNotificationsForDriver(Transaction&, const std::string&, uint64_t) override;

  Result InsertRejection(Transaction&, const model::RejectionRecord&) override;
  std::vector<model::RejectionRecord> ListRejections(Transaction&, const std::string&, uint64_t) override;

  Result TryAcquireLease(Transaction&, const model::LeaseRecord&, uint64_t) override;
  Result ReleaseLease(Transaction&, const std::string& key, const std::string& owner) override;
  std::optional<model::LeaseRecord> GetLease(Transaction&, const std::string&, uint64_t) override;

  Result PurgeExpired(Transaction&, uint64_t) override;

private:
  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

}
