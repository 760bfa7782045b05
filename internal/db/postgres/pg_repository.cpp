#include "pg_repository.hpp"

#include "internal/db/sql/id_list.hpp"

namespace ridedispatch::db::postgres {

namespace domain = ridedispatch::model;

namespace {

int64_t I64(uint64_t v) {
  return static_cast<int64_t>(v);
}

uint64_t U64(const pqxx::field& f) {
  return static_cast<uint64_t>(f.as<int64_t>());
}

std::optional<std::string> NullableText(const std::string& s) {
  if (s.empty()) return std::nullopt;
  return s;
}

model::RideRecord ReadRide(const pqxx::row& row) {
  model::RideRecord r;
  r.ride_id                    = row[0].c_str();
  r.rider_id                   = row[1].c_str();
  r.driver_id                  = row[2].is_null() ? std::string{} : row[2].as<std::string>();
  r.status                     = static_cast<domain::RideStatus>(row[3].as<int>());
  r.request_class              = static_cast<domain::RequestClass>(row[4].as<int>());
  r.pickup                     = {row[5].as<double>(), row[6].as<double>()};
  r.destination                = {row[7].as<double>(), row[8].as<double>()};
  r.estimated_fare             = row[9].as<double>();
  if (!row[10].is_null()) r.final_fare = row[10].as<double>();
  r.fare_breakdown.base        = row[11].as<double>();
  r.fare_breakdown.per_km      = row[12].as<double>();
  r.fare_breakdown.distance_km = row[13].as<double>();
  r.fare_breakdown.surge       = row[14].as<double>();
  r.fare_breakdown.final_total = row[15].as<double>();
  r.requested_at_ms            = U64(row[16]);
  r.matched_at_ms              = U64(row[17]);
  r.pickup_time_ms             = U64(row[18]);
  r.start_time_ms              = U64(row[19]);
  r.completed_at_ms            = U64(row[20]);
  r.cancellation_timestamp_ms  = U64(row[21]);
  r.cancelled_by               = row[22].c_str();
  r.cancellation_reason        = row[23].c_str();
  r.cancellation_fee           = row[24].as<double>();
  r.version                    = U64(row[25]);
  return r;
}

model::DriverProfileRecord ReadProfile(const pqxx::row& row) {
  model::DriverProfileRecord r;
  r.driver_id                  = row[0].c_str();
  r.name                       = row[1].c_str();
  r.status                     = static_cast<domain::DriverStatus>(row[2].as<int>());
  r.cancellation_count         = static_cast<uint32_t>(row[3].as<int>());
  r.last_reset_at_ms           = U64(row[4]);
  r.is_suspended               = row[5].as<int>() != 0;
  r.suspended_at_ms            = U64(row[6]);
  r.accept_extended_area       = row[7].as<int>() != 0;
  r.accept_parcel_delivery     = row[8].as<int>() != 0;
  r.vehicle_registration       = row[9].c_str();
  r.vehicle_make               = row[10].c_str();
  r.vehicle_model              = row[11].c_str();
  r.vehicle_color              = row[12].c_str();
  r.rating                     = row[13].as<double>();
  r.total_rides                = static_cast<uint32_t>(row[14].as<int>());
  r.availability_started_at_ms = U64(row[15]);
  r.daily_availability_hours   = row[16].as<double>();
  return r;
}

model::DriverAvailabilityRecord ReadAvailability(const pqxx::row& row) {
  model::DriverAvailabilityRecord r;
  r.driver_id = row[0].c_str();
  r.status    = static_cast<domain::DriverStatus>(row[1].as<int>());
  if (row[2].as<int>() != 0) r.location = domain::GeoPoint{row[3].as<double>(), row[4].as<double>()};
  r.updated_at_ms = U64(row[5]);
  r.expires_at_ms = U64(row[6]);
  return r;
}

model::BroadcastRecord ReadBroadcast(const pqxx::row& row) {
  model::BroadcastRecord r;
  r.ride_id              = row[0].c_str();
  r.request_class        = static_cast<domain::RequestClass>(row[1].as<int>());
  r.pickup               = {row[2].as<double>(), row[3].as<double>()};
  r.destination          = {row[4].as<double>(), row[5].as<double>()};
  r.estimated_fare       = row[6].as<double>();
  r.radius_km            = row[7].as<double>();
  r.is_extended_area     = row[8].as<int>() != 0;
  r.notified_driver_ids  = sql::SplitIds(row[9].as<std::string>());
  r.status               = static_cast<domain::BroadcastStatus>(row[10].as<int>());
  r.broadcast_count      = static_cast<uint32_t>(row[11].as<int>());
  r.created_at_ms        = U64(row[12]);
  r.last_expansion_at_ms = U64(row[13]);
  r.expires_at_ms        = U64(row[14]);
  r.excluded_driver_ids  = sql::SplitIds(row[15].as<std::string>());
  return r;
}

model::NotificationRecord ReadNotification(const pqxx::row& row) {
  model::NotificationRecord r;
  r.driver_id             = row[0].c_str();
  r.ride_id               = row[1].c_str();
  r.request_class         = static_cast<domain::RequestClass>(row[2].as<int>());
  r.pickup                = {row[3].as<double>(), row[4].as<double>()};
  r.destination           = {row[5].as<double>(), row[6].as<double>()};
  r.estimated_fare        = row[7].as<double>();
  r.distance_to_pickup_km = row[8].as<double>();
  r.is_extended_area      = row[9].as<int>() != 0;
  r.broadcast_round       = static_cast<uint32_t>(row[10].as<int>());
  r.notified_at_ms        = U64(row[11]);
  r.expires_at_ms         = U64(row[12]);
  return r;
}

// ride_id first, then the 24 body columns; extra trailing params appended by caller
template <typename... Extra>
pqxx::result ExecRide(pqxx::work& w, const char* statement, const model::RideRecord& r, Extra&&... extra) {
  return w.exec_prepared(statement, r.ride_id, r.rider_id, NullableText(r.driver_id), static_cast<int>(r.status),
                         static_cast<int>(r.request_class), r.pickup.latitude, r.pickup.longitude,
                         r.destination.latitude, r.destination.longitude, r.estimated_fare, r.final_fare,
                         r.fare_breakdown.base, r.fare_breakdown.per_km, r.fare_breakdown.distance_km,
                         r.fare_breakdown.surge, r.fare_breakdown.final_total, I64(r.requested_at_ms),
                         I64(r.matched_at_ms), I64(r.pickup_time_ms), I64(r.start_time_ms), I64(r.completed_at_ms),
                         I64(r.cancellation_timestamp_ms), r.cancelled_by, r.cancellation_reason, r.cancellation_fee,
                         std::forward<Extra>(extra)...);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::serialization_failure*>(&e) || dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    throw TransactionConflict(e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) return Result::Err(ErrorCode::AlreadyExists, e.what());
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) return Result::Err(ErrorCode::ConstraintViolation, e.what());
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) return Result::Err(ErrorCode::IOError, e.what());
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Rides
// ------------------------------------------------------------------

Result PgRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  try {
    ExecRide(TX(t).Work(), "insert_ride", r, I64(r.version));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RideRecord> PgRepository::GetRide(Transaction& t, const std::string& ride_id) {
  auto res = TX(t).Work().exec_prepared("get_ride", ride_id);
  if (res.empty()) return std::nullopt;
  return ReadRide(res[0]);
}

Result PgRepository::UpdateRide(Transaction& t, const model::RideRecord& r) {
  try {
    auto res = ExecRide(TX(t).Work(), "update_ride", r);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, domain::RideStatus expected) {
  try {
    auto res = ExecRide(TX(t).Work(), "update_ride_if_status", r, static_cast<int>(expected));
    if (res.affected_rows() == 1) return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }

  if (!GetRide(t, r.ride_id)) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
  return Result::Err(ErrorCode::Conflict, "ride status changed: " + r.ride_id);
}

std::vector<model::RideRecord> PgRepository::ListRidesByStatus(Transaction& t, domain::RideStatus status) {
  auto res = TX(t).Work().exec_prepared("list_rides_by_status", static_cast<int>(status));

  std::vector<model::RideRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadRide(row));
  return out;
}

// ------------------------------------------------------------------
// Driver profiles
// ------------------------------------------------------------------

Result PgRepository::UpsertDriverProfile(Transaction& t, const model::DriverProfileRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_profile", r.driver_id, r.name, static_cast<int>(r.status),
                               static_cast<int>(r.cancellation_count), I64(r.last_reset_at_ms), r.is_suspended ? 1 : 0,
                               I64(r.suspended_at_ms), r.accept_extended_area ? 1 : 0, r.accept_parcel_delivery ? 1 : 0,
                               r.vehicle_registration, r.vehicle_make, r.vehicle_model, r.vehicle_color, r.rating,
                               static_cast<int>(r.total_rides), I64(r.availability_started_at_ms),
                               r.daily_availability_hours);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DriverProfileRecord> PgRepository::GetDriverProfile(Transaction& t, const std::string& driver_id) {
  auto res = TX(t).Work().exec_prepared("get_profile", driver_id);
  if (res.empty()) return std::nullopt;
  return ReadProfile(res[0]);
}

std::vector<model::DriverProfileRecord> PgRepository::ListSuspendedDrivers(Transaction& t) {
  auto res = TX(t).Work().exec_prepared("list_suspended");

  std::vector<model::DriverProfileRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadProfile(row));
  return out;
}

// ------------------------------------------------------------------
// Availability
// ------------------------------------------------------------------

Result PgRepository::UpsertAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_availability", r.driver_id, static_cast<int>(r.status), r.location ? 1 : 0,
                               r.location ? r.location->latitude : 0.0, r.location ? r.location->longitude : 0.0,
                               I64(r.updated_at_ms), I64(r.expires_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::DriverAvailabilityRecord> PgRepository::GetAvailability(Transaction& t, const std::string& driver_id,
                                                                              uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("get_availability", driver_id, I64(now_ms));
  if (res.empty()) return std::nullopt;
  return ReadAvailability(res[0]);
}

std::vector<model::DriverAvailabilityRecord> PgRepository::ListAvailableDrivers(Transaction& t, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("list_available", static_cast<int>(domain::DriverStatus::kAvailable), I64(now_ms));

  std::vector<model::DriverAvailabilityRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadAvailability(row));
  return out;
}

// ------------------------------------------------------------------
// Broadcasts
// ------------------------------------------------------------------

Result PgRepository::UpsertBroadcast(Transaction& t, const model::BroadcastRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_broadcast", r.ride_id, static_cast<int>(r.request_class), r.pickup.latitude,
                               r.pickup.longitude, r.destination.latitude, r.destination.longitude, r.estimated_fare,
                               r.radius_km, r.is_extended_area ? 1 : 0, sql::JoinIds(r.notified_driver_ids),
                               static_cast<int>(r.status), static_cast<int>(r.broadcast_count), I64(r.created_at_ms),
                               I64(r.last_expansion_at_ms), I64(r.expires_at_ms), sql::JoinIds(r.excluded_driver_ids));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BroadcastRecord> PgRepository::GetBroadcast(Transaction& t, const std::string& ride_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("get_broadcast", ride_id, I64(now_ms));
  if (res.empty()) return std::nullopt;
  return ReadBroadcast(res[0]);
}

std::vector<model::BroadcastRecord> PgRepository::ListActiveBroadcasts(Transaction& t, uint64_t now_ms) {
  auto res =
      TX(t).Work().exec_prepared("list_active_broadcasts", static_cast<int>(domain::BroadcastStatus::kActive), I64(now_ms));

  std::vector<model::BroadcastRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadBroadcast(row));
  return out;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result PgRepository::UpsertNotification(Transaction& t, const model::NotificationRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_notification", r.driver_id, r.ride_id, static_cast<int>(r.request_class),
                               r.pickup.latitude, r.pickup.longitude, r.destination.latitude, r.destination.longitude,
                               r.estimated_fare, r.distance_to_pickup_km, r.is_extended_area ? 1 : 0,
                               static_cast<int>(r.broadcast_round), I64(r.notified_at_ms), I64(r.expires_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteNotification(Transaction& t, const std::string& driver_id, const std::string& ride_id) {
  try {
    TX(t).Work().exec_prepared("delete_notification", driver_id, ride_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteNotificationsForRide(Transaction& t, const std::string& ride_id) {
  try {
    TX(t).Work().exec_prepared("delete_ride_notifications", ride_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::NotificationRecord> PgRepository::ListNotificationsForDriver(Transaction& t, const std::string& driver_id,
                                                                                uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("list_driver_notifications", driver_id, I64(now_ms));

  std::vector<model::NotificationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res)
    out.push_back(ReadNotification(row));
  return out;
}

// ------------------------------------------------------------------
// Rejections
// ------------------------------------------------------------------

Result PgRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_rejection", r.ride_id, r.driver_id, I64(r.rejected_at_ms), I64(r.expires_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RejectionRecord> PgRepository::ListRejections(Transaction& t, const std::string& ride_id, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("list_rejections", ride_id, I64(now_ms));

  std::vector<model::RejectionRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    model::RejectionRecord r;
    r.ride_id        = row[0].c_str();
    r.driver_id      = row[1].c_str();
    r.rejected_at_ms = U64(row[2]);
    r.expires_at_ms  = U64(row[3]);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result PgRepository::TryAcquireLease(Transaction& t, const model::LeaseRecord& r, uint64_t now_ms) {
  try {
    auto res = TX(t).Work().exec_prepared("acquire_lease", r.key, r.owner, I64(r.acquired_at_ms), I64(r.expires_at_ms),
                                          I64(now_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::Conflict, "lease held: " + r.key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::ReleaseLease(Transaction& t, const std::string& key, const std::string& owner) {
  try {
    auto res = TX(t).Work().exec_prepared("release_lease", key, owner);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, "lease not held: " + key);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LeaseRecord> PgRepository::GetLease(Transaction& t, const std::string& key, uint64_t now_ms) {
  auto res = TX(t).Work().exec_prepared("get_lease", key, I64(now_ms));
  if (res.empty()) return std::nullopt;

  model::LeaseRecord r;
  r.key            = res[0][0].c_str();
  r.owner          = res[0][1].c_str();
  r.acquired_at_ms = U64(res[0][2]);
  r.expires_at_ms  = U64(res[0][3]);
  return r;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result PgRepository::PurgeExpired(Transaction& t, uint64_t now_ms) {
  try {
    auto& w = TX(t).Work();
    for (const char* table : {"driver_availability", "broadcasts", "ride_notifications", "ride_rejections", "dispatch_leases"}) {
      w.exec_params(std::string("DELETE FROM ") + table + " WHERE expires_at_ms<=$1", I64(now_ms));
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

} // namespace ridedispatch::db::postgres
