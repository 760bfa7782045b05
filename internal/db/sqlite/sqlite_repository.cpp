#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/id_list.hpp"

namespace ridedispatch::db::sqlite {

using ridedispatch::db::ErrorCode;
using ridedispatch::db::Result;

namespace domain = ridedispatch::model;

namespace {

// Finalizes on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
  }
  ~Statement() {
    sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }

  // SQLITE_ROW / SQLITE_DONE; anything else throws
  int Step() {
    const int rc = sqlite3_step(st_);
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
    }
    return rc;
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindNullableText(sqlite3_stmt* st, int idx, const std::string& s) {
  if (s.empty()) {
    sqlite3_bind_null(st, idx);
  } else {
    BindText(st, idx, s);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

void BindDouble(sqlite3_stmt* st, int idx, double v) {
  sqlite3_bind_double(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

double ColDouble(sqlite3_stmt* st, int col) {
  return sqlite3_column_double(st, col);
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

// ------------------------------------------------------------------
// Row codecs
// ------------------------------------------------------------------

constexpr const char* kRideColumns =
    "ride_id,rider_id,driver_id,status,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,"
    "estimated_fare,final_fare,fare_base,fare_per_km,fare_distance_km,fare_surge,fare_final_total,"
    "requested_at_ms,matched_at_ms,pickup_time_ms,start_time_ms,completed_at_ms,cancellation_timestamp_ms,"
    "cancelled_by,cancellation_reason,cancellation_fee,version";

// Binds the 24 mutable ride columns (everything except ride_id and version)
// starting at idx, in kRideColumns order.
int BindRideBody(sqlite3_stmt* st, int idx, const model::RideRecord& r) {
  BindText(st, idx++, r.rider_id);
  BindNullableText(st, idx++, r.driver_id);
  BindI32(st, idx++, static_cast<int>(r.status));
  BindI32(st, idx++, static_cast<int>(r.request_class));
  BindDouble(st, idx++, r.pickup.latitude);
  BindDouble(st, idx++, r.pickup.longitude);
  BindDouble(st, idx++, r.destination.latitude);
  BindDouble(st, idx++, r.destination.longitude);
  BindDouble(st, idx++, r.estimated_fare);
  if (r.final_fare) {
    BindDouble(st, idx++, *r.final_fare);
  } else {
    sqlite3_bind_null(st, idx++);
  }
  BindDouble(st, idx++, r.fare_breakdown.base);
  BindDouble(st, idx++, r.fare_breakdown.per_km);
  BindDouble(st, idx++, r.fare_breakdown.distance_km);
  BindDouble(st, idx++, r.fare_breakdown.surge);
  BindDouble(st, idx++, r.fare_breakdown.final_total);
  BindU64(st, idx++, r.requested_at_ms);
  BindU64(st, idx++, r.matched_at_ms);
  BindU64(st, idx++, r.pickup_time_ms);
  BindU64(st, idx++, r.start_time_ms);
  BindU64(st, idx++, r.completed_at_ms);
  BindU64(st, idx++, r.cancellation_timestamp_ms);
  BindText(st, idx++, r.cancelled_by);
  BindText(st, idx++, r.cancellation_reason);
  BindDouble(st, idx++, r.cancellation_fee);
  return idx;
}

model::RideRecord ReadRide(sqlite3_stmt* st) {
  model::RideRecord r;
  r.ride_id                      = ColText(st, 0);
  r.rider_id                     = ColText(st, 1);
  r.driver_id                    = ColText(st, 2);
  r.status                       = static_cast<domain::RideStatus>(ColI32(st, 3));
  r.request_class                = static_cast<domain::RequestClass>(ColI32(st, 4));
  r.pickup                       = {ColDouble(st, 5), ColDouble(st, 6)};
  r.destination                  = {ColDouble(st, 7), ColDouble(st, 8)};
  r.estimated_fare               = ColDouble(st, 9);
  if (!ColIsNull(st, 10)) r.final_fare = ColDouble(st, 10);
  r.fare_breakdown.base          = ColDouble(st, 11);
  r.fare_breakdown.per_km        = ColDouble(st, 12);
  r.fare_breakdown.distance_km   = ColDouble(st, 13);
  r.fare_breakdown.surge         = ColDouble(st, 14);
  r.fare_breakdown.final_total   = ColDouble(st, 15);
  r.requested_at_ms              = ColU64(st, 16);
  r.matched_at_ms                = ColU64(st, 17);
  r.pickup_time_ms               = ColU64(st, 18);
  r.start_time_ms                = ColU64(st, 19);
  r.completed_at_ms              = ColU64(st, 20);
  r.cancellation_timestamp_ms    = ColU64(st, 21);
  r.cancelled_by                 = ColText(st, 22);
  r.cancellation_reason          = ColText(st, 23);
  r.cancellation_fee             = ColDouble(st, 24);
  r.version                      = ColU64(st, 25);
  return r;
}

constexpr const char* kRideUpdateSet =
    "rider_id=?,driver_id=?,status=?,request_class=?,pickup_lat=?,pickup_lon=?,dest_lat=?,dest_lon=?,"
    "estimated_fare=?,final_fare=?,fare_base=?,fare_per_km=?,fare_distance_km=?,fare_surge=?,fare_final_total=?,"
    "requested_at_ms=?,matched_at_ms=?,pickup_time_ms=?,start_time_ms=?,completed_at_ms=?,cancellation_timestamp_ms=?,"
    "cancelled_by=?,cancellation_reason=?,cancellation_fee=?,version=version+1";

constexpr const char* kProfileColumns =
    "driver_id,name,status,cancellation_count,last_reset_at_ms,is_suspended,suspended_at_ms,"
    "accept_extended_area,accept_parcel_delivery,vehicle_registration,vehicle_make,vehicle_model,vehicle_color,"
    "rating,total_rides,availability_started_at_ms,daily_availability_hours";

model::DriverProfileRecord ReadProfile(sqlite3_stmt* st) {
  model::DriverProfileRecord r;
  r.driver_id                  = ColText(st, 0);
  r.name                       = ColText(st, 1);
  r.status                     = static_cast<domain::DriverStatus>(ColI32(st, 2));
  r.cancellation_count         = static_cast<uint32_t>(ColI32(st, 3));
  r.last_reset_at_ms           = ColU64(st, 4);
  r.is_suspended               = ColI32(st, 5) != 0;
  r.suspended_at_ms            = ColU64(st, 6);
  r.accept_extended_area       = ColI32(st, 7) != 0;
  r.accept_parcel_delivery     = ColI32(st, 8) != 0;
  r.vehicle_registration       = ColText(st, 9);
  r.vehicle_make               = ColText(st, 10);
  r.vehicle_model              = ColText(st, 11);
  r.vehicle_color              = ColText(st, 12);
  r.rating                     = ColDouble(st, 13);
  r.total_rides                = static_cast<uint32_t>(ColI32(st, 14));
  r.availability_started_at_ms = ColU64(st, 15);
  r.daily_availability_hours   = ColDouble(st, 16);
  return r;
}

constexpr const char* kAvailabilityColumns = "driver_id,status,has_location,latitude,longitude,updated_at_ms,expires_at_ms";

model::DriverAvailabilityRecord ReadAvailability(sqlite3_stmt* st) {
  model::DriverAvailabilityRecord r;
  r.driver_id = ColText(st, 0);
  r.status    = static_cast<domain::DriverStatus>(ColI32(st, 1));
  if (ColI32(st, 2) != 0) r.location = domain::GeoPoint{ColDouble(st, 3), ColDouble(st, 4)};
  r.updated_at_ms = ColU64(st, 5);
  r.expires_at_ms = ColU64(st, 6);
  return r;
}

constexpr const char* kBroadcastColumns =
    "ride_id,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,estimated_fare,radius_km,is_extended_area,"
    "notified_driver_ids,status,broadcast_count,created_at_ms,last_expansion_at_ms,expires_at_ms,excluded_driver_ids";

model::BroadcastRecord ReadBroadcast(sqlite3_stmt* st) {
  model::BroadcastRecord r;
  r.ride_id              = ColText(st, 0);
  r.request_class        = static_cast<domain::RequestClass>(ColI32(st, 1));
  r.pickup               = {ColDouble(st, 2), ColDouble(st, 3)};
  r.destination          = {ColDouble(st, 4), ColDouble(st, 5)};
  r.estimated_fare       = ColDouble(st, 6);
  r.radius_km            = ColDouble(st, 7);
  r.is_extended_area     = ColI32(st, 8) != 0;
  r.notified_driver_ids  = sql::SplitIds(ColText(st, 9));
  r.status               = static_cast<domain::BroadcastStatus>(ColI32(st, 10));
  r.broadcast_count      = static_cast<uint32_t>(ColI32(st, 11));
  r.created_at_ms        = ColU64(st, 12);
  r.last_expansion_at_ms = ColU64(st, 13);
  r.expires_at_ms        = ColU64(st, 14);
  r.excluded_driver_ids  = sql::SplitIds(ColText(st, 15));
  return r;
}

constexpr const char* kNotificationColumns =
    "driver_id,ride_id,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,estimated_fare,"
    "distance_to_pickup_km,is_extended_area,broadcast_round,notified_at_ms,expires_at_ms";

model::NotificationRecord ReadNotification(sqlite3_stmt* st) {
  model::NotificationRecord r;
  r.driver_id             = ColText(st, 0);
  r.ride_id               = ColText(st, 1);
  r.request_class         = static_cast<domain::RequestClass>(ColI32(st, 2));
  r.pickup                = {ColDouble(st, 3), ColDouble(st, 4)};
  r.destination           = {ColDouble(st, 5), ColDouble(st, 6)};
  r.estimated_fare        = ColDouble(st, 7);
  r.distance_to_pickup_km = ColDouble(st, 8);
  r.is_extended_area      = ColI32(st, 9) != 0;
  r.broadcast_round       = static_cast<uint32_t>(ColI32(st, 10));
  r.notified_at_ms        = ColU64(st, 11);
  r.expires_at_ms         = ColU64(st, 12);
  return r;
}

std::string Select(const char* columns, const char* rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Rides
// ------------------------------------------------------------------

Result SqliteRepository::InsertRide(Transaction& t, const model::RideRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("INSERT INTO rides(") + kRideColumns +
                          ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?);";
  Statement st(db, sql.c_str());
  BindText(st.get(), 1, r.ride_id);
  const int next = BindRideBody(st.get(), 2, r);
  BindU64(st.get(), next, r.version);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, "ride exists: " + r.ride_id);
  return Translate(db, rc);
}

std::optional<model::RideRecord> SqliteRepository::GetRide(Transaction& t, const std::string& ride_id) {
  auto*     db  = TX(t).Handle();
  const auto sql = Select(kRideColumns, "FROM rides WHERE ride_id=?;");
  Statement st(db, sql.c_str());
  BindText(st.get(), 1, ride_id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadRide(st.get());
}

Result SqliteRepository::UpdateRide(Transaction& t, const model::RideRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("UPDATE rides SET ") + kRideUpdateSet + " WHERE ride_id=?;";
  Statement st(db, sql.c_str());
  const int next = BindRideBody(st.get(), 1, r);
  BindText(st.get(), next, r.ride_id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
  return Result::Ok();
}

Result SqliteRepository::UpdateRideIfStatus(Transaction& t, const model::RideRecord& r, domain::RideStatus expected) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("UPDATE rides SET ") + kRideUpdateSet + " WHERE ride_id=? AND status=?;";
  Statement st(db, sql.c_str());
  int       next = BindRideBody(st.get(), 1, r);
  BindText(st.get(), next++, r.ride_id);
  BindI32(st.get(), next, static_cast<int>(expected));

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 1) return Result::Ok();

  if (!GetRide(t, r.ride_id)) return Result::Err(ErrorCode::NotFound, "ride not found: " + r.ride_id);
  return Result::Err(ErrorCode::Conflict, "ride status changed: " + r.ride_id);
}

std::vector<model::RideRecord> SqliteRepository::ListRidesByStatus(Transaction& t, domain::RideStatus status) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kRideColumns, "FROM rides WHERE status=? ORDER BY ride_id;");
  Statement  st(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(status));

  std::vector<model::RideRecord> out;
  while (st.Step() == SQLITE_ROW)
    out.push_back(ReadRide(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Driver profiles
// ------------------------------------------------------------------

Result SqliteRepository::UpsertDriverProfile(Transaction& t, const model::DriverProfileRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("INSERT INTO driver_profiles(") + kProfileColumns +
      ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(driver_id) DO UPDATE SET "
      "name=excluded.name,status=excluded.status,cancellation_count=excluded.cancellation_count,"
      "last_reset_at_ms=excluded.last_reset_at_ms,is_suspended=excluded.is_suspended,"
      "suspended_at_ms=excluded.suspended_at_ms,accept_extended_area=excluded.accept_extended_area,"
      "accept_parcel_delivery=excluded.accept_parcel_delivery,vehicle_registration=excluded.vehicle_registration,"
      "vehicle_make=excluded.vehicle_make,vehicle_model=excluded.vehicle_model,vehicle_color=excluded.vehicle_color,"
      "rating=excluded.rating,total_rides=excluded.total_rides,"
      "availability_started_at_ms=excluded.availability_started_at_ms,"
      "daily_availability_hours=excluded.daily_availability_hours;";
  Statement st(db, sql.c_str());
  auto*     s = st.get();
  BindText(s, 1, r.driver_id);
  BindText(s, 2, r.name);
  BindI32(s, 3, static_cast<int>(r.status));
  BindI32(s, 4, static_cast<int>(r.cancellation_count));
  BindU64(s, 5, r.last_reset_at_ms);
  BindI32(s, 6, r.is_suspended ? 1 : 0);
  BindU64(s, 7, r.suspended_at_ms);
  BindI32(s, 8, r.accept_extended_area ? 1 : 0);
  BindI32(s, 9, r.accept_parcel_delivery ? 1 : 0);
  BindText(s, 10, r.vehicle_registration);
  BindText(s, 11, r.vehicle_make);
  BindText(s, 12, r.vehicle_model);
  BindText(s, 13, r.vehicle_color);
  BindDouble(s, 14, r.rating);
  BindI32(s, 15, static_cast<int>(r.total_rides));
  BindU64(s, 16, r.availability_started_at_ms);
  BindDouble(s, 17, r.daily_availability_hours);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::DriverProfileRecord> SqliteRepository::GetDriverProfile(Transaction& t, const std::string& driver_id) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kProfileColumns, "FROM driver_profiles WHERE driver_id=?;");
  Statement  st(db, sql.c_str());
  BindText(st.get(), 1, driver_id);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadProfile(st.get());
}

std::vector<model::DriverProfileRecord> SqliteRepository::ListSuspendedDrivers(Transaction& t) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kProfileColumns, "FROM driver_profiles WHERE is_suspended=1 ORDER BY driver_id;");
  Statement  st(db, sql.c_str());

  std::vector<model::DriverProfileRecord> out;
  while (st.Step() == SQLITE_ROW)
    out.push_back(ReadProfile(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Availability
// ------------------------------------------------------------------

Result SqliteRepository::UpsertAvailability(Transaction& t, const model::DriverAvailabilityRecord& r) {
  auto* db = TX(t).Handle();

  const char* sql =
      "INSERT INTO driver_availability(driver_id,status,has_location,latitude,longitude,updated_at_ms,expires_at_ms)"
      " VALUES(?,?,?,?,?,?,?) ON CONFLICT(driver_id) DO UPDATE SET status=excluded.status,"
      "has_location=excluded.has_location,latitude=excluded.latitude,longitude=excluded.longitude,"
      "updated_at_ms=excluded.updated_at_ms,expires_at_ms=excluded.expires_at_ms;";
  Statement st(db, sql);
  auto*     s = st.get();
  BindText(s, 1, r.driver_id);
  BindI32(s, 2, static_cast<int>(r.status));
  BindI32(s, 3, r.location ? 1 : 0);
  BindDouble(s, 4, r.location ? r.location->latitude : 0.0);
  BindDouble(s, 5, r.location ? r.location->longitude : 0.0);
  BindU64(s, 6, r.updated_at_ms);
  BindU64(s, 7, r.expires_at_ms);

  return Translate(db, sqlite3_step(s));
}

std::optional<model::DriverAvailabilityRecord> SqliteRepository::GetAvailability(Transaction& t, const std::string& driver_id,
                                                                                  uint64_t now_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kAvailabilityColumns, "FROM driver_availability WHERE driver_id=? AND expires_at_ms>?;");
  Statement  st(db, sql.c_str());
  BindText(st.get(), 1, driver_id);
  BindU64(st.get(), 2, now_ms);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadAvailability(st.get());
}

std::vector<model::DriverAvailabilityRecord> SqliteRepository::ListAvailableDrivers(Transaction& t, uint64_t now_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kAvailabilityColumns,
                          "FROM driver_availability WHERE status=? AND has_location=1 AND expires_at_ms>? ORDER BY driver_id;");
  Statement st(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(domain::DriverStatus::kAvailable));
  BindU64(st.get(), 2, now_ms);

  std::vector<model::DriverAvailabilityRecord> out;
  while (st.Step() == SQLITE_ROW)
    out.push_back(ReadAvailability(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Broadcasts
// ------------------------------------------------------------------

Result SqliteRepository::UpsertBroadcast(Transaction& t, const model::BroadcastRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("INSERT INTO broadcasts(") + kBroadcastColumns +
      ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(ride_id) DO UPDATE SET "
      "request_class=excluded.request_class,pickup_lat=excluded.pickup_lat,pickup_lon=excluded.pickup_lon,"
      "dest_lat=excluded.dest_lat,dest_lon=excluded.dest_lon,estimated_fare=excluded.estimated_fare,"
      "radius_km=excluded.radius_km,is_extended_area=excluded.is_extended_area,"
      "notified_driver_ids=excluded.notified_driver_ids,status=excluded.status,"
      "broadcast_count=excluded.broadcast_count,created_at_ms=excluded.created_at_ms,"
      "last_expansion_at_ms=excluded.last_expansion_at_ms,expires_at_ms=excluded.expires_at_ms,"
      "excluded_driver_ids=excluded.excluded_driver_ids;";
  Statement st(db, sql.c_str());
  auto*     s = st.get();
  BindText(s, 1, r.ride_id);
  BindI32(s, 2, static_cast<int>(r.request_class));
  BindDouble(s, 3, r.pickup.latitude);
  BindDouble(s, 4, r.pickup.longitude);
  BindDouble(s, 5, r.destination.latitude);
  BindDouble(s, 6, r.destination.longitude);
  BindDouble(s, 7, r.estimated_fare);
  BindDouble(s, 8, r.radius_km);
  BindI32(s, 9, r.is_extended_area ? 1 : 0);
  BindText(s, 10, sql::JoinIds(r.notified_driver_ids));
  BindI32(s, 11, static_cast<int>(r.status));
  BindI32(s, 12, static_cast<int>(r.broadcast_count));
  BindU64(s, 13, r.created_at_ms);
  BindU64(s, 14, r.last_expansion_at_ms);
  BindU64(s, 15, r.expires_at_ms);
  BindText(s, 16, sql::JoinIds(r.excluded_driver_ids));

  return Translate(db, sqlite3_step(s));
}

std::optional<model::BroadcastRecord> SqliteRepository::GetBroadcast(Transaction& t, const std::string& ride_id, uint64_t now_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kBroadcastColumns, "FROM broadcasts WHERE ride_id=? AND expires_at_ms>?;");
  Statement  st(db, sql.c_str());
  BindText(st.get(), 1, ride_id);
  BindU64(st.get(), 2, now_ms);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadBroadcast(st.get());
}

std::vector<model::BroadcastRecord> SqliteRepository::ListActiveBroadcasts(Transaction& t, uint64_t now_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kBroadcastColumns, "FROM broadcasts WHERE status=? AND expires_at_ms>? ORDER BY ride_id;");
  Statement  st(db, sql.c_str());
  BindI32(st.get(), 1, static_cast<int>(domain::BroadcastStatus::kActive));
  BindU64(st.get(), 2, now_ms);

  std::vector<model::BroadcastRecord> out;
  while (st.Step() == SQLITE_ROW)
    out.push_back(ReadBroadcast(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Notifications
// ------------------------------------------------------------------

Result SqliteRepository::UpsertNotification(Transaction& t, const model::NotificationRecord& r) {
  auto* db = TX(t).Handle();

  const std::string sql =
      std::string("INSERT INTO ride_notifications(") + kNotificationColumns +
      ") VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?) ON CONFLICT(driver_id,ride_id) DO UPDATE SET "
      "request_class=excluded.request_class,pickup_lat=excluded.pickup_lat,pickup_lon=excluded.pickup_lon,"
      "dest_lat=excluded.dest_lat,dest_lon=excluded.dest_lon,estimated_fare=excluded.estimated_fare,"
      "distance_to_pickup_km=excluded.distance_to_pickup_km,is_extended_area=excluded.is_extended_area,"
      "broadcast_round=excluded.broadcast_round,notified_at_ms=excluded.notified_at_ms,"
      "expires_at_ms=excluded.expires_at_ms;";
  Statement st(db, sql.c_str());
  auto*     s = st.get();
  BindText(s, 1, r.driver_id);
  BindText(s, 2, r.ride_id);
  BindI32(s, 3, static_cast<int>(r.request_class));
  BindDouble(s, 4, r.pickup.latitude);
  BindDouble(s, 5, r.pickup.longitude);
  BindDouble(s, 6, r.destination.latitude);
  BindDouble(s, 7, r.destination.longitude);
  BindDouble(s, 8, r.estimated_fare);
  BindDouble(s, 9, r.distance_to_pickup_km);
  BindI32(s, 10, r.is_extended_area ? 1 : 0);
  BindI32(s, 11, static_cast<int>(r.broadcast_round));
  BindU64(s, 12, r.notified_at_ms);
  BindU64(s, 13, r.expires_at_ms);

  return Translate(db, sqlite3_step(s));
}

Result SqliteRepository::DeleteNotification(Transaction& t, const std::string& driver_id, const std::string& ride_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM ride_notifications WHERE driver_id=? AND ride_id=?;");
  BindText(st.get(), 1, driver_id);
  BindText(st.get(), 2, ride_id);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DeleteNotificationsForRide(Transaction& t, const std::string& ride_id) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM ride_notifications WHERE ride_id=?;");
  BindText(st.get(), 1, ride_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::NotificationRecord> SqliteRepository::ListNotificationsForDriver(Transaction& t, const std::string& driver_id,
                                                                                    uint64_t now_ms) {
  auto*      db  = TX(t).Handle();
  const auto sql = Select(kNotificationColumns, "FROM ride_notifications WHERE driver_id=? AND expires_at_ms>? ORDER BY ride_id;");
  Statement  st(db, sql.c_str());
  BindText(st.get(), 1, driver_id);
  BindU64(st.get(), 2, now_ms);

  std::vector<model::NotificationRecord> out;
  while (st.Step() == SQLITE_ROW)
    out.push_back(ReadNotification(st.get()));
  return out;
}

// ------------------------------------------------------------------
// Rejections
// ------------------------------------------------------------------

Result SqliteRepository::InsertRejection(Transaction& t, const model::RejectionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO ride_rejections(ride_id,driver_id,rejected_at_ms,expires_at_ms) VALUES(?,?,?,?)"
               " ON CONFLICT(ride_id,driver_id) DO UPDATE SET rejected_at_ms=excluded.rejected_at_ms,"
               "expires_at_ms=excluded.expires_at_ms;");
  BindText(st.get(), 1, r.ride_id);
  BindText(st.get(), 2, r.driver_id);
  BindU64(st.get(), 3, r.rejected_at_ms);
  BindU64(st.get(), 4, r.expires_at_ms);
  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::RejectionRecord> SqliteRepository::ListRejections(Transaction& t, const std::string& ride_id, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT ride_id,driver_id,rejected_at_ms,expires_at_ms FROM ride_rejections"
               " WHERE ride_id=? AND expires_at_ms>? ORDER BY driver_id;");
  BindText(st.get(), 1, ride_id);
  BindU64(st.get(), 2, now_ms);

  std::vector<model::RejectionRecord> out;
  while (st.Step() == SQLITE_ROW) {
    model::RejectionRecord r;
    r.ride_id        = ColText(st.get(), 0);
    r.driver_id      = ColText(st.get(), 1);
    r.rejected_at_ms = ColU64(st.get(), 2);
    r.expires_at_ms  = ColU64(st.get(), 3);
    out.push_back(std::move(r));
  }
  return out;
}

// ------------------------------------------------------------------
// Leases
// ------------------------------------------------------------------

Result SqliteRepository::TryAcquireLease(Transaction& t, const model::LeaseRecord& r, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "INSERT INTO dispatch_leases(lease_key,owner,acquired_at_ms,expires_at_ms) VALUES(?,?,?,?)"
               " ON CONFLICT(lease_key) DO UPDATE SET owner=excluded.owner,acquired_at_ms=excluded.acquired_at_ms,"
               "expires_at_ms=excluded.expires_at_ms WHERE dispatch_leases.expires_at_ms<=?;");
  BindText(st.get(), 1, r.key);
  BindText(st.get(), 2, r.owner);
  BindU64(st.get(), 3, r.acquired_at_ms);
  BindU64(st.get(), 4, r.expires_at_ms);
  BindU64(st.get(), 5, now_ms);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::Conflict, "lease held: " + r.key);
  return Result::Ok();
}

Result SqliteRepository::ReleaseLease(Transaction& t, const std::string& key, const std::string& owner) {
  auto*     db = TX(t).Handle();
  Statement st(db, "DELETE FROM dispatch_leases WHERE lease_key=? AND owner=?;");
  BindText(st.get(), 1, key);
  BindText(st.get(), 2, owner);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, "lease not held: " + key);
  return Result::Ok();
}

std::optional<model::LeaseRecord> SqliteRepository::GetLease(Transaction& t, const std::string& key, uint64_t now_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db,
               "SELECT lease_key,owner,acquired_at_ms,expires_at_ms FROM dispatch_leases"
               " WHERE lease_key=? AND expires_at_ms>?;");
  BindText(st.get(), 1, key);
  BindU64(st.get(), 2, now_ms);

  if (st.Step() != SQLITE_ROW) return std::nullopt;
  model::LeaseRecord r;
  r.key            = ColText(st.get(), 0);
  r.owner          = ColText(st.get(), 1);
  r.acquired_at_ms = ColU64(st.get(), 2);
  r.expires_at_ms  = ColU64(st.get(), 3);
  return r;
}

// ------------------------------------------------------------------
// Maintenance
// ------------------------------------------------------------------

Result SqliteRepository::PurgeExpired(Transaction& t, uint64_t now_ms) {
  auto* db = TX(t).Handle();

  static const char* kTables[] = {"driver_availability", "broadcasts", "ride_notifications", "ride_rejections",
                                  "dispatch_leases"};
  for (const char* table : kTables) {
    const std::string sql = std::string("DELETE FROM ") + table + " WHERE expires_at_ms<=?;";
    Statement         st(db, sql.c_str());
    BindU64(st.get(), 1, now_ms);
    if (auto result = Translate(db, sqlite3_step(st.get())); !result) return result;
  }
  return Result::Ok();
}

} // namespace ridedispatch::db::sqlite
