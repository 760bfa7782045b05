#pragma once

#include <string>
#include <vector>

namespace ridedispatch::db::sql {

/*
  Backend-agnostic schema bootstrap.

  The statements use the type names both SQLite and Postgres accept
  (BIGINT / DOUBLE PRECISION / TEXT / INTEGER); booleans are stored as 0/1 and
  timestamps as unix millis with 0 meaning unset.
*/

class MigrationExecutor {
 public:
  virtual ~MigrationExecutor() = default;

  virtual void ExecuteSQL(const std::string& sql) = 0;
};

inline const std::vector<std::string>& SchemaStatements() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS rides ("
      " ride_id TEXT PRIMARY KEY, rider_id TEXT NOT NULL, driver_id TEXT,"
      " status INTEGER NOT NULL, request_class INTEGER NOT NULL,"
      " pickup_lat DOUBLE PRECISION NOT NULL, pickup_lon DOUBLE PRECISION NOT NULL,"
      " dest_lat DOUBLE PRECISION NOT NULL, dest_lon DOUBLE PRECISION NOT NULL,"
      " estimated_fare DOUBLE PRECISION NOT NULL, final_fare DOUBLE PRECISION,"
      " fare_base DOUBLE PRECISION NOT NULL, fare_per_km DOUBLE PRECISION NOT NULL,"
      " fare_distance_km DOUBLE PRECISION NOT NULL, fare_surge DOUBLE PRECISION NOT NULL,"
      " fare_final_total DOUBLE PRECISION NOT NULL,"
      " requested_at_ms BIGINT NOT NULL, matched_at_ms BIGINT NOT NULL, pickup_time_ms BIGINT NOT NULL,"
      " start_time_ms BIGINT NOT NULL, completed_at_ms BIGINT NOT NULL, cancellation_timestamp_ms BIGINT NOT NULL,"
      " cancelled_by TEXT NOT NULL, cancellation_reason TEXT NOT NULL,"
      " cancellation_fee DOUBLE PRECISION NOT NULL, version BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS rides_status_idx ON rides(status);",

      "CREATE TABLE IF NOT EXISTS driver_profiles ("
      " driver_id TEXT PRIMARY KEY, name TEXT NOT NULL, status INTEGER NOT NULL,"
      " cancellation_count INTEGER NOT NULL, last_reset_at_ms BIGINT NOT NULL,"
      " is_suspended INTEGER NOT NULL, suspended_at_ms BIGINT NOT NULL,"
      " accept_extended_area INTEGER NOT NULL, accept_parcel_delivery INTEGER NOT NULL,"
      " vehicle_registration TEXT NOT NULL, vehicle_make TEXT NOT NULL,"
      " vehicle_model TEXT NOT NULL, vehicle_color TEXT NOT NULL,"
      " rating DOUBLE PRECISION NOT NULL, total_rides INTEGER NOT NULL,"
      " availability_started_at_ms BIGINT NOT NULL, daily_availability_hours DOUBLE PRECISION NOT NULL);",

      "CREATE TABLE IF NOT EXISTS driver_availability ("
      " driver_id TEXT PRIMARY KEY, status INTEGER NOT NULL, has_location INTEGER NOT NULL,"
      " latitude DOUBLE PRECISION NOT NULL, longitude DOUBLE PRECISION NOT NULL,"
      " updated_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);",
      "CREATE INDEX IF NOT EXISTS driver_availability_status_idx ON driver_availability(status, expires_at_ms);",

      "CREATE TABLE IF NOT EXISTS broadcasts ("
      " ride_id TEXT PRIMARY KEY, request_class INTEGER NOT NULL,"
      " pickup_lat DOUBLE PRECISION NOT NULL, pickup_lon DOUBLE PRECISION NOT NULL,"
      " dest_lat DOUBLE PRECISION NOT NULL, dest_lon DOUBLE PRECISION NOT NULL,"
      " estimated_fare DOUBLE PRECISION NOT NULL, radius_km DOUBLE PRECISION NOT NULL,"
      " is_extended_area INTEGER NOT NULL, notified_driver_ids TEXT NOT NULL,"
      " status INTEGER NOT NULL, broadcast_count INTEGER NOT NULL,"
      " created_at_ms BIGINT NOT NULL, last_expansion_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL,"
      " excluded_driver_ids TEXT NOT NULL DEFAULT '');",

      "CREATE TABLE IF NOT EXISTS ride_notifications ("
      " driver_id TEXT NOT NULL, ride_id TEXT NOT NULL, request_class INTEGER NOT NULL,"
      " pickup_lat DOUBLE PRECISION NOT NULL, pickup_lon DOUBLE PRECISION NOT NULL,"
      " dest_lat DOUBLE PRECISION NOT NULL, dest_lon DOUBLE PRECISION NOT NULL,"
      " estimated_fare DOUBLE PRECISION NOT NULL, distance_to_pickup_km DOUBLE PRECISION NOT NULL,"
      " is_extended_area INTEGER NOT NULL, broadcast_round INTEGER NOT NULL,"
      " notified_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY (driver_id, ride_id));",
      "CREATE INDEX IF NOT EXISTS ride_notifications_ride_idx ON ride_notifications(ride_id);",

      "CREATE TABLE IF NOT EXISTS ride_rejections ("
      " ride_id TEXT NOT NULL, driver_id TEXT NOT NULL,"
      " rejected_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL,"
      " PRIMARY KEY (ride_id, driver_id));",

      "CREATE TABLE IF NOT EXISTS dispatch_leases ("
      " lease_key TEXT PRIMARY KEY, owner TEXT NOT NULL,"
      " acquired_at_ms BIGINT NOT NULL, expires_at_ms BIGINT NOT NULL);",
  };
  return kSchema;
}

inline void RunMigrations(MigrationExecutor& executor, const std::vector<std::string>& ordered_sql) {
  for (const auto& sql : ordered_sql) {
    executor.ExecuteSQL(sql);
  }
}

} // namespace ridedispatch::db::sql
