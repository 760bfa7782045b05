#include "pg_pool.hpp"

namespace ridedispatch::db::postgres {

namespace {

constexpr const char* kRideColumns =
    "ride_id,rider_id,driver_id,status,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,"
    "estimated_fare,final_fare,fare_base,fare_per_km,fare_distance_km,fare_surge,fare_final_total,"
    "requested_at_ms,matched_at_ms,pickup_time_ms,start_time_ms,completed_at_ms,cancellation_timestamp_ms,"
    "cancelled_by,cancellation_reason,cancellation_fee,version";

// $1 = ride_id, $2..$25 = body (kRideColumns order), then extra params
constexpr const char* kRideUpdateSet =
    "rider_id=$2,driver_id=$3,status=$4,request_class=$5,pickup_lat=$6,pickup_lon=$7,dest_lat=$8,dest_lon=$9,"
    "estimated_fare=$10,final_fare=$11,fare_base=$12,fare_per_km=$13,fare_distance_km=$14,fare_surge=$15,"
    "fare_final_total=$16,requested_at_ms=$17,matched_at_ms=$18,pickup_time_ms=$19,start_time_ms=$20,"
    "completed_at_ms=$21,cancellation_timestamp_ms=$22,cancelled_by=$23,cancellation_reason=$24,"
    "cancellation_fee=$25,version=rides.version+1";

constexpr const char* kProfileColumns =
    "driver_id,name,status,cancellation_count,last_reset_at_ms,is_suspended,suspended_at_ms,"
    "accept_extended_area,accept_parcel_delivery,vehicle_registration,vehicle_make,vehicle_model,vehicle_color,"
    "rating,total_rides,availability_started_at_ms,daily_availability_hours";

constexpr const char* kAvailabilityColumns = "driver_id,status,has_location,latitude,longitude,updated_at_ms,expires_at_ms";

constexpr const char* kBroadcastColumns =
    "ride_id,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,estimated_fare,radius_km,is_extended_area,"
    "notified_driver_ids,status,broadcast_count,created_at_ms,last_expansion_at_ms,expires_at_ms,excluded_driver_ids";

constexpr const char* kNotificationColumns =
    "driver_id,ride_id,request_class,pickup_lat,pickup_lon,dest_lat,dest_lon,estimated_fare,"
    "distance_to_pickup_km,is_extended_area,broadcast_round,notified_at_ms,expires_at_ms";

std::string Placeholders(int n) {
  std::string out;
  for (int i = 1; i <= n; ++i) {
    if (i > 1) out += ',';
    out += '$' + std::to_string(i);
  }
  return out;
}

std::string Select(const char* columns, const std::string& rest) {
  return std::string("SELECT ") + columns + " " + rest;
}

} // namespace

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)), max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  available_.wait(lock, [this] { return !idle_.empty() || live_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Lend(std::move(conn));
  }

  // reserve the slot, then connect without holding the lock
  ++live_;
  lock.unlock();
  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    PrepareStatements(*conn);
    return Lend(std::move(conn));
  } catch (...) {
    lock.lock();
    --live_;
    lock.unlock();
    available_.notify_one();
    throw;
  }
}

std::size_t PgPool::LiveConnections() const {
  std::lock_guard lock(mutex_);
  return live_;
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  // rides
  conn.prepare("insert_ride", std::string("INSERT INTO rides(") + kRideColumns + ") VALUES(" + Placeholders(26) + ")");
  conn.prepare("get_ride", Select(kRideColumns, "FROM rides WHERE ride_id=$1"));
  conn.prepare("update_ride", std::string("UPDATE rides SET ") + kRideUpdateSet + " WHERE ride_id=$1");
  conn.prepare("update_ride_if_status", std::string("UPDATE rides SET ") + kRideUpdateSet + " WHERE ride_id=$1 AND status=$26");
  conn.prepare("list_rides_by_status", Select(kRideColumns, "FROM rides WHERE status=$1 ORDER BY ride_id"));

  // profiles
  conn.prepare("upsert_profile",
               std::string("INSERT INTO driver_profiles(") + kProfileColumns + ") VALUES(" + Placeholders(17) +
                   ") ON CONFLICT(driver_id) DO UPDATE SET name=excluded.name,status=excluded.status,"
                   "cancellation_count=excluded.cancellation_count,last_reset_at_ms=excluded.last_reset_at_ms,"
                   "is_suspended=excluded.is_suspended,suspended_at_ms=excluded.suspended_at_ms,"
                   "accept_extended_area=excluded.accept_extended_area,"
                   "accept_parcel_delivery=excluded.accept_parcel_delivery,"
                   "vehicle_registration=excluded.vehicle_registration,vehicle_make=excluded.vehicle_make,"
                   "vehicle_model=excluded.vehicle_model,vehicle_color=excluded.vehicle_color,rating=excluded.rating,"
                   "total_rides=excluded.total_rides,availability_started_at_ms=excluded.availability_started_at_ms,"
                   "daily_availability_hours=excluded.daily_availability_hours");
  conn.prepare("get_profile", Select(kProfileColumns, "FROM driver_profiles WHERE driver_id=$1"));
  conn.prepare("list_suspended", Select(kProfileColumns, "FROM driver_profiles WHERE is_suspended=1 ORDER BY driver_id"));

  // availability
  conn.prepare("upsert_availability",
               std::string("INSERT INTO driver_availability(") + kAvailabilityColumns + ") VALUES(" + Placeholders(7) +
                   ") ON CONFLICT(driver_id) DO UPDATE SET status=excluded.status,has_location=excluded.has_location,"
                   "latitude=excluded.latitude,longitude=excluded.longitude,updated_at_ms=excluded.updated_at_ms,"
                   "expires_at_ms=excluded.expires_at_ms");
  conn.prepare("get_availability", Select(kAvailabilityColumns, "FROM driver_availability WHERE driver_id=$1 AND expires_at_ms>$2"));
  conn.prepare("list_available",
               Select(kAvailabilityColumns,
                      "FROM driver_availability WHERE status=$1 AND has_location=1 AND expires_at_ms>$2 ORDER BY driver_id"));

  // broadcasts
  conn.prepare("upsert_broadcast",
               std::string("INSERT INTO broadcasts(") + kBroadcastColumns + ") VALUES(" + Placeholders(16) +
                   ") ON CONFLICT(ride_id) DO UPDATE SET request_class=excluded.request_class,"
                   "pickup_lat=excluded.pickup_lat,pickup_lon=excluded.pickup_lon,dest_lat=excluded.dest_lat,"
                   "dest_lon=excluded.dest_lon,estimated_fare=excluded.estimated_fare,radius_km=excluded.radius_km,"
                   "is_extended_area=excluded.is_extended_area,notified_driver_ids=excluded.notified_driver_ids,"
                   "status=excluded.status,broadcast_count=excluded.broadcast_count,created_at_ms=excluded.created_at_ms,"
                   "last_expansion_at_ms=excluded.last_expansion_at_ms,expires_at_ms=excluded.expires_at_ms,"
                   "excluded_driver_ids=excluded.excluded_driver_ids");
  conn.prepare("get_broadcast", Select(kBroadcastColumns, "FROM broadcasts WHERE ride_id=$1 AND expires_at_ms>$2"));
  conn.prepare("list_active_broadcasts",
               Select(kBroadcastColumns, "FROM broadcasts WHERE status=$1 AND expires_at_ms>$2 ORDER BY ride_id"));

  // notifications
  conn.prepare("upsert_notification",
               std::string("INSERT INTO ride_notifications(") + kNotificationColumns + ") VALUES(" + Placeholders(13) +
                   ") ON CONFLICT(driver_id,ride_id) DO UPDATE SET request_class=excluded.request_class,"
                   "pickup_lat=excluded.pickup_lat,pickup_lon=excluded.pickup_lon,dest_lat=excluded.dest_lat,"
                   "dest_lon=excluded.dest_lon,estimated_fare=excluded.estimated_fare,"
                   "distance_to_pickup_km=excluded.distance_to_pickup_km,is_extended_area=excluded.is_extended_area,"
                   "broadcast_round=excluded.broadcast_round,notified_at_ms=excluded.notified_at_ms,"
                   "expires_at_ms=excluded.expires_at_ms");
  conn.prepare("delete_notification", "DELETE FROM ride_notifications WHERE driver_id=$1 AND ride_id=$2");
  conn.prepare("delete_ride_notifications", "DELETE FROM ride_notifications WHERE ride_id=$1");
  conn.prepare("list_driver_notifications",
               Select(kNotificationColumns, "FROM ride_notifications WHERE driver_id=$1 AND expires_at_ms>$2 ORDER BY ride_id"));

  // rejections
  conn.prepare("insert_rejection",
               "INSERT INTO ride_rejections(ride_id,driver_id,rejected_at_ms,expires_at_ms) VALUES($1,$2,$3,$4)"
               " ON CONFLICT(ride_id,driver_id) DO UPDATE SET rejected_at_ms=excluded.rejected_at_ms,"
               "expires_at_ms=excluded.expires_at_ms");
  conn.prepare("list_rejections",
               "SELECT ride_id,driver_id,rejected_at_ms,expires_at_ms FROM ride_rejections"
               " WHERE ride_id=$1 AND expires_at_ms>$2 ORDER BY driver_id");

  // leases
  conn.prepare("acquire_lease",
               "INSERT INTO dispatch_leases(lease_key,owner,acquired_at_ms,expires_at_ms) VALUES($1,$2,$3,$4)"
               " ON CONFLICT(lease_key) DO UPDATE SET owner=excluded.owner,acquired_at_ms=excluded.acquired_at_ms,"
               "expires_at_ms=excluded.expires_at_ms WHERE dispatch_leases.expires_at_ms<=$5");
  conn.prepare("release_lease", "DELETE FROM dispatch_leases WHERE lease_key=$1 AND owner=$2");
  conn.prepare("get_lease",
               "SELECT lease_key,owner,acquired_at_ms,expires_at_ms FROM dispatch_leases WHERE lease_key=$1 AND expires_at_ms>$2");
}

std::shared_ptr<pqxx::connection> PgPool::Lend(std::unique_ptr<pqxx::connection> conn) {
  std::weak_ptr<PgPool> pool = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn.release(), [pool](pqxx::connection* lent) {
    std::unique_ptr<pqxx::connection> owned(lent);
    if (auto self = pool.lock()) self->Return(std::move(owned));
  });
}

void PgPool::Return(std::unique_ptr<pqxx::connection> conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.push_back(std::move(conn));
    } else {
      --live_;
    }
  }
  available_.notify_one();
}

} // namespace ridedispatch::db::postgres
