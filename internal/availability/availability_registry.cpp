#include "availability_registry.hpp"


#include "internal/geo/distance.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ridedispatch::availability {

namespace {

constexpr double kMillisPerHour = 3600.0 * 1000.0;

} // namespace

AvailabilityRegistry::AvailabilityRegistry(std::shared_ptr<db::Repository> repository,
                                           std::shared_ptr<util::Clock> clock, std::chrono::milliseconds ttl)
    : repository_(std::move(repository)), clock_(std::move(clock)), ttl_(ttl) {
}

uint64_t AvailabilityRegistry::NowMs() const {
  return util::ToUnixMillis(clock_->Now());
}

AvailabilityUpdate AvailabilityRegistry::Write(db::Transaction& tx, const std::string& driver_id,
                                               model::DriverStatus status,
                                               const std::optional<model::GeoPoint>& location, uint64_t now_ms) {
  AvailabilityUpdate update;

  auto previous = repository_->GetAvailability(tx, driver_id, now_ms);

  auto& record         = update.record;
  record.driver_id     = driver_id;
  record.status        = status;
  record.location      = location ? location : (previous ? previous->location : std::nullopt);
  record.updated_at_ms = now_ms;
  record.expires_at_ms = now_ms + static_cast<uint64_t>(ttl_.count());
  db::ThrowIfError(repository_->UpsertAvailability(tx, record), "upsert availability " + driver_id);

  auto profile = repository_->GetDriverProfile(tx, driver_id);
  if (!profile) return update;

  if (profile->availability_started_at_ms != 0 && now_ms > profile->availability_started_at_ms) {
    update.hours_accumulated = static_cast<double>(now_ms - profile->availability_started_at_ms) / kMillisPerHour;
    profile->daily_availability_hours += update.hours_accumulated;
  }
  profile->availability_started_at_ms = status == model::DriverStatus::kAvailable ? now_ms : 0;
  profile->status                     = status;
  update.total_daily_hours            = profile->daily_availability_hours;

  db::ThrowIfError(repository_->UpsertDriverProfile(tx, *profile), "upsert driver profile " + driver_id);
  return update;
}

AvailabilityUpdate AvailabilityRegistry::SetAvailable(const std::string& driver_id, const model::GeoPoint& location) {
  if (!geo::IsValidCoordinate(location)) {
    throw util::InvalidArgument("invalid driver location for " + driver_id);
  }

  const auto now_ms = NowMs();
  auto update = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto profile = repository_->GetDriverProfile(tx, driver_id);
    if (!profile) throw util::NotFound("driver not found: " + driver_id);
    if (profile->is_suspended) throw util::Conflict("driver is suspended: " + driver_id);
    return Write(tx, driver_id, model::DriverStatus::kAvailable, location, now_ms);
  });

  RIDEDISPATCH_LOG_DEBUG("driver available", {observability::StringField("driver_id", driver_id)});
  return update;
}

AvailabilityUpdate AvailabilityRegistry::SetUnavailable(const std::string& driver_id) {
  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    if (!repository_->GetDriverProfile(tx, driver_id)) throw util::NotFound("driver not found: " + driver_id);
    return Write(tx, driver_id, model::DriverStatus::kUnavailable, std::nullopt, now_ms);
  });
}

AvailabilityUpdate AvailabilityRegistry::SetBusy(const std::string& driver_id) {
  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return Write(tx, driver_id, model::DriverStatus::kBusy, std::nullopt, now_ms);
  });
}

db::model::DriverAvailabilityRecord AvailabilityRegistry::UpdateLocation(const std::string& driver_id,
                                                                         const model::GeoPoint& location) {
  if (!geo::IsValidCoordinate(location)) {
    throw util::InvalidArgument("invalid driver location for " + driver_id);
  }

  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    auto record = repository_->GetAvailability(tx, driver_id, now_ms);
    if (!record) {
      record.emplace();
      record->driver_id = driver_id;
      record->status    = model::DriverStatus::kUnavailable;
    }
    record->location      = location;
    record->updated_at_ms = now_ms;
    record->expires_at_ms = now_ms + static_cast<uint64_t>(ttl_.count());
    db::ThrowIfError(repository_->UpsertAvailability(tx, *record), "update location " + driver_id);
    return *record;
  });
}

std::optional<db::model::DriverAvailabilityRecord> AvailabilityRegistry::GetStatus(const std::string& driver_id) {
  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_,
                              [&](db::Transaction& tx) { return repository_->GetAvailability(tx, driver_id, now_ms); });
}

bool AvailabilityRegistry::IsAvailable(const std::string& driver_id) {
  const auto now_ms = NowMs();
  return db::RunInTransaction(*repository_,
                              [&](db::Transaction& tx) { return IsAvailableTx(tx, driver_id, now_ms); });
}

AvailabilityUpdate AvailabilityRegistry::SetStatusTx(db::Transaction& tx, const std::string& driver_id,
                                                     model::DriverStatus status, uint64_t now_ms) {
  return Write(tx, driver_id, status, std::nullopt, now_ms);
}

bool AvailabilityRegistry::IsAvailableTx(db::Transaction& tx, const std::string& driver_id, uint64_t now_ms) {
  auto record = repository_->GetAvailability(tx, driver_id, now_ms);
  return record && record->status == model::DriverStatus::kAvailable;
}

} // namespace ridedispatch::availability
