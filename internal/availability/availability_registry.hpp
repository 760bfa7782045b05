#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/location.hpp"
#include "internal/util/time.hpp"

namespace ridedispatch::availability {

struct AvailabilityUpdate {
  db::model::DriverAvailabilityRecord record;

  // hours credited by this write (leaving `available`), and the running total
  double hours_accumulated = 0.0;
  double total_daily_hours = 0.0;
};

/*
  Driver availability registry.

  Every write refreshes the record expiry (24h by default) and mirrors the
  status onto the driver profile in the same transaction. An expired record
  reads as absent, which callers treat as offline.

  The *Tx variants run inside a caller's transaction so arbitration and the
  lifecycle can flip driver status atomically with the ride.
*/
class AvailabilityRegistry {
 public:
  AvailabilityRegistry(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                       std::chrono::milliseconds ttl);

  // NotFound for an unknown driver, Conflict for a suspended one,
  // InvalidArgument for a malformed location.
  AvailabilityUpdate SetAvailable(const std::string& driver_id, const model::GeoPoint& location);

  // NotFound for an unknown driver.
  AvailabilityUpdate SetUnavailable(const std::string& driver_id);

  AvailabilityUpdate SetBusy(const std::string& driver_id);

  // Location only; status is preserved (unavailable if there is no record).
  db::model::DriverAvailabilityRecord UpdateLocation(const std::string& driver_id, const model::GeoPoint& location);

  std::optional<db::model::DriverAvailabilityRecord> GetStatus(const std::string& driver_id);

  bool IsAvailable(const std::string& driver_id);

  AvailabilityUpdate SetStatusTx(db::Transaction& tx, const std::string& driver_id, model::DriverStatus status,
                                 uint64_t now_ms);

  bool IsAvailableTx(db::Transaction& tx, const std::string& driver_id, uint64_t now_ms);

 private:
  uint64_t NowMs() const;

  AvailabilityUpdate Write(db::Transaction& tx, const std::string& driver_id, model::DriverStatus status,
                           const std::optional<model::GeoPoint>& location, uint64_t now_ms);

  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::chrono::milliseconds       ttl_;
};

} // namespace ridedispatch::availability
