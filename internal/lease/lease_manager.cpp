#include "lease_manager.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/uuid.hpp"

namespace ridedispatch::lease {

// ------------------------------------------------------------
// ScopedLease
// ------------------------------------------------------------

ScopedLease::ScopedLease(LeaseManager* manager, Lease lease) : manager_(manager), lease_(std::move(lease)) {
}

ScopedLease::~ScopedLease() {
  try {
    Release();
  } catch (const std::exception& e) {
    // the row expires on its own after the TTL
    RIDEDISPATCH_LOG_WARN("lease release failed", {observability::StringField("error", e.what())});
  }
}

ScopedLease::ScopedLease(ScopedLease&& other) noexcept : manager_(other.manager_), lease_(std::move(other.lease_)) {
  other.lease_.reset();
}

ScopedLease& ScopedLease::operator=(ScopedLease&& other) noexcept {
  if (this != &other) {
    try {
      Release();
    } catch (const std::exception& e) {
      RIDEDISPATCH_LOG_WARN("lease release failed", {observability::StringField("error", e.what())});
    }
    manager_ = other.manager_;
    lease_   = std::move(other.lease_);
    other.lease_.reset();
  }
  return *this;
}

void ScopedLease::Release() {
  if (!lease_) return;
  auto lease = std::move(*lease_);
  lease_.reset();
  manager_->Release(lease);
}

// ------------------------------------------------------------
// LeaseManager
// ------------------------------------------------------------

LeaseManager::LeaseManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
                           std::chrono::milliseconds ttl)
    : repository_(std::move(repository)), clock_(std::move(clock)), ttl_(ttl) {
}

std::optional<Lease> LeaseManager::TryAcquire(const std::string& key) {
  const auto now = clock_->Now();

  Lease lease;
  lease.key        = key;
  lease.owner      = util::NewId();
  lease.expires_at = now + ttl_;

  db::model::LeaseRecord record;
  record.key            = lease.key;
  record.owner          = lease.owner;
  record.acquired_at_ms = util::ToUnixMillis(now);
  record.expires_at_ms  = util::ToUnixMillis(lease.expires_at);

  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->TryAcquireLease(tx, record, record.acquired_at_ms);
  });

  if (result) return lease;
  if (result.code == db::ErrorCode::Conflict) return std::nullopt;
  throw std::runtime_error("lease acquire failed for " + key + ": " + result.message);
}

ScopedLease LeaseManager::TryAcquireScoped(const std::string& key) {
  auto lease = TryAcquire(key);
  if (!lease) return {};
  return ScopedLease(this, std::move(*lease));
}

void LeaseManager::Release(const Lease& lease) {
  auto result = db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->ReleaseLease(tx, lease.key, lease.owner);
  });

  // NotFound: expired and purged or taken over; nothing left to release
  if (!result && result.code != db::ErrorCode::NotFound) {
    throw std::runtime_error("lease release failed for " + lease.key + ": " + result.message);
  }
}

bool LeaseManager::IsHeld(const std::string& key) {
  const auto now_ms = util::ToUnixMillis(clock_->Now());
  return db::RunInTransaction(*repository_, [&](db::Transaction& tx) {
    return repository_->GetLease(tx, key, now_ms).has_value();
  });
}

} // namespace ridedispatch::lease
