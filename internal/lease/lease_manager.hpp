#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "lease.hpp"

namespace ridedispatch::lease {

class LeaseManager;

/*
  RAII holder for an arbitration lease. Releases on destruction whether the
  guarded section returned normally or threw. An empty ScopedLease means the
  key was held by someone else.
*/
class ScopedLease {
public:
  ScopedLease() = default;
  ScopedLease(LeaseManager* manager, Lease lease);
  ~ScopedLease();

  ScopedLease(const ScopedLease&)            = delete;
  ScopedLease& operator=(const ScopedLease&) = delete;

  ScopedLease(ScopedLease&& other) noexcept;
  ScopedLease& operator=(ScopedLease&& other) noexcept;

  explicit operator bool() const {
    return lease_.has_value();
  }

  const Lease& Get() const {
    return *lease_;
  }

  void Release();

private:
  LeaseManager*        manager_ = nullptr;
  std::optional<Lease> lease_;
};

/*
  Short-TTL mutual exclusion backed by the shared repository, so every engine
  instance pointing at the same store observes the same lock. The TTL bounds
  how long a crashed holder can block a key.
*/
class LeaseManager {
public:
  LeaseManager(std::shared_ptr<db::Repository> repository, std::shared_ptr<util::Clock> clock,
               std::chrono::milliseconds ttl);

  std::optional<Lease> TryAcquire(const std::string& key);
  ScopedLease          TryAcquireScoped(const std::string& key);

  void Release(const Lease& lease);

  bool IsHeld(const std::string& key);

  std::chrono::milliseconds Ttl() const {
    return ttl_;
  }

private:
  std::shared_ptr<db::Repository> repository_;
  std::shared_ptr<util::Clock>    clock_;
  std::chrono::milliseconds       ttl_;
};

} // namespace ridedispatch::lease
