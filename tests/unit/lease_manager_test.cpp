#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/lease/lease_manager.hpp"
#include "internal/util/time.hpp"

namespace {

using ridedispatch::db::memory::MemoryRepository;
using ridedispatch::lease::LeaseManager;
using ridedispatch::util::ManualClock;

struct Fixture {
  std::shared_ptr<ManualClock>      clock = std::make_shared<ManualClock>(ridedispatch::util::FromUnixMillis(1000000));
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  LeaseManager                      leases{repository, clock, std::chrono::seconds(10)};
};

void TestSecondAcquireIsRejected() {
  Fixture f;

  auto first = f.leases.TryAcquire("ride:1");
  assert(first.has_value());
  assert(f.leases.IsHeld("ride:1"));
  assert(!f.leases.TryAcquire("ride:1").has_value());

  // independent keys do not contend
  assert(f.leases.TryAcquire("ride:2").has_value());
}

void TestReleaseFreesKey() {
  Fixture f;

  auto lease = f.leases.TryAcquire("ride:1");
  f.leases.Release(*lease);
  assert(!f.leases.IsHeld("ride:1"));
  assert(f.leases.TryAcquire("ride:1").has_value());
}

void TestExpiredLeaseCanBeTakenOver() {
  Fixture f;

  auto stale = f.leases.TryAcquire("ride:1");
  f.clock->Advance(std::chrono::seconds(10));
  assert(!f.leases.IsHeld("ride:1"));

  auto successor = f.leases.TryAcquire("ride:1");
  assert(successor.has_value());

  // the stale holder must not drop the successor's lease
  f.leases.Release(*stale);
  assert(f.leases.IsHeld("ride:1"));
}

void TestScopedLeaseReleasesOnScopeExit() {
  Fixture f;
  {
    auto scoped = f.leases.TryAcquireScoped("ride:1");
    assert(scoped);
    assert(!f.leases.TryAcquireScoped("ride:1"));
  }
  assert(!f.leases.IsHeld("ride:1"));
}

void TestScopedLeaseReleasesWhenBodyThrows() {
  Fixture f;
  try {
    auto scoped = f.leases.TryAcquireScoped("ride:1");
    assert(scoped);
    throw std::runtime_error("boom");
  } catch (const std::runtime_error&) {
  }
  assert(!f.leases.IsHeld("ride:1"));
}

void TestMoveTransfersOwnership() {
  Fixture f;

  auto a = f.leases.TryAcquireScoped("ride:1");
  auto b = std::move(a);
  assert(!a);
  assert(b);
  b.Release();
  assert(!f.leases.IsHeld("ride:1"));
}

void TestConcurrentAcquireHasSingleWinner() {
  Fixture f;

  std::atomic<int>         winners{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&] {
      if (f.leases.TryAcquire("ride:hot")) winners.fetch_add(1);
    });
  }
  for (auto& t : threads) t.join();

  assert(winners.load() == 1);
}

} // namespace

int main() {
  TestSecondAcquireIsRejected();
  TestReleaseFreesKey();
  TestExpiredLeaseCanBeTakenOver();
  TestScopedLeaseReleasesOnScopeExit();
  TestScopedLeaseReleasesWhenBodyThrows();
  TestMoveTransfersOwnership();
  TestConcurrentAcquireHasSingleWinner();

  std::cout << "ride_dispatch_unit_lease_manager: pass\n";
  return 0;
}
