#include "dispatch_sweeper.hpp"

#include "internal/core/dispatch_engine.hpp"
#include "internal/observability/logging.hpp"

namespace ridedispatch::maintenance {

DispatchSweeper::DispatchSweeper(std::shared_ptr<core::DispatchEngine> engine, std::chrono::milliseconds interval)
    : engine_(std::move(engine)), interval_(interval) {
}

DispatchSweeper::~DispatchSweeper() {
  Stop();
}

void DispatchSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&DispatchSweeper::Loop, this);
}

void DispatchSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

SweepReport DispatchSweeper::RunOnce() {
  SweepReport report;
  report.expanded_broadcasts = engine_->ExpandStaleBroadcasts().size();
  report.lifted_suspensions  = engine_->LiftExpiredSuspensions().size();
  engine_->PurgeExpired();
  return report;
}

void DispatchSweeper::Loop() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [&] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      auto report = RunOnce();
      if (report.expanded_broadcasts > 0 || report.lifted_suspensions > 0) {
        RIDEDISPATCH_LOG_INFO("sweep", {observability::IntField("expanded", static_cast<int64_t>(report.expanded_broadcasts)),
                                        observability::IntField("lifted", static_cast<int64_t>(report.lifted_suspensions))});
      }
    } catch (const std::exception& e) {
      RIDEDISPATCH_LOG_ERROR("sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace ridedispatch::maintenance
