#include "notification_dispatcher.hpp"

#include "internal/observability/logging.hpp"

namespace ridedispatch::notify {

NotificationDispatcher::NotificationDispatcher(std::shared_ptr<NotificationQueue> queue,
                                               std::shared_ptr<NotificationSink> sink)
    : queue_(std::move(queue)), sink_(std::move(sink)), stats_(std::make_shared<DeliveryStats>()) {
}

NotificationDispatcher::~NotificationDispatcher() {
  Stop();
}

void NotificationDispatcher::Start(uint32_t workers) {
  if (workers == 0) workers = 1;
  for (uint32_t i = 0; i < workers; ++i) {
    auto worker = std::make_unique<NotificationWorker>(queue_, sink_, stats_);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  RIDEDISPATCH_LOG_INFO("notification workers started", {observability::IntField("workers", workers)});
}

void NotificationDispatcher::Stop() {
  if (workers_.empty()) return;

  queue_->Shutdown();
  for (auto& worker : workers_) worker->Join();
  workers_.clear();

  RIDEDISPATCH_LOG_INFO("notification workers stopped",
                        {observability::IntField("delivered", static_cast<int64_t>(Delivered())),
                         observability::IntField("failed", static_cast<int64_t>(Failed()))});
}

} // namespace ridedispatch::notify
