#include "notification_worker.hpp"

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace ridedispatch::notify {

NotificationWorker::NotificationWorker(std::shared_ptr<NotificationQueue> queue,
                                       std::shared_ptr<NotificationSink> sink, std::shared_ptr<DeliveryStats> stats)
    : queue_(std::move(queue)), sink_(std::move(sink)), stats_(std::move(stats)) {
}

NotificationWorker::~NotificationWorker() {
  if (thread_.joinable()) {
    queue_->Shutdown();
    thread_.join();
  }
}

void NotificationWorker::Start() {
  thread_ = std::thread(&NotificationWorker::Run, this);
}

void NotificationWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void NotificationWorker::Deliver(const OutboundNotification& notification) {
  bool delivered = false;
  try {
    delivered = sink_->Push(notification.user_id, notification.payload);
  } catch (const std::exception& e) {
    RIDEDISPATCH_LOG_WARN("notification push threw",
                          {observability::StringField("user_id", notification.user_id),
                           observability::StringField("ride_id", notification.payload.ride_id()),
                           observability::StringField("error", e.what())});
  }

  if (delivered) {
    stats_->delivered.fetch_add(1, std::memory_order_relaxed);
  } else {
    stats_->failed.fetch_add(1, std::memory_order_relaxed);
    RIDEDISPATCH_LOG_DEBUG("notification not delivered",
                           {observability::StringField("user_id", notification.user_id),
                            observability::StringField("type", notification.payload.type())});
  }
  observability::Metrics::Instance().RecordNotification(delivered);
}

void NotificationWorker::Run() {
  while (auto next = queue_->Dequeue()) {
    Deliver(*next);
  }
}

} // namespace ridedispatch::notify
