#include "notification_queue.hpp"

namespace ridedispatch::notify {

void NotificationQueue::Enqueue(OutboundNotification notification) {
  {
    std::lock_guard lock(mutex_);
    queue_.push(std::move(notification));
  }
  cv_.notify_one();
}

std::optional<OutboundNotification> NotificationQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  OutboundNotification next = std::move(queue_.front());
  queue_.pop();
  return next;
}

std::optional<OutboundNotification> NotificationQueue::TryDequeue() {
  std::lock_guard lock(mutex_);
  if (queue_.empty()) return std::nullopt;

  OutboundNotification next = std::move(queue_.front());
  queue_.pop();
  return next;
}

size_t NotificationQueue::Pending() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

void NotificationQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace ridedispatch::notify
