#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>

#include "notification.hpp"

namespace ridedispatch::notify {

/*
  Thread-safe blocking queue between the engine and the delivery workers.
  Enqueue never waits on delivery.
*/
class NotificationQueue {
 public:
  void Enqueue(OutboundNotification notification);

  // blocking wait; nullopt once shut down and drained
  std::optional<OutboundNotification> Dequeue();

  std::optional<OutboundNotification> TryDequeue();

  size_t Pending() const;

  void Shutdown();

 private:
  mutable std::mutex               mutex_;
  std::condition_variable          cv_;
  std::queue<OutboundNotification> queue_;
  bool                             shutdown_ = false;
};

} // namespace ridedispatch::notify
