#pragma once

#include <cstdint>
#include <memory>
#include <vector>

#include "notification_queue.hpp"
#include "notification_worker.hpp"

namespace ridedispatch::notify {

/*
  Owns the delivery workers for one queue/sink pair.
*/
class NotificationDispatcher {
 public:
  NotificationDispatcher(std::shared_ptr<NotificationQueue> queue, std::shared_ptr<NotificationSink> sink);
  ~NotificationDispatcher();

  void Start(uint32_t workers);

  // Stops accepting work, drains what is queued, joins the workers.
  void Stop();

  const std::shared_ptr<NotificationQueue>& Queue() const {
    return queue_;
  }

  uint64_t Delivered() const {
    return stats_->delivered.load();
  }

  uint64_t Failed() const {
    return stats_->failed.load();
  }

 private:
  std::shared_ptr<NotificationQueue> queue_;
  std::shared_ptr<NotificationSink>  sink_;
  std::shared_ptr<DeliveryStats>     stats_;

  std::vector<std::unique_ptr<NotificationWorker>> workers_;
};

} // namespace ridedispatch::notify
