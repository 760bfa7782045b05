#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <thread>

#include "notification_queue.hpp"
#include "notification_sink.hpp"

namespace ridedispatch::notify {

// Shared by all workers of one dispatcher.
struct DeliveryStats {
  std::atomic<uint64_t> delivered{0};
  std::atomic<uint64_t> failed{0};
};

/*
  Background worker that drains the queue into the sink.

  A false return or an exception from the sink is counted as a failure and
  the notification is dropped; pending offers stay readable from the store.
*/
class NotificationWorker {
 public:
  NotificationWorker(std::shared_ptr<NotificationQueue> queue, std::shared_ptr<NotificationSink> sink,
                     std::shared_ptr<DeliveryStats> stats);
  ~NotificationWorker();

  void Start();

  // Waits for the thread; the queue must be shut down first or this blocks.
  void Join();

  // Delivers one notification on the calling thread.
  void Deliver(const OutboundNotification& notification);

 private:
  void Run();

  std::shared_ptr<NotificationQueue> queue_;
  std::shared_ptr<NotificationSink>  sink_;
  std::shared_ptr<DeliveryStats>     stats_;

  std::thread thread_;
};

} // namespace ridedispatch::notify
