#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "notification_sink.hpp"

namespace ridedispatch::notify {

// Per-stream mailbox. Closed by the hub on shutdown or by the stream owner.
class Subscription {
 public:
  // nullopt on timeout or once closed and drained
  std::optional<ridedispatch::v1::DispatchNotification> Next(std::chrono::milliseconds timeout);

  void Close();
  bool Closed() const;

 private:
  friend class SubscriptionHub;

  bool Offer(const ridedispatch::v1::DispatchNotification& payload);

  mutable std::mutex                                 mutex_;
  std::condition_variable                            cv_;
  std::deque<ridedispatch::v1::DispatchNotification> pending_;
  bool                                               closed_ = false;
};

/*
  Sink feeding gRPC server streams. A user may hold several streams; a push
  reaches all of them and fails when the user has none open.
*/
class SubscriptionHub final : public NotificationSink {
 public:
  std::shared_ptr<Subscription> Subscribe(const std::string& user_id);
  void                          Unsubscribe(const std::string& user_id, const std::shared_ptr<Subscription>& subscription);

  bool Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) override;

  size_t Subscribers(const std::string& user_id) const;

  void CloseAll();

 private:
  mutable std::mutex                                                          mutex_;
  std::unordered_map<std::string, std::vector<std::shared_ptr<Subscription>>> subscriptions_;
};

} // namespace ridedispatch::notify
