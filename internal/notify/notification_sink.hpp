#pragma once

#include <string>

#include "notification.hpp"

namespace ridedispatch::notify {

/*
  Opaque real-time channel to a rider or driver device.

  Push returns false when the message could not be handed over. It may throw;
  the worker counts a throw as a failed delivery.
*/
class NotificationSink {
 public:
  virtual ~NotificationSink() = default;

  virtual bool Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) = 0;
};

// Writes every push to the log. Used when no device channel is configured.
class LoggingSink final : public NotificationSink {
 public:
  bool Push(const std::string& user_id, const ridedispatch::v1::DispatchNotification& payload) override;
};

} // namespace ridedispatch::notify
