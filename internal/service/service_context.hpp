#pragma once

#include <memory>

namespace ridedispatch::core {
class DispatchEngine;
}
namespace ridedispatch::notify {
class NotificationDispatcher;
class SubscriptionHub;
} // namespace ridedispatch::notify

namespace ridedispatch::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<ridedispatch::core::DispatchEngine>           engine;
  std::shared_ptr<ridedispatch::notify::NotificationDispatcher> notifications;
  std::shared_ptr<ridedispatch::notify::SubscriptionHub>        subscriptions;
};

} // namespace ridedispatch::service
