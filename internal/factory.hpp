#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/config/dispatch_policy.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"

namespace ridedispatch::core {
class DispatchEngine;
}
namespace ridedispatch::notify {
class NotificationDispatcher;
class NotificationQueue;
class NotificationSink;
class SubscriptionHub;
} // namespace ridedispatch::notify
namespace ridedispatch::maintenance {
class DispatchSweeper;
}
namespace ridedispatch::service {
class DispatchService;
class RideService;
class DriverService;
class AdminService;
} // namespace ridedispatch::service

namespace ridedispatch::factory {

/*
  RuntimeDependencies

  Owns all long-lived objects used by the server.
  Everything here lives for the lifetime of the process.
*/
struct RuntimeDependencies {
  config::Policy policy;

  std::shared_ptr<util::Clock>    clock;
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<notify::NotificationQueue>      queue;
  std::shared_ptr<notify::SubscriptionHub>        subscriptions;
  std::shared_ptr<notify::NotificationDispatcher> notifications;

  std::shared_ptr<core::DispatchEngine>       engine;
  std::shared_ptr<maintenance::DispatchSweeper> sweeper;

  std::shared_ptr<service::DispatchService> dispatch_service;
  std::shared_ptr<service::RideService>     ride_service;
  std::shared_ptr<service::DriverService>   driver_service;
  std::shared_ptr<service::AdminService>    admin_service;

  // Starts the notification workers and the sweeper.
  void Start(const ridedispatch::runtime::config::RuntimeConfig& config);

  // Stops background work in reverse order. Safe to call twice.
  void Stop();
};

// Opens the configured backend and applies the schema.
std::shared_ptr<db::Repository> BuildRepository(const ridedispatch::runtime::config::RuntimeConfig& config);

/*
  BuildRuntime

  Constructs the whole backend from a normalized runtime config. `clock`
  defaults to the system clock; `sink` defaults to the subscription hub
  feeding the notification streams.

  This is the composition root of the application and the only place that
  knows concrete DB types.
*/
RuntimeDependencies BuildRuntime(const ridedispatch::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<util::Clock>                        clock = nullptr,
                                 std::shared_ptr<notify::NotificationSink>           sink  = nullptr);

} // namespace ridedispatch::factory
