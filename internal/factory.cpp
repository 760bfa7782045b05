#include "factory.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/core/dispatch_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/migrations.hpp"
#include "internal/maintenance/dispatch_sweeper.hpp"
#include "internal/notify/notification_dispatcher.hpp"
#include "internal/notify/notification_queue.hpp"
#include "internal/notify/subscription_hub.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/driver_service.hpp"
#include "internal/service/ride_service.hpp"
#include "internal/service/service_context.hpp"
#if RIDEDISPATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RIDEDISPATCH_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace ridedispatch::factory {

namespace {

constexpr uint32_t                  kDefaultNotificationWorkers = 2;
constexpr std::chrono::milliseconds kDefaultSweepInterval{5000};

#if RIDEDISPATCH_DB_POSTGRES
// Schema goes in over a plain connection; the pool prepares statements
// against the tables as soon as it connects.
class PgMigrationExecutor final : public db::sql::MigrationExecutor {
 public:
  explicit PgMigrationExecutor(pqxx::work& tx) : tx_(tx) {
  }

  void ExecuteSQL(const std::string& sql) override {
    tx_.exec(sql);
  }

 private:
  pqxx::work& tx_;
};
#endif

std::chrono::milliseconds SweepInterval(const ridedispatch::runtime::config::RuntimeConfig& config) {
  if (!config.maintenance().has_sweep_interval()) return kDefaultSweepInterval;
  const auto& d  = config.maintenance().sweep_interval();
  const auto  ms = std::chrono::milliseconds(d.seconds() * 1000 + d.nanos() / 1000000);
  return ms.count() > 0 ? ms : kDefaultSweepInterval;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const ridedispatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RIDEDISPATCH_DB_SQLITE
    db::sqlite::SqliteOptions options;
    options.wal_mode = database.sqlite().wal_mode();
    if (database.sqlite().busy_timeout_ms() > 0) {
      options.busy_timeout = std::chrono::milliseconds(database.sqlite().busy_timeout_ms());
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    db::sql::RunMigrations(*sqlite_db, db::sql::SchemaStatements());
    RIDEDISPATCH_LOG_INFO("sqlite repository ready", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RIDEDISPATCH_DB_POSTGRES
    {
      pqxx::connection    conn(database.postgres().connection_uri());
      pqxx::work          tx(conn);
      PgMigrationExecutor executor(tx);
      db::sql::RunMigrations(executor, db::sql::SchemaStatements());
      tx.commit();
    }
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                      database.postgres().max_connections());
    RIDEDISPATCH_LOG_INFO("postgres repository ready");
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

RuntimeDependencies BuildRuntime(const ridedispatch::runtime::config::RuntimeConfig& config,
                                 std::shared_ptr<util::Clock> clock, std::shared_ptr<notify::NotificationSink> sink) {
  RuntimeDependencies deps;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  deps.policy     = config::ResolvePolicy(config);
  deps.clock      = clock ? std::move(clock) : std::make_shared<util::SystemClock>();
  deps.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Real-time delivery
  // ------------------------------------------------------------------
  deps.queue         = std::make_shared<notify::NotificationQueue>();
  deps.subscriptions = std::make_shared<notify::SubscriptionHub>();
  if (!sink) sink = deps.subscriptions;
  deps.notifications = std::make_shared<notify::NotificationDispatcher>(deps.queue, std::move(sink));

  deps.engine  = std::make_shared<core::DispatchEngine>(deps.repository, deps.clock, deps.queue, deps.policy);
  deps.sweeper = std::make_shared<maintenance::DispatchSweeper>(deps.engine, SweepInterval(config));

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.engine        = deps.engine;
  ctx.notifications = deps.notifications;
  ctx.subscriptions = deps.subscriptions;

  deps.dispatch_service = std::make_shared<service::DispatchService>(ctx);
  deps.ride_service     = std::make_shared<service::RideService>(ctx);
  deps.driver_service   = std::make_shared<service::DriverService>(ctx);
  deps.admin_service    = std::make_shared<service::AdminService>(ctx);

  return deps;
}

void RuntimeDependencies::Start(const ridedispatch::runtime::config::RuntimeConfig& config) {
  const auto workers = config.notifications().workers() == 0 ? kDefaultNotificationWorkers
                                                              : config.notifications().workers();
  notifications->Start(workers);
  sweeper->Start();

  RIDEDISPATCH_LOG_INFO("dispatch runtime started", {observability::IntField("notification_workers", workers)});
}

void RuntimeDependencies::Stop() {
  if (sweeper) sweeper->Stop();
  if (subscriptions) subscriptions->CloseAll();
  if (notifications) notifications->Stop();
}

} // namespace ridedispatch::factory
