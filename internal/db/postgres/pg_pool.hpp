#pragma once

#include <condition_variable>
#include <cstddef>
#include <memory>
#include <mutex>
#include <pqxx/pqxx>
#include <string>
#include <vector>

namespace ridedispatch::db::postgres {

/*
  Bounded pqxx connection pool behind PgRepository.

  Acquire() hands out a shared_ptr whose deleter returns the connection to
  the pool, or drops it if the pool is gone or the connection is closed.
  It blocks while max_connections are checked out. Every new connection gets
  the ride, driver, broadcast, notification, rejection and lease statements
  prepared before first use.

  A pqxx::connection is never shared between two transactions.
*/
class PgPool : public std::enable_shared_from_this<PgPool> {
 public:
  explicit PgPool(std::string conninfo, std::size_t max_connections = 16);

  std::shared_ptr<pqxx::connection> Acquire();

  std::size_t LiveConnections() const;

 private:
  static void                       PrepareStatements(pqxx::connection& conn);
  std::shared_ptr<pqxx::connection> Lend(std::unique_ptr<pqxx::connection> conn);
  void                              Return(std::unique_ptr<pqxx::connection> conn);

  const std::string conninfo_;
  const std::size_t max_connections_;

  mutable std::mutex                             mutex_;
  std::condition_variable                        available_;
  std::vector<std::unique_ptr<pqxx::connection>> idle_;
  std::size_t                                    live_ = 0;
};

} // namespace ridedispatch::db::postgres
