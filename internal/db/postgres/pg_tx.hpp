#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace ridedispatch::db::postgres {

/*
  One pqxx::work on a connection borrowed from PgPool for the lifetime of
  the transaction. Serialization failures and deadlocks on commit surface
  as TransactionConflict so RunInTransaction retries them; a lost
  connection is util::Unavailable.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(const std::shared_ptr<PgPool>& pool);
  ~PgTransaction() override;

  pqxx::work& Work() { return *work_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  // declaration order matters: work_ is destroyed before conn_ returns to the pool
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<pqxx::work>       work_;
  bool                              committed_ = false;
  bool                              open_      = true;
};

}
