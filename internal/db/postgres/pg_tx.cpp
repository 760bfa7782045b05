#include "pg_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ridedispatch::db::postgres {

PgTransaction::PgTransaction(const std::shared_ptr<PgPool>& pool) : conn_(pool->Acquire()) {
  work_ = std::make_unique<pqxx::work>(*conn_);
}

PgTransaction::~PgTransaction() {
  if (!open_) return;
  try {
    work_->abort();
  } catch (const std::exception& e) {
    RIDEDISPATCH_LOG_WARN("postgres rollback failed", {observability::StringField("error", e.what())});
  }
}

void PgTransaction::Commit() {
  open_ = false;
  try {
    work_->commit();
  } catch (const pqxx::serialization_failure& e) {
    throw TransactionConflict(e.what());
  } catch (const pqxx::deadlock_detected& e) {
    throw TransactionConflict(e.what());
  } catch (const pqxx::broken_connection& e) {
    throw util::Unavailable(std::string("postgres: ") + e.what());
  }
  committed_ = true;
}

void PgTransaction::Rollback() {
  if (!open_) return;
  open_ = false;
  work_->abort();
}

}
