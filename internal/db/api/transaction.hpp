#pragma once

#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <type_traits>

namespace ridedispatch::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed

  SQLite: BEGIN IMMEDIATE, serialized on the connection
  Postgres: pqxx::work on a pooled connection
  Memory: snapshot copy-on-write, serialized writer
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

// Raised when the backend aborts a transaction that can safely be retried.
class TransactionConflict : public std::runtime_error {
public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

inline constexpr int kDefaultTransactionAttempts = 3;

/*
  Begin, run fn(tx), commit. A TransactionConflict from fn or from Commit
  re-runs the whole body on a fresh transaction, up to max_attempts.
  fn must not have side effects outside the transaction.
*/
template <typename Repo, typename Fn>
auto RunInTransaction(Repo& repo, Fn&& fn, int max_attempts = kDefaultTransactionAttempts) {
  using R = std::invoke_result_t<Fn&, decltype(*repo.Begin())>;

  for (int attempt = 1;; ++attempt) {
    try {
      auto tx = repo.Begin();
      if constexpr (std::is_void_v<R>) {
        fn(*tx);
        tx->Commit();
        return;
      } else {
        R result = fn(*tx);
        tx->Commit();
        return result;
      }
    } catch (const TransactionConflict&) {
      if (attempt >= max_attempts) throw;
      std::this_thread::sleep_for(std::chrono::milliseconds(attempt));
    }
  }
}

} // namespace ridedispatch::db
