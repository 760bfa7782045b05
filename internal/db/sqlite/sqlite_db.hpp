#pragma once

#include <sqlite3.h>

#include <chrono>
#include <mutex>
#include <string>

#include "internal/db/sql/migrations.hpp"

namespace ridedispatch::db::sqlite {

struct SqliteOptions {
  bool                      wal_mode     = true;
  std::chrono::milliseconds busy_timeout = std::chrono::milliseconds(5000);
};

/*
  Owns the single sqlite3 connection behind SqliteRepository.

  Every repository transaction runs BEGIN IMMEDIATE ... COMMIT on this
  connection while holding Lock(), so compare-and-set updates on rides and
  driver availability never interleave inside the process. busy_timeout
  covers writers in other processes.

  Open and pragma failures throw util::Unavailable.
*/
class SqliteDB final : public sql::MigrationExecutor {
 public:
  SqliteDB(std::string path, SqliteOptions options);
  explicit SqliteDB(std::string path) : SqliteDB(std::move(path), SqliteOptions{}) {
  }
  ~SqliteDB() override;

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::unique_lock<std::mutex> Lock() {
    return std::unique_lock<std::mutex>(mutex_);
  }

  void Exec(const std::string& sql);

  void ExecuteSQL(const std::string& sql) override {
    Exec(sql);
  }

 private:
  void ApplyPragmas(const SqliteOptions& options);

  sqlite3*    db_ = nullptr;
  std::string path_;
  std::mutex  mutex_;
};

} // namespace ridedispatch::db::sqlite
