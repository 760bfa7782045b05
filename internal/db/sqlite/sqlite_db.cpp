#include "sqlite_db.hpp"

#include <filesystem>
#include <system_error>

#include "internal/util/errors.hpp"

namespace ridedispatch::db::sqlite {
namespace {

// ":memory:" and "file:" URIs have no directory to create
bool IsPlainFile(const std::string& path) {
  return path != ":memory:" && path.rfind("file:", 0) != 0;
}

void EnsureParentDirectory(const std::string& path) {
  if (!IsPlainFile(path)) return;

  const auto parent = std::filesystem::path(path).parent_path();
  if (parent.empty()) return;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    throw util::Unavailable("sqlite: cannot create " + parent.string() + ": " + ec.message());
  }
}

} // namespace

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)) {
  EnsureParentDirectory(path_);

  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_URI;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ != nullptr ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw util::Unavailable("sqlite: cannot open " + path_ + ": " + reason);
  }

  try {
    ApplyPragmas(options);
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_ != nullptr) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) == SQLITE_OK) return;

  const std::string reason = err != nullptr ? err : sqlite3_errmsg(db_);
  sqlite3_free(err);
  throw util::Unavailable("sqlite: " + reason);
}

void SqliteDB::ApplyPragmas(const SqliteOptions& options) {
  if (sqlite3_busy_timeout(db_, static_cast<int>(options.busy_timeout.count())) != SQLITE_OK) {
    throw util::Unavailable(std::string("sqlite: busy_timeout: ") + sqlite3_errmsg(db_));
  }

  if (options.wal_mode) Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace ridedispatch::db::sqlite
