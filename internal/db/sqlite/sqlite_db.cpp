#include "sqlite_db.hpp"

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace ledger::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StorageFailure(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, uint32_t busy_timeout_ms) : path_(std::move(path)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StorageFailure("open " + path_ + ": " + msg);
  }

  // report constraint kinds (PRIMARYKEY vs UNIQUE) through sqlite3_errcode
  sqlite3_extended_result_codes(db_, 1);

  Configure(busy_timeout_ms);
  LEDGER_LOG_INFO("sqlite database opened", {observability::StringField("path", path_)});
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StorageFailure(msg);
  }
}

void SqliteDB::Migrate() {
  std::lock_guard lock(tx_mutex_);
  sql::RunMigrations(*this, sql::SqliteSchema());
}

void SqliteDB::Configure(uint32_t busy_timeout_ms) {
  // WAL lets readers continue while a writer holds the lock
  Exec("PRAGMA journal_mode=WAL;");

  // appends must survive a crash once Append returns
  Exec("PRAGMA synchronous=FULL;");

  Exec("PRAGMA foreign_keys=ON;");

  // wait for locks instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, static_cast<int>(busy_timeout_ms)), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // ~20MB (negative means KB)
}

} // namespace ledger::db::sqlite
