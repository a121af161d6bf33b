#include "sqlite_db.hpp"

#include <stdexcept>

namespace photosift::db::sqlite {
namespace {

constexpr int kBusyTimeoutMs = 5000;

[[noreturn]] void Fail(sqlite3* db, const std::string& what) {
  throw std::runtime_error(what + ": " + (db ? sqlite3_errmsg(db) : "out of memory"));
}

// Runs a statement that yields a single integer column in its first row.
int QueryInt(sqlite3* db, const std::string& sql, int if_empty) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    Fail(db, "prepare '" + sql + "'");
  }
  int       value = if_empty;
  const int rc    = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    value = sqlite3_column_int(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    Fail(db, "step '" + sql + "'");
  }
  return value;
}

} // namespace

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  const int flags = SQLITE_OPEN_FULLMUTEX | (mode_ == OpenMode::ReadOnly ? SQLITE_OPEN_READONLY : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);

  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    const std::string reason = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("cannot open " + path_ + ": " + reason);
  }

  // constraint failures report which constraint (primary key, foreign key)
  sqlite3_extended_result_codes(db_, 1);

  Configure();
}

SqliteDB::~SqliteDB() {
  sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    const std::string reason = err ? err : sqlite3_errmsg(db_);
    sqlite3_free(err);
    throw std::runtime_error(path_ + ": " + reason);
  }
}

int SqliteDB::SchemaVersion() {
  return QueryInt(db_, "PRAGMA user_version;", 0);
}

void SqliteDB::SetSchemaVersion(int version) {
  Exec("PRAGMA user_version=" + std::to_string(version) + ";");
}

bool SqliteDB::HasTable(const std::string& name) {
  sqlite3_stmt* stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT 1 FROM sqlite_master WHERE type='table' AND name=?;", -1, &stmt, nullptr) != SQLITE_OK) {
    Fail(db_, "prepare table lookup");
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    Fail(db_, "table lookup");
  }
  return rc == SQLITE_ROW;
}

void SqliteDB::Configure() {
  if (sqlite3_busy_timeout(db_, kBusyTimeoutMs) != SQLITE_OK) {
    Fail(db_, "busy_timeout");
  }
  Exec("PRAGMA foreign_keys=ON;");

  if (mode_ == OpenMode::ReadOnly) {
    Exec("PRAGMA query_only=ON;");
    return;
  }

  // WAL lets status queries read while a stage writes
  Exec("PRAGMA journal_mode=WAL;");
  Exec("PRAGMA synchronous=NORMAL;");
  Exec("PRAGMA temp_store=MEMORY;");
  Exec("PRAGMA cache_size=-20000;"); // KiB
}

} // namespace photosift::db::sqlite
