#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace photosift::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec(db_->ReadOnly() ? "BEGIN DEFERRED;" : "BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!open_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    // destructor: report and carry on, sqlite rolls back on close anyway
    PHOTOSIFT_LOG_ERROR("Rollback failed", {observability::StringField("db", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (!open_) {
    throw util::InvalidState("sqlite transaction already finished");
  }
  db_->Exec("COMMIT;");
  open_ = false;
}

void SqliteTransaction::Rollback() {
  if (!open_) {
    return;
  }
  open_ = false;
  db_->Exec("ROLLBACK;");
}

} // namespace photosift::db::sqlite
