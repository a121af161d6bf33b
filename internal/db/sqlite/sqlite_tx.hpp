#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace photosift::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a stage waits for a
  concurrent writer (busy timeout) instead of failing on its first write.
  Read-only connections begin DEFERRED.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const {
    return db_->Handle();
  }

  void Commit() override;
  void Rollback() override;

 private:
  std::shared_ptr<SqliteDB> db_;
  bool                      open_ = true;
};

} // namespace photosift::db::sqlite
