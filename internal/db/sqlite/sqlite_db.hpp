#pragma once

#include <sqlite3.h>

#include <string>

namespace photosift::db::sqlite {

enum class OpenMode {
  ReadWrite, // created when missing
  ReadOnly   // must exist; used for hash import sources
};

/*
  Owns one sqlite3 connection.

  The connection is opened in serialized mode so pair scan workers may
  share it, but a single transaction runs at a time (see SqliteTransaction).
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::ReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  bool ReadOnly() const {
    return mode_ == OpenMode::ReadOnly;
  }

  // Runs one or more statements that return no rows. Throws std::runtime_error.
  void Exec(const std::string& sql);

  // PRAGMA user_version; 0 for a database photosift never bootstrapped.
  int SchemaVersion();
  void SetSchemaVersion(int version);

  bool HasTable(const std::string& name);

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
};

} // namespace photosift::db::sqlite
