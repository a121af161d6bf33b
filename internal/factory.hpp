#pragma once

#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

#if PHOTOSIFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#endif

namespace photosift::factory {

/*
  BuildRepository

  Composition root for persistence. It is the ONLY place allowed to know
  concrete DB types: database.sqlite selects SQLite, anything else falls
  back to the in-memory backend.
*/
std::shared_ptr<db::Repository> BuildRepository(const photosift::runtime::config::RuntimeConfig& config);

#if PHOTOSIFT_DB_SQLITE
// Layout version stamped into PRAGMA user_version.
inline constexpr int kSqliteSchemaVersion = 1;

// Creates every table the repository reads or writes. Safe to re-run.
// Refuses a database stamped by a newer layout.
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db);

// Opens another photosift database read-only as a hash import source.
// Nothing is created; the file must carry a photos table of a known layout.
std::shared_ptr<db::Repository> OpenSqliteSource(const std::string& path);
#endif

} // namespace photosift::factory
