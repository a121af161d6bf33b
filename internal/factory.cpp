#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#if PHOTOSIFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace photosift::factory {

#if PHOTOSIFT_DB_SQLITE
namespace {

void CheckSchemaVersion(db::sqlite::SqliteDB& sqlite_db) {
  const int version = sqlite_db.SchemaVersion();
  if (version > kSqliteSchemaVersion) {
    throw std::runtime_error(sqlite_db.Path() + " was written by a newer photosift (schema " + std::to_string(version) + ", supported " +
                             std::to_string(kSqliteSchemaVersion) + ")");
  }
}

} // namespace

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  CheckSchemaVersion(*sqlite_db);

  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS photos (id TEXT PRIMARY KEY, mime_type TEXT NOT NULL DEFAULT '', size_bytes INTEGER NOT NULL DEFAULT 0, width INTEGER, height INTEGER, date_taken TEXT, date_source TEXT NOT NULL DEFAULT '', has_exif INTEGER NOT NULL DEFAULT 0, primary_hash TEXT, secondary_hash TEXT);",
      "CREATE TABLE IF NOT EXISTS photo_paths (photo_id TEXT NOT NULL REFERENCES photos(id), source_path TEXT NOT NULL, filename TEXT NOT NULL, PRIMARY KEY (photo_id, source_path));",
      "CREATE TABLE IF NOT EXISTS individual_decisions (photo_id TEXT PRIMARY KEY REFERENCES photos(id), decision TEXT NOT NULL, rule_name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS duplicate_groups (photo_id TEXT PRIMARY KEY REFERENCES photos(id), group_id INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS group_rejections (photo_id TEXT PRIMARY KEY REFERENCES photos(id), group_id INTEGER NOT NULL, rule_name TEXT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS aggregated_paths (kept_photo_id TEXT NOT NULL REFERENCES photos(id), source_path TEXT NOT NULL, from_photo_id TEXT NOT NULL REFERENCES photos(id));",
      "CREATE TABLE IF NOT EXISTS pair_scan_pairs (block_index INTEGER NOT NULL, first_index INTEGER NOT NULL, second_index INTEGER NOT NULL, primary_distance INTEGER NOT NULL, secondary_distance INTEGER, PRIMARY KEY (first_index, second_index));",
      "CREATE TABLE IF NOT EXISTS pair_scan_checkpoint (id INTEGER PRIMARY KEY CHECK (id = 1), fingerprint TEXT NOT NULL, next_block INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS pipeline_state (id INTEGER PRIMARY KEY AUTOINCREMENT, stage TEXT NOT NULL, completed_at_ms INTEGER NOT NULL, count INTEGER NOT NULL DEFAULT 0, linkage TEXT NOT NULL DEFAULT '', notes TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS duplicate_groups_group_id ON duplicate_groups(group_id);",
      "CREATE INDEX IF NOT EXISTS aggregated_paths_kept ON aggregated_paths(kept_photo_id);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,mime_type,size_bytes,width,height,date_taken,date_source,has_exif,primary_hash,secondary_hash FROM photos LIMIT 1;");
  sqlite_db->Exec("SELECT stage,completed_at_ms,count,linkage,notes FROM pipeline_state LIMIT 1;");

  sqlite_db->SetSchemaVersion(kSqliteSchemaVersion);
}

std::shared_ptr<db::Repository> OpenSqliteSource(const std::string& path) {
  auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, db::sqlite::OpenMode::ReadOnly);
  CheckSchemaVersion(*sqlite_db);
  if (!sqlite_db->HasTable("photos") || !sqlite_db->HasTable("photo_paths")) {
    throw std::runtime_error(path + " is not a photosift database");
  }
  PHOTOSIFT_LOG_INFO("Opened hash import source", {observability::StringField("path", path),
                                                   observability::IntField("schema", sqlite_db->SchemaVersion())});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}
#endif

std::shared_ptr<db::Repository> BuildRepository(const photosift::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if PHOTOSIFT_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw std::runtime_error("database.sqlite.path must not be empty");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    PHOTOSIFT_LOG_INFO("Opened sqlite database", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  PHOTOSIFT_LOG_WARN("No database configured, using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace photosift::factory
