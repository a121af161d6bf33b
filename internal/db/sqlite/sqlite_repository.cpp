#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace photosift::db::sqlite {

using photosift::db::ErrorCode;
using photosift::db::Result;
using photosift::model::AggregatedPath;
using photosift::model::GroupMembership;
using photosift::model::GroupRejection;
using photosift::model::IndividualDecision;
using photosift::model::Photo;
using photosift::model::PhotoPath;

namespace {

// finalizes on every return path
class Statement {
 public:
  Statement(sqlite3* db, const char* sql) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

template <typename T>
void BindOptionalU64(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (v) {
    BindU64(st, idx, static_cast<uint64_t>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

bool ColIsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

// Unparseable stored hashes are treated as absent.
std::optional<hash::HashValue> ColHash(sqlite3_stmt* st, int col, const std::string& photo_id) {
  if (ColIsNull(st, col)) return std::nullopt;
  const auto text  = ColText(st, col);
  auto       value = hash::HashValue::FromHex(text);
  if (!value) {
    PHOTOSIFT_LOG_WARN("Ignoring unparseable stored hash", {observability::StringField("photo_id", photo_id), observability::StringField("value", text)});
  }
  return value;
}

constexpr const char* kPhotoColumns =
    "id,mime_type,size_bytes,width,height,date_taken,date_source,has_exif,primary_hash,secondary_hash";

Photo ReadPhoto(sqlite3_stmt* st) {
  Photo p;
  p.id         = ColText(st, 0);
  p.mime_type  = ColText(st, 1);
  p.size_bytes = ColU64(st, 2);
  if (!ColIsNull(st, 3)) p.width = static_cast<uint32_t>(ColU64(st, 3));
  if (!ColIsNull(st, 4)) p.height = static_cast<uint32_t>(ColU64(st, 4));
  if (!ColIsNull(st, 5)) p.date_taken = ColText(st, 5);
  p.date_source    = photosift::model::DateSourceFromString(ColText(st, 6));
  p.has_exif       = sqlite3_column_int(st, 7) != 0;
  p.primary_hash   = ColHash(st, 8, p.id);
  p.secondary_hash = ColHash(st, 9, p.id);
  return p;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc) {
    case SQLITE_CONSTRAINT_PRIMARYKEY:
    case SQLITE_CONSTRAINT_UNIQUE:
      return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT_FOREIGNKEY:
      return Result::Err(ErrorCode::NotFound, sqlite3_errmsg(db));
    default:
      break;
  }

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

Result SqliteRepository::ExecSimple(Transaction& t, const char* sql) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result SqliteRepository::InsertPhoto(Transaction& t, const Photo& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO photos(id,mime_type,size_bytes,width,height,date_taken,date_source,has_exif,primary_hash,secondary_hash) "
               "VALUES(?,?,?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.mime_type);
  BindU64(st.get(), 3, r.size_bytes);
  BindOptionalU64(st.get(), 4, r.width);
  BindOptionalU64(st.get(), 5, r.height);
  BindOptionalText(st.get(), 6, r.date_taken);
  BindText(st.get(), 7, photosift::model::ToString(r.date_source));
  sqlite3_bind_int(st.get(), 8, r.has_exif ? 1 : 0);
  BindOptionalText(st.get(), 9, r.primary_hash ? std::optional<std::string>(r.primary_hash->ToHex()) : std::nullopt);
  BindOptionalText(st.get(), 10, r.secondary_hash ? std::optional<std::string>(r.secondary_hash->ToHex()) : std::nullopt);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<Photo> SqliteRepository::GetPhoto(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  const std::string sql = std::string("SELECT ") + kPhotoColumns + " FROM photos WHERE id=?;";
  Statement         st(db, sql.c_str());
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadPhoto(st.get());
}

std::vector<Photo> SqliteRepository::ListPhotos(Transaction& t) {
  auto* db = TX(t).Handle();

  const std::string  sql = std::string("SELECT ") + kPhotoColumns + " FROM photos ORDER BY id;";
  Statement          st(db, sql.c_str());
  std::vector<Photo> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadPhoto(st.get()));
  }
  return out;
}

Result SqliteRepository::SetHashes(Transaction& t, const std::string& id, const hash::HashValue& primary, const std::optional<hash::HashValue>& secondary) {
  auto* db = TX(t).Handle();

  {
    Statement check(db, "SELECT primary_hash IS NOT NULL, secondary_hash IS NOT NULL FROM photos WHERE id=?;");
    if (!check) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    BindText(check.get(), 1, id);
    if (sqlite3_step(check.get()) != SQLITE_ROW) return Result::Err(ErrorCode::NotFound, "photo " + id);
    const bool has_primary   = sqlite3_column_int(check.get(), 0) != 0;
    const bool has_secondary = sqlite3_column_int(check.get(), 1) != 0;
    if (has_primary || (secondary && has_secondary)) {
      return Result::Err(ErrorCode::AlreadyExists, "photo " + id + " already has hashes");
    }
  }

  Statement st(db, "UPDATE photos SET primary_hash=?, secondary_hash=COALESCE(?, secondary_hash) WHERE id=?;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, primary.ToHex());
  BindOptionalText(st.get(), 2, secondary ? std::optional<std::string>(secondary->ToHex()) : std::nullopt);
  BindText(st.get(), 3, id);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Paths
// ------------------------------------------------------------------

Result SqliteRepository::InsertPhotoPath(Transaction& t, const PhotoPath& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO photo_paths(photo_id,source_path,filename) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.photo_id);
  BindText(st.get(), 2, r.source_path);
  BindText(st.get(), 3, r.filename);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<PhotoPath> SqliteRepository::ListPhotoPaths(Transaction& t, const std::string& photo_id) {
  auto* db = TX(t).Handle();

  Statement              st(db, "SELECT photo_id,source_path,filename FROM photo_paths WHERE photo_id=? ORDER BY source_path;");
  std::vector<PhotoPath> out;
  if (!st) return out;

  BindText(st.get(), 1, photo_id);
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
  }
  return out;
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

Result SqliteRepository::InsertDecision(Transaction& t, const IndividualDecision& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO individual_decisions(photo_id,decision,rule_name) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.photo_id);
  BindText(st.get(), 2, photosift::model::ToString(r.decision));
  BindText(st.get(), 3, r.rule_name);

  return Translate(db, sqlite3_step(st.get()));
}

// An unknown decision value is corruption; treating it as "no decision"
// would make classify re-decide the photo and trip the primary key.
static IndividualDecision ReadDecision(sqlite3_stmt* st) {
  const auto photo_id = ColText(st, 0);
  const auto stored   = ColText(st, 1);
  auto       decision = photosift::model::DecisionFromString(stored);
  if (!decision) {
    throw util::InvalidState("photo " + photo_id + " has an unknown stored decision '" + stored + "'");
  }
  return IndividualDecision{photo_id, *decision, ColText(st, 2)};
}

std::optional<IndividualDecision> SqliteRepository::GetDecision(Transaction& t, const std::string& photo_id) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT photo_id,decision,rule_name FROM individual_decisions WHERE photo_id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, photo_id);
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadDecision(st.get());
}

std::vector<IndividualDecision> SqliteRepository::ListDecisions(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement                       st(db, "SELECT photo_id,decision,rule_name FROM individual_decisions ORDER BY photo_id;");
  std::vector<IndividualDecision> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadDecision(st.get()));
  }
  return out;
}

Result SqliteRepository::ClearDecisions(Transaction& t) {
  return ExecSimple(t, "DELETE FROM individual_decisions;");
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result SqliteRepository::InsertGroupMembership(Transaction& t, const GroupMembership& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO duplicate_groups(photo_id,group_id) VALUES(?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.photo_id);
  BindU64(st.get(), 2, r.group_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<GroupMembership> SqliteRepository::ListGroupMemberships(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement                    st(db, "SELECT photo_id,group_id FROM duplicate_groups ORDER BY group_id,photo_id;");
  std::vector<GroupMembership> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColU64(st.get(), 1)});
  }
  return out;
}

Result SqliteRepository::ClearGroups(Transaction& t) {
  return ExecSimple(t, "DELETE FROM duplicate_groups;");
}

// ------------------------------------------------------------------
// Rejections + aggregated paths
// ------------------------------------------------------------------

Result SqliteRepository::InsertGroupRejection(Transaction& t, const GroupRejection& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO group_rejections(photo_id,group_id,rule_name) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.photo_id);
  BindU64(st.get(), 2, r.group_id);
  BindText(st.get(), 3, r.rule_name);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<GroupRejection> SqliteRepository::ListGroupRejections(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement                   st(db, "SELECT photo_id,group_id,rule_name FROM group_rejections ORDER BY photo_id;");
  std::vector<GroupRejection> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColU64(st.get(), 1), ColText(st.get(), 2)});
  }
  return out;
}

Result SqliteRepository::ClearGroupRejections(Transaction& t) {
  return ExecSimple(t, "DELETE FROM group_rejections;");
}

Result SqliteRepository::InsertAggregatedPath(Transaction& t, const AggregatedPath& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO aggregated_paths(kept_photo_id,source_path,from_photo_id) VALUES(?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.kept_photo_id);
  BindText(st.get(), 2, r.source_path);
  BindText(st.get(), 3, r.from_photo_id);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<AggregatedPath> SqliteRepository::ListAggregatedPaths(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT kept_photo_id,source_path,from_photo_id FROM aggregated_paths ORDER BY kept_photo_id,source_path,from_photo_id;");
  std::vector<AggregatedPath> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back({ColText(st.get(), 0), ColText(st.get(), 1), ColText(st.get(), 2)});
  }
  return out;
}

Result SqliteRepository::ClearAggregatedPaths(Transaction& t) {
  return ExecSimple(t, "DELETE FROM aggregated_paths;");
}

// ------------------------------------------------------------------
// Pair scan
// ------------------------------------------------------------------

std::optional<model::ScanCheckpointRecord> SqliteRepository::GetScanCheckpoint(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, "SELECT fingerprint,next_block,updated_at_ms FROM pair_scan_checkpoint WHERE id=1;");
  if (!st) return std::nullopt;
  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::ScanCheckpointRecord r;
  r.fingerprint   = ColText(st.get(), 0);
  r.next_block    = ColU64(st.get(), 1);
  r.updated_at_ms = ColU64(st.get(), 2);
  return r;
}

Result SqliteRepository::UpsertScanCheckpoint(Transaction& t, const model::ScanCheckpointRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO pair_scan_checkpoint(id,fingerprint,next_block,updated_at_ms) VALUES(1,?,?,?) "
               "ON CONFLICT(id) DO UPDATE SET fingerprint=excluded.fingerprint, next_block=excluded.next_block, "
               "updated_at_ms=excluded.updated_at_ms;");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.fingerprint);
  BindU64(st.get(), 2, r.next_block);
  BindU64(st.get(), 3, r.updated_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::InsertScanPairs(Transaction& t, const std::vector<model::ScanPairRecord>& pairs) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "INSERT INTO pair_scan_pairs(block_index,first_index,second_index,primary_distance,secondary_distance) "
               "VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  for (const auto& pair : pairs) {
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    BindU64(st.get(), 1, pair.block_index);
    BindU64(st.get(), 2, pair.first);
    BindU64(st.get(), 3, pair.second);
    BindU64(st.get(), 4, pair.primary);
    BindOptionalU64(st.get(), 5, pair.secondary);

    auto result = Translate(db, sqlite3_step(st.get()));
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::ScanPairRecord> SqliteRepository::ListScanPairs(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db,
               "SELECT block_index,first_index,second_index,primary_distance,secondary_distance FROM pair_scan_pairs "
               "ORDER BY block_index,first_index,second_index;");
  std::vector<model::ScanPairRecord> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::ScanPairRecord r;
    r.block_index = ColU64(st.get(), 0);
    r.first       = static_cast<uint32_t>(ColU64(st.get(), 1));
    r.second      = static_cast<uint32_t>(ColU64(st.get(), 2));
    r.primary     = static_cast<uint16_t>(ColU64(st.get(), 3));
    if (!ColIsNull(st.get(), 4)) r.secondary = static_cast<uint16_t>(ColU64(st.get(), 4));
    out.push_back(r);
  }
  return out;
}

Result SqliteRepository::ClearScan(Transaction& t) {
  auto result = ExecSimple(t, "DELETE FROM pair_scan_pairs;");
  if (!result) return result;
  return ExecSimple(t, "DELETE FROM pair_scan_checkpoint;");
}

// ------------------------------------------------------------------
// Stage history
// ------------------------------------------------------------------

Result SqliteRepository::InsertStageRecord(Transaction& t, const model::StageRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, "INSERT INTO pipeline_state(stage,completed_at_ms,count,linkage,notes) VALUES(?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.stage);
  BindU64(st.get(), 2, r.completed_at_ms);
  BindU64(st.get(), 3, r.count);
  BindText(st.get(), 4, r.linkage);
  BindText(st.get(), 5, r.notes);

  return Translate(db, sqlite3_step(st.get()));
}

std::vector<model::StageRecord> SqliteRepository::ListStageRecords(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement                       st(db, "SELECT stage,completed_at_ms,count,linkage,notes FROM pipeline_state ORDER BY id;");
  std::vector<model::StageRecord> out;
  if (!st) return out;

  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::StageRecord r;
    r.stage           = ColText(st.get(), 0);
    r.completed_at_ms = ColU64(st.get(), 1);
    r.count           = ColU64(st.get(), 2);
    r.linkage         = ColText(st.get(), 3);
    r.notes           = ColText(st.get(), 4);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace photosift::db::sqlite
