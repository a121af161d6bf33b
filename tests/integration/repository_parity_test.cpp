#include <cassert>
#include <chrono>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/scan_pair_record.hpp"
#include "internal/db/model/stage_record.hpp"
#include "internal/util/errors.hpp"

#if PHOTOSIFT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/factory.hpp"
#endif

namespace {

using photosift::db::ErrorCode;
using photosift::db::Repository;
using photosift::db::memory::MemoryRepository;
using photosift::db::model::ScanCheckpointRecord;
using photosift::db::model::ScanPairRecord;
using photosift::db::model::StageRecord;
using photosift::hash::HashValue;
using photosift::model::AggregatedPath;
using photosift::model::DateSource;
using photosift::model::Decision;
using photosift::model::GroupMembership;
using photosift::model::GroupRejection;
using photosift::model::IndividualDecision;
using photosift::model::Photo;
using photosift::model::PhotoPath;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

HashValue Hash(const std::string& hex) {
  auto value = HashValue::FromHex(hex);
  assert(value.has_value());
  return *value;
}

Photo MakePhoto(const std::string& id) {
  Photo photo;
  photo.id          = id;
  photo.mime_type   = "image/jpeg";
  photo.size_bytes  = 123456;
  photo.width       = 4000;
  photo.height      = 3000;
  photo.date_taken  = "2013-03-03T10:00:00";
  photo.date_source = DateSource::kExif;
  photo.has_exif    = true;
  return photo;
}

void VerifyPhotoAndPathReadWrite(Repository& repo, const std::string& prefix) {
  const auto full_id = prefix + "-full";
  const auto bare_id = prefix + "-bare";

  auto tx = repo.Begin();

  auto full           = MakePhoto(full_id);
  full.primary_hash   = Hash("00ff00ff00ff00ff");
  full.secondary_hash = Hash("0123456789abcdef0123456789abcdef");
  assert(repo.InsertPhoto(*tx, full));

  Photo bare;
  bare.id        = bare_id;
  bare.mime_type = "image/png";
  assert(repo.InsertPhoto(*tx, bare));

  assert(repo.InsertPhoto(*tx, bare).code == ErrorCode::AlreadyExists);

  assert(repo.InsertPhotoPath(*tx, {full_id, "/b/IMG_0001.JPG", "IMG_0001.JPG"}));
  assert(repo.InsertPhotoPath(*tx, {full_id, "/a/copy.jpg", "copy.jpg"}));
  assert(repo.InsertPhotoPath(*tx, {full_id, "/a/copy.jpg", "copy.jpg"}).code == ErrorCode::AlreadyExists);
  assert(repo.InsertPhotoPath(*tx, {prefix + "-missing", "/x.jpg", "x.jpg"}).code == ErrorCode::NotFound);
  tx->Commit();

  auto read_tx = repo.Begin();
  auto stored  = repo.GetPhoto(*read_tx, full_id);
  assert(stored.has_value());
  assert(stored->mime_type == "image/jpeg");
  assert(stored->size_bytes == 123456);
  assert(stored->width == 4000u && stored->height == 3000u);
  assert(stored->date_taken == std::string("2013-03-03T10:00:00"));
  assert(stored->date_source == DateSource::kExif);
  assert(stored->has_exif);
  assert(stored->primary_hash == Hash("00ff00ff00ff00ff"));
  assert(stored->secondary_hash == Hash("0123456789abcdef0123456789abcdef"));

  auto stored_bare = repo.GetPhoto(*read_tx, bare_id);
  assert(stored_bare.has_value());
  assert(!stored_bare->width && !stored_bare->height && !stored_bare->date_taken);
  assert(!stored_bare->primary_hash && !stored_bare->secondary_hash);
  assert(!stored_bare->HasDimensions());

  assert(!repo.GetPhoto(*read_tx, prefix + "-missing").has_value());

  auto paths = repo.ListPhotoPaths(*read_tx, full_id);
  assert(paths.size() == 2);
  assert(paths[0].source_path == "/a/copy.jpg");
  assert(paths[1].source_path == "/b/IMG_0001.JPG");
  assert(paths[1].filename == "IMG_0001.JPG");
  assert(repo.ListPhotoPaths(*read_tx, bare_id).empty());
  read_tx->Commit();
}

void VerifyHashesAreWrittenOnce(Repository& repo, const std::string& prefix) {
  const auto id = prefix + "-hash";

  auto tx = repo.Begin();
  assert(repo.InsertPhoto(*tx, MakePhoto(id)));
  assert(repo.SetHashes(*tx, id, Hash("1111111111111111"), std::nullopt));
  assert(repo.SetHashes(*tx, id, Hash("2222222222222222"), std::nullopt).code == ErrorCode::AlreadyExists);
  assert(repo.SetHashes(*tx, prefix + "-nobody", Hash("1111111111111111"), std::nullopt).code == ErrorCode::NotFound);
  tx->Commit();

  auto read_tx = repo.Begin();
  auto stored  = repo.GetPhoto(*read_tx, id);
  assert(stored && stored->primary_hash == Hash("1111111111111111"));
  assert(!stored->secondary_hash);
  read_tx->Commit();
}

void VerifyDecisionsReadWrite(Repository& repo, const std::string& prefix) {
  const auto rejected  = prefix + "-decision-a";
  const auto separated = prefix + "-decision-b";

  auto tx = repo.Begin();
  assert(repo.InsertPhoto(*tx, MakePhoto(rejected)));
  assert(repo.InsertPhoto(*tx, MakePhoto(separated)));
  assert(repo.InsertDecision(*tx, {rejected, Decision::kReject, "TINY_AREA"}));
  assert(repo.InsertDecision(*tx, {separated, Decision::kSeparate, "PHOTOBOOTH"}));
  assert(repo.InsertDecision(*tx, {rejected, Decision::kSeparate, "PHOTOBOOTH"}).code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read_tx  = repo.Begin();
  auto decision = repo.GetDecision(*read_tx, rejected);
  assert(decision && decision->decision == Decision::kReject && decision->rule_name == "TINY_AREA");
  auto all = repo.ListDecisions(*read_tx);
  assert(all.size() == 2);
  assert(all[0].photo_id == rejected);
  assert(all[1].decision == Decision::kSeparate);
  read_tx->Commit();

  auto clear_tx = repo.Begin();
  assert(repo.ClearDecisions(*clear_tx));
  clear_tx->Commit();

  auto after_tx = repo.Begin();
  assert(repo.ListDecisions(*after_tx).empty());
  assert(!repo.GetDecision(*after_tx, rejected));
  after_tx->Commit();
}

void VerifyGroupOutputsReadWrite(Repository& repo, const std::string& prefix) {
  const auto a = prefix + "-group-a";
  const auto b = prefix + "-group-b";
  const auto c = prefix + "-group-c";

  auto tx = repo.Begin();
  for (const auto& id : {a, b, c}) {
    assert(repo.InsertPhoto(*tx, MakePhoto(id)));
  }
  assert(repo.InsertGroupMembership(*tx, {c, 1}));
  assert(repo.InsertGroupMembership(*tx, {b, 2}));
  assert(repo.InsertGroupMembership(*tx, {a, 1}));
  assert(repo.InsertGroupMembership(*tx, {a, 2}).code == ErrorCode::AlreadyExists);

  assert(repo.InsertGroupRejection(*tx, {c, 1, "THUMBNAIL"}));
  assert(repo.InsertAggregatedPath(*tx, {a, "/z/c.jpg", c}));
  assert(repo.InsertAggregatedPath(*tx, {a, "/m/c.jpg", c}));
  tx->Commit();

  auto read_tx     = repo.Begin();
  auto memberships = repo.ListGroupMemberships(*read_tx);
  assert(memberships.size() == 3);
  assert(memberships[0].group_id == 1 && memberships[0].photo_id == a);
  assert(memberships[1].group_id == 1 && memberships[1].photo_id == c);
  assert(memberships[2].group_id == 2 && memberships[2].photo_id == b);

  auto rejections = repo.ListGroupRejections(*read_tx);
  assert(rejections.size() == 1);
  assert(rejections[0].photo_id == c && rejections[0].group_id == 1 && rejections[0].rule_name == "THUMBNAIL");

  auto aggregated = repo.ListAggregatedPaths(*read_tx);
  assert(aggregated.size() == 2);
  assert(aggregated[0].source_path == "/m/c.jpg");
  assert(aggregated[0].kept_photo_id == a && aggregated[0].from_photo_id == c);
  read_tx->Commit();

  auto clear_tx = repo.Begin();
  assert(repo.ClearAggregatedPaths(*clear_tx));
  assert(repo.ClearGroupRejections(*clear_tx));
  assert(repo.ClearGroups(*clear_tx));
  clear_tx->Commit();

  auto after_tx = repo.Begin();
  assert(repo.ListGroupMemberships(*after_tx).empty());
  assert(repo.ListGroupRejections(*after_tx).empty());
  assert(repo.ListAggregatedPaths(*after_tx).empty());
  after_tx->Commit();
}

void VerifyScanProgressReadWrite(Repository& repo) {
  auto tx = repo.Begin();
  assert(!repo.GetScanCheckpoint(*tx).has_value());

  std::vector<ScanPairRecord> block0 = {{0, 0, 5, 3, 7}, {0, 0, 2, 12, std::nullopt}};
  std::vector<ScanPairRecord> block1 = {{1, 3, 4, 0, 0}};
  assert(repo.InsertScanPairs(*tx, block0));
  assert(repo.UpsertScanCheckpoint(*tx, {"fp-1", 1, 100}));
  assert(repo.InsertScanPairs(*tx, block1));
  assert(repo.UpsertScanCheckpoint(*tx, {"fp-1", 2, 200}));
  assert(repo.InsertScanPairs(*tx, {{2, 0, 5, 1, 1}}).code == ErrorCode::AlreadyExists);
  tx->Commit();

  auto read_tx    = repo.Begin();
  auto checkpoint = repo.GetScanCheckpoint(*read_tx);
  assert(checkpoint && checkpoint->fingerprint == "fp-1");
  assert(checkpoint->next_block == 2 && checkpoint->updated_at_ms == 200);

  auto pairs = repo.ListScanPairs(*read_tx);
  assert(pairs.size() == 3);
  assert(pairs[0].first == 0 && pairs[0].second == 2 && pairs[0].primary == 12 && !pairs[0].secondary);
  assert(pairs[1].second == 5 && pairs[1].secondary == std::optional<uint16_t>(7));
  assert(pairs[2].block_index == 1 && pairs[2].first == 3);
  read_tx->Commit();

  auto clear_tx = repo.Begin();
  assert(repo.ClearScan(*clear_tx));
  clear_tx->Commit();

  auto after_tx = repo.Begin();
  assert(!repo.GetScanCheckpoint(*after_tx));
  assert(repo.ListScanPairs(*after_tx).empty());
  after_tx->Commit();
}

void VerifyStageHistory(Repository& repo) {
  auto tx = repo.Begin();
  assert(repo.InsertStageRecord(*tx, {"classify", 10, 4, "", "TINY_AREA=4"}));
  assert(repo.InsertStageRecord(*tx, {"group", 20, 2, "complete", "sizes=2:2"}));
  tx->Commit();

  auto read_tx = repo.Begin();
  auto history = repo.ListStageRecords(*read_tx);
  assert(history.size() == 2);
  assert(history[0].stage == "classify" && history[0].count == 4 && history[0].linkage.empty());
  assert(history[1].stage == "group" && history[1].linkage == "complete" && history[1].notes == "sizes=2:2");
  read_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& id) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertPhoto(*tx, MakePhoto(id)));
    tx->Rollback();
  }
  {
    // destructor without Commit also rolls back
    auto tx = repo.Begin();
    assert(repo.InsertPhoto(*tx, MakePhoto(id + "-dropped")));
  }

  auto tx = repo.Begin();
  assert(!repo.GetPhoto(*tx, id).has_value());
  assert(!repo.GetPhoto(*tx, id + "-dropped").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertPhoto(*tx, MakePhoto(id)));
    assert(repo->InsertDecision(*tx, {id, Decision::kReject, "SYSTEM_CACHE"}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx       = repo->Begin();
  auto photo    = repo->GetPhoto(*tx, id);
  auto decision = repo->GetDecision(*tx, id);
  assert(photo.has_value());
  assert(decision && decision->rule_name == "SYSTEM_CACHE");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if PHOTOSIFT_DB_SQLITE
void RemoveSqliteFiles(const std::string& db_path) {
  std::filesystem::remove(db_path);
  std::filesystem::remove(db_path + "-wal");
  std::filesystem::remove(db_path + "-shm");
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("photosift_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<photosift::db::sqlite::SqliteDB>(db_path);
    photosift::factory::BootstrapSqliteSchema(db);
    return std::make_shared<photosift::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() { RemoveSqliteFiles(db_path); },
  };
}
#endif

// A transaction that only read never loses to a writer that committed after it began.
void VerifyReadOnlyMemoryTxNeverConflicts() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  assert(repo.ListPhotos(*reader).empty());

  auto writer = repo.Begin();
  assert(repo.InsertPhoto(*writer, MakePhoto("late")));
  writer->Commit();

  reader->Commit();

  // a stale writer is refused
  auto stale  = repo.Begin();
  auto winner = repo.Begin();
  assert(repo.InsertPhoto(*winner, MakePhoto("winner")));
  assert(repo.InsertPhoto(*stale, MakePhoto("loser")));
  winner->Commit();
  bool refused = false;
  try {
    stale->Commit();
  } catch (const photosift::util::InvalidState&) {
    refused = true;
  }
  assert(refused);

  auto check = repo.Begin();
  assert(repo.GetPhoto(*check, "winner") && !repo.GetPhoto(*check, "loser"));
  check->Commit();
}

#if PHOTOSIFT_DB_SQLITE
void VerifySqliteImportSource() {
  const auto db_path = (std::filesystem::temp_directory_path() / ("photosift_import_source_" + std::to_string(NowMs()) + ".db")).string();
  {
    auto db = std::make_shared<photosift::db::sqlite::SqliteDB>(db_path);
    photosift::factory::BootstrapSqliteSchema(db);
    assert(db->SchemaVersion() == photosift::factory::kSqliteSchemaVersion);

    photosift::db::sqlite::SqliteRepository repo(db);

    auto photo         = MakePhoto("hashed");
    photo.primary_hash = Hash("00000000000000ff");
    auto tx            = repo.Begin();
    assert(repo.InsertPhoto(*tx, photo));
    tx->Commit();
  }

  auto source = photosift::factory::OpenSqliteSource(db_path);
  auto tx     = source->Begin();
  auto photos = source->ListPhotos(*tx);
  assert(photos.size() == 1);
  assert(photos[0].primary_hash == Hash("00000000000000ff"));
  assert(!source->InsertPhoto(*tx, MakePhoto("intruder")));
  tx->Rollback();
  source.reset();

  // a newer layout is refused both ways
  {
    auto db = std::make_shared<photosift::db::sqlite::SqliteDB>(db_path);
    db->SetSchemaVersion(photosift::factory::kSqliteSchemaVersion + 1);
  }
  bool refused_source = false;
  try {
    photosift::factory::OpenSqliteSource(db_path);
  } catch (const std::runtime_error& e) {
    refused_source = std::string(e.what()).find("newer photosift") != std::string::npos;
  }
  assert(refused_source);

  bool refused_bootstrap = false;
  try {
    photosift::factory::BootstrapSqliteSchema(std::make_shared<photosift::db::sqlite::SqliteDB>(db_path));
  } catch (const std::runtime_error&) {
    refused_bootstrap = true;
  }
  assert(refused_bootstrap);
  RemoveSqliteFiles(db_path);

  // a foreign database is neither accepted nor modified
  {
    auto db = std::make_shared<photosift::db::sqlite::SqliteDB>(db_path);
    db->Exec("CREATE TABLE albums (name TEXT);");
  }
  bool refused_foreign = false;
  try {
    photosift::factory::OpenSqliteSource(db_path);
  } catch (const std::runtime_error& e) {
    refused_foreign = std::string(e.what()).find("not a photosift database") != std::string::npos;
  }
  assert(refused_foreign);
  {
    photosift::db::sqlite::SqliteDB db(db_path, photosift::db::sqlite::OpenMode::ReadOnly);
    assert(!db.HasTable("photos") && db.HasTable("albums"));
    assert(db.SchemaVersion() == 0);
  }
  RemoveSqliteFiles(db_path);

  bool missing_refused = false;
  try {
    photosift::factory::OpenSqliteSource(db_path);
  } catch (const std::runtime_error&) {
    missing_refused = true;
  }
  assert(missing_refused);
  assert(!std::filesystem::exists(db_path));
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  {
    auto repo = backend.make_repository();

    VerifyPhotoAndPathReadWrite(*repo, backend.name);
    VerifyHashesAreWrittenOnce(*repo, backend.name);
    VerifyDecisionsReadWrite(*repo, backend.name);
    VerifyGroupOutputsReadWrite(*repo, backend.name);
    VerifyScanProgressReadWrite(*repo);
    VerifyStageHistory(*repo);
    VerifyRollbackBehavior(*repo, backend.name + "-rollback");
  }

  VerifyRestartDurability(backend, backend.name + "-durable");

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if PHOTOSIFT_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  VerifyReadOnlyMemoryTxNeverConflicts();
#if PHOTOSIFT_DB_SQLITE
  VerifySqliteImportSource();
#endif

  std::cout << "photosift_integration_repository_parity: pass\n";
  return 0;
}
