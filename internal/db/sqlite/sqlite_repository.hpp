#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace photosift::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                                 InsertPhoto(Transaction&, const photosift::model::Photo&) override;
  std::optional<photosift::model::Photo> GetPhoto(Transaction&, const std::string& id) override;
  std::vector<photosift::model::Photo>   ListPhotos(Transaction&) override;
  Result SetHashes(Transaction&, const std::string& id, const hash::HashValue& primary, const std::optional<hash::HashValue>& secondary) override;

  Result                                   InsertPhotoPath(Transaction&, const photosift::model::PhotoPath&) override;
  std::vector<photosift::model::PhotoPath> ListPhotoPaths(Transaction&, const std::string& photo_id) override;

  Result                                              InsertDecision(Transaction&, const photosift::model::IndividualDecision&) override;
  std::optional<photosift::model::IndividualDecision> GetDecision(Transaction&, const std::string& photo_id) override;
  std::vector<photosift::model::IndividualDecision>   ListDecisions(Transaction&) override;
  Result                                              ClearDecisions(Transaction&) override;

  Result                                         InsertGroupMembership(Transaction&, const photosift::model::GroupMembership&) override;
  std::vector<photosift::model::GroupMembership> ListGroupMemberships(Transaction&) override;
  Result                                         ClearGroups(Transaction&) override;

  Result                                        InsertGroupRejection(Transaction&, const photosift::model::GroupRejection&) override;
  std::vector<photosift::model::GroupRejection> ListGroupRejections(Transaction&) override;
  Result                                        ClearGroupRejections(Transaction&) override;

  Result                                        InsertAggregatedPath(Transaction&, const photosift::model::AggregatedPath&) override;
  std::vector<photosift::model::AggregatedPath> ListAggregatedPaths(Transaction&) override;
  Result                                        ClearAggregatedPaths(Transaction&) override;

  std::optional<model::ScanCheckpointRecord> GetScanCheckpoint(Transaction&) override;
  Result                                     UpsertScanCheckpoint(Transaction&, const model::ScanCheckpointRecord&) override;
  Result                                     InsertScanPairs(Transaction&, const std::vector<model::ScanPairRecord>&) override;
  std::vector<model::ScanPairRecord>         ListScanPairs(Transaction&) override;
  Result                                     ClearScan(Transaction&) override;

  Result                          InsertStageRecord(Transaction&, const model::StageRecord&) override;
  std::vector<model::StageRecord> ListStageRecords(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);

  Result ExecSimple(Transaction& t, const char* sql);
};

} // namespace photosift::db::sqlite
