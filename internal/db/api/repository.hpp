#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/scan_pair_record.hpp"
#include "internal/db/model/stage_record.hpp"
#include "internal/model/decision.hpp"
#include "internal/model/photo.hpp"

namespace photosift::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A stage writes everything in one transaction, so a failed stage leaves
    earlier stages untouched

  The DB is the source of truth for:
    photos + paths (written by the external scanner)
    decisions, groups, rejections, aggregated paths
    pair scan progress
    stage history
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Photos
  // ---------------------------------------------------------------------

  virtual Result InsertPhoto(Transaction&, const photosift::model::Photo&) = 0;

  virtual std::optional<photosift::model::Photo> GetPhoto(Transaction&, const std::string& id) = 0;

  // Ordered by id.
  virtual std::vector<photosift::model::Photo> ListPhotos(Transaction&) = 0;

  // Hashes are written once: AlreadyExists when the photo already has one.
  virtual Result SetHashes(Transaction&, const std::string& id, const hash::HashValue& primary, const std::optional<hash::HashValue>& secondary) = 0;

  // ---------------------------------------------------------------------
  // Paths (append-only)
  // ---------------------------------------------------------------------

  virtual Result InsertPhotoPath(Transaction&, const photosift::model::PhotoPath&) = 0;

  // Ordered by source path.
  virtual std::vector<photosift::model::PhotoPath> ListPhotoPaths(Transaction&, const std::string& photo_id) = 0;

  // ---------------------------------------------------------------------
  // Individual decisions
  // ---------------------------------------------------------------------

  // AlreadyExists when the photo already carries a decision.
  virtual Result InsertDecision(Transaction&, const photosift::model::IndividualDecision&) = 0;

  virtual std::optional<photosift::model::IndividualDecision> GetDecision(Transaction&, const std::string& photo_id) = 0;

  virtual std::vector<photosift::model::IndividualDecision> ListDecisions(Transaction&) = 0;

  virtual Result ClearDecisions(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Groups
  // ---------------------------------------------------------------------

  virtual Result InsertGroupMembership(Transaction&, const photosift::model::GroupMembership&) = 0;

  // Ordered by (group_id, photo_id).
  virtual std::vector<photosift::model::GroupMembership> ListGroupMemberships(Transaction&) = 0;

  virtual Result ClearGroups(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Group rejections + aggregated paths
  // ---------------------------------------------------------------------

  virtual Result InsertGroupRejection(Transaction&, const photosift::model::GroupRejection&) = 0;

  virtual std::vector<photosift::model::GroupRejection> ListGroupRejections(Transaction&) = 0;

  virtual Result ClearGroupRejections(Transaction&) = 0;

  virtual Result InsertAggregatedPath(Transaction&, const photosift::model::AggregatedPath&) = 0;

  // Ordered by (kept_photo_id, source_path).
  virtual std::vector<photosift::model::AggregatedPath> ListAggregatedPaths(Transaction&) = 0;

  virtual Result ClearAggregatedPaths(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Pair scan progress
  // ---------------------------------------------------------------------

  virtual std::optional<model::ScanCheckpointRecord> GetScanCheckpoint(Transaction&) = 0;

  virtual Result UpsertScanCheckpoint(Transaction&, const model::ScanCheckpointRecord&) = 0;

  virtual Result InsertScanPairs(Transaction&, const std::vector<model::ScanPairRecord>&) = 0;

  // Ordered by (block_index, first, second).
  virtual std::vector<model::ScanPairRecord> ListScanPairs(Transaction&) = 0;

  // Drops stored pairs and the checkpoint.
  virtual Result ClearScan(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Stage history
  // ---------------------------------------------------------------------

  virtual Result InsertStageRecord(Transaction&, const model::StageRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::StageRecord> ListStageRecords(Transaction&) = 0;
};

} // namespace photosift::db
