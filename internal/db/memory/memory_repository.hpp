#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <utility>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace photosift::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  struct State {
    std::map<std::string, photosift::model::Photo>                               photos;
    std::map<std::string, std::map<std::string, photosift::model::PhotoPath>>    paths; // photo -> source_path -> path
    std::map<std::string, photosift::model::IndividualDecision>                  decisions;
    std::map<std::string, photosift::model::GroupMembership>                     groups; // by photo id
    std::map<std::string, photosift::model::GroupRejection>                      rejections;
    std::vector<photosift::model::AggregatedPath>                                aggregated_paths;
    std::optional<model::ScanCheckpointRecord>                                   scan_checkpoint;
    std::vector<model::ScanPairRecord>                                           scan_pairs;
    std::set<std::pair<std::uint32_t, std::uint32_t>>                            scan_pair_keys;
    std::vector<model::StageRecord>                                              stages;
  };

  std::mutex    mutex_;
  State         committed_;
  std::uint64_t committed_version_ = 0;
};

} // namespace photosift::db::memory
