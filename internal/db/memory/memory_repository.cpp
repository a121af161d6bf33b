#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "memory_tx.hpp"

namespace photosift::db::memory {

using photosift::model::AggregatedPath;
using photosift::model::GroupMembership;
using photosift::model::GroupRejection;
using photosift::model::IndividualDecision;
using photosift::model::Photo;
using photosift::model::PhotoPath;

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result MemoryRepository::InsertPhoto(Transaction& t, const Photo& r) {
  auto& s = TX(t).Mutable();
  if (s.photos.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "photo " + r.id);
  s.photos[r.id] = r;
  return Result::Ok();
}

std::optional<Photo> MemoryRepository::GetPhoto(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.photos.find(id);
  if (it == s.photos.end()) return std::nullopt;
  return it->second;
}

std::vector<Photo> MemoryRepository::ListPhotos(Transaction& t) {
  const auto&        s = TX(t).View();
  std::vector<Photo> records;
  records.reserve(s.photos.size());
  for (const auto& [_, record] : s.photos) {
    records.push_back(record);
  }
  return records;
}

Result MemoryRepository::SetHashes(Transaction& t, const std::string& id, const hash::HashValue& primary, const std::optional<hash::HashValue>& secondary) {
  auto& s  = TX(t).Mutable();
  auto  it = s.photos.find(id);
  if (it == s.photos.end()) return Result::Err(ErrorCode::NotFound, "photo " + id);
  if (it->second.primary_hash || (secondary && it->second.secondary_hash)) {
    return Result::Err(ErrorCode::AlreadyExists, "photo " + id + " already has hashes");
  }
  it->second.primary_hash = primary;
  if (secondary) it->second.secondary_hash = secondary;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Paths
// ------------------------------------------------------------------

Result MemoryRepository::InsertPhotoPath(Transaction& t, const PhotoPath& r) {
  auto& s = TX(t).Mutable();
  if (!s.photos.contains(r.photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.photo_id);
  auto& by_path = s.paths[r.photo_id];
  if (by_path.contains(r.source_path)) return Result::Err(ErrorCode::AlreadyExists, "path " + r.source_path);
  by_path[r.source_path] = r;
  return Result::Ok();
}

std::vector<PhotoPath> MemoryRepository::ListPhotoPaths(Transaction& t, const std::string& photo_id) {
  const auto&            s = TX(t).View();
  std::vector<PhotoPath> out;
  auto                   it = s.paths.find(photo_id);
  if (it == s.paths.end()) return out;
  for (const auto& [_, path] : it->second) {
    out.push_back(path);
  }
  return out;
}

// ------------------------------------------------------------------
// Decisions
// ------------------------------------------------------------------

Result MemoryRepository::InsertDecision(Transaction& t, const IndividualDecision& r) {
  auto& s = TX(t).Mutable();
  if (!s.photos.contains(r.photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.photo_id);
  if (s.decisions.contains(r.photo_id)) return Result::Err(ErrorCode::AlreadyExists, "decision for " + r.photo_id);
  s.decisions[r.photo_id] = r;
  return Result::Ok();
}

std::optional<IndividualDecision> MemoryRepository::GetDecision(Transaction& t, const std::string& photo_id) {
  const auto& s  = TX(t).View();
  auto        it = s.decisions.find(photo_id);
  if (it == s.decisions.end()) return std::nullopt;
  return it->second;
}

std::vector<IndividualDecision> MemoryRepository::ListDecisions(Transaction& t) {
  std::vector<IndividualDecision> out;
  for (const auto& [_, decision] : TX(t).View().decisions) {
    out.push_back(decision);
  }
  return out;
}

Result MemoryRepository::ClearDecisions(Transaction& t) {
  TX(t).Mutable().decisions.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Groups
// ------------------------------------------------------------------

Result MemoryRepository::InsertGroupMembership(Transaction& t, const GroupMembership& r) {
  auto& s = TX(t).Mutable();
  if (!s.photos.contains(r.photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.photo_id);
  if (s.groups.contains(r.photo_id)) return Result::Err(ErrorCode::AlreadyExists, "photo " + r.photo_id + " already grouped");
  s.groups[r.photo_id] = r;
  return Result::Ok();
}

std::vector<GroupMembership> MemoryRepository::ListGroupMemberships(Transaction& t) {
  std::vector<GroupMembership> out;
  for (const auto& [_, membership] : TX(t).View().groups) {
    out.push_back(membership);
  }
  std::sort(out.begin(), out.end(), [](const GroupMembership& a, const GroupMembership& b) {
    return std::tie(a.group_id, a.photo_id) < std::tie(b.group_id, b.photo_id);
  });
  return out;
}

Result MemoryRepository::ClearGroups(Transaction& t) {
  TX(t).Mutable().groups.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Rejections + aggregated paths
// ------------------------------------------------------------------

Result MemoryRepository::InsertGroupRejection(Transaction& t, const GroupRejection& r) {
  auto& s = TX(t).Mutable();
  if (!s.photos.contains(r.photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.photo_id);
  if (s.rejections.contains(r.photo_id)) return Result::Err(ErrorCode::AlreadyExists, "rejection for " + r.photo_id);
  s.rejections[r.photo_id] = r;
  return Result::Ok();
}

std::vector<GroupRejection> MemoryRepository::ListGroupRejections(Transaction& t) {
  std::vector<GroupRejection> out;
  for (const auto& [_, rejection] : TX(t).View().rejections) {
    out.push_back(rejection);
  }
  return out;
}

Result MemoryRepository::ClearGroupRejections(Transaction& t) {
  TX(t).Mutable().rejections.clear();
  return Result::Ok();
}

Result MemoryRepository::InsertAggregatedPath(Transaction& t, const AggregatedPath& r) {
  auto& s = TX(t).Mutable();
  if (!s.photos.contains(r.kept_photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.kept_photo_id);
  if (!s.photos.contains(r.from_photo_id)) return Result::Err(ErrorCode::NotFound, "photo " + r.from_photo_id);
  s.aggregated_paths.push_back(r);
  return Result::Ok();
}

std::vector<AggregatedPath> MemoryRepository::ListAggregatedPaths(Transaction& t) {
  auto out = TX(t).View().aggregated_paths;
  std::sort(out.begin(), out.end(), [](const AggregatedPath& a, const AggregatedPath& b) {
    return std::tie(a.kept_photo_id, a.source_path, a.from_photo_id) < std::tie(b.kept_photo_id, b.source_path, b.from_photo_id);
  });
  return out;
}

Result MemoryRepository::ClearAggregatedPaths(Transaction& t) {
  TX(t).Mutable().aggregated_paths.clear();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Pair scan
// ------------------------------------------------------------------

std::optional<model::ScanCheckpointRecord> MemoryRepository::GetScanCheckpoint(Transaction& t) {
  return TX(t).View().scan_checkpoint;
}

Result MemoryRepository::UpsertScanCheckpoint(Transaction& t, const model::ScanCheckpointRecord& r) {
  TX(t).Mutable().scan_checkpoint = r;
  return Result::Ok();
}

Result MemoryRepository::InsertScanPairs(Transaction& t, const std::vector<model::ScanPairRecord>& pairs) {
  auto& s = TX(t).Mutable();

  // all-or-nothing, like a failed statement inside a sqlite transaction
  std::set<std::pair<std::uint32_t, std::uint32_t>> incoming;
  for (const auto& pair : pairs) {
    const auto key = std::make_pair(pair.first, pair.second);
    if (s.scan_pair_keys.contains(key) || !incoming.insert(key).second) {
      return Result::Err(ErrorCode::AlreadyExists, "pair " + std::to_string(pair.first) + "/" + std::to_string(pair.second));
    }
  }
  s.scan_pair_keys.insert(incoming.begin(), incoming.end());
  s.scan_pairs.insert(s.scan_pairs.end(), pairs.begin(), pairs.end());
  return Result::Ok();
}

std::vector<model::ScanPairRecord> MemoryRepository::ListScanPairs(Transaction& t) {
  auto out = TX(t).View().scan_pairs;
  std::stable_sort(out.begin(), out.end(), [](const model::ScanPairRecord& a, const model::ScanPairRecord& b) {
    return std::tie(a.block_index, a.first, a.second) < std::tie(b.block_index, b.first, b.second);
  });
  return out;
}

Result MemoryRepository::ClearScan(Transaction& t) {
  auto& s = TX(t).Mutable();
  s.scan_pairs.clear();
  s.scan_pair_keys.clear();
  s.scan_checkpoint.reset();
  return Result::Ok();
}

// ------------------------------------------------------------------
// Stage history
// ------------------------------------------------------------------

Result MemoryRepository::InsertStageRecord(Transaction& t, const model::StageRecord& r) {
  TX(t).Mutable().stages.push_back(r);
  return Result::Ok();
}

std::vector<model::StageRecord> MemoryRepository::ListStageRecords(Transaction& t) {
  return TX(t).View().stages;
}

} // namespace photosift::db::memory
