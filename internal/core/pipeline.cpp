#include "pipeline.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include "internal/classify/individual_classifier.hpp"
#include "internal/db/api/result_check.hpp"
#include "internal/grouping/similarity_grouper.hpp"
#include "internal/observability/logging.hpp"
#include "internal/resolve/group_rule_engine.hpp"
#include "internal/resolve/path_aggregator.hpp"
#include "internal/resolve/rank_hint.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace photosift::core {

using db::ThrowIfFailed;
using observability::BoolField;
using observability::IntField;
using observability::StringField;

namespace {

std::int64_t I64(std::size_t value) {
  return static_cast<std::int64_t>(value);
}

std::string DescribeCounts(const std::map<std::string, std::size_t>& counts) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& [key, count] : counts) {
    if (!first) out << ",";
    out << key << "=" << count;
    first = false;
  }
  return out.str();
}

std::string DescribeSizes(const std::map<std::size_t, std::size_t>& sizes) {
  std::ostringstream out;
  bool               first = true;
  for (const auto& [size, count] : sizes) {
    if (!first) out << ",";
    out << size << ":" << count;
    first = false;
  }
  return out.str();
}

/*
  Bit width most stored hashes share; ties go to the narrower width, 0 when
  nothing is hashed. Hashes of another width cannot be compared with the
  rest, so stages leave them out instead of failing the whole batch.
*/
std::size_t DominantWidth(const std::map<std::size_t, std::size_t>& width_counts) {
  std::size_t width = 0;
  std::size_t best  = 0;
  for (const auto& [candidate, count] : width_counts) {
    if (count > best) {
      width = candidate;
      best  = count;
    }
  }
  return width;
}

/*
  Pair scan progress persisted through the repository.

  Each stored block is its own transaction, so a crash loses at most the
  block in flight. Progress under another fingerprint is discarded.
*/
class RepositoryScanCheckpoint final : public grouping::PairScanCheckpoint {
 public:
  explicit RepositoryScanCheckpoint(db::Repository& repository) : repository_(repository) {
  }

  Progress Load(const std::string& fingerprint) override {
    Progress progress;

    auto tx         = repository_.Begin();
    auto checkpoint = repository_.GetScanCheckpoint(*tx);
    if (checkpoint && checkpoint->fingerprint == fingerprint) {
      progress.next_block = static_cast<std::size_t>(checkpoint->next_block);
      for (const auto& record : repository_.ListScanPairs(*tx)) {
        if (record.block_index >= checkpoint->next_block) continue;
        progress.pairs.push_back({record.first, record.second, record.primary, record.secondary});
      }
      tx->Commit();
      return progress;
    }

    if (checkpoint) {
      PHOTOSIFT_LOG_INFO("Discarding pair scan progress of a different candidate set",
                         {StringField("stored", checkpoint->fingerprint), StringField("current", fingerprint)});
    }
    ThrowIfFailed(repository_.ClearScan(*tx), "clear pair scan");
    tx->Commit();
    return progress;
  }

  void StoreBlock(const std::string& fingerprint, std::size_t block_index, const std::vector<grouping::PairDistance>& pairs) override {
    std::vector<db::model::ScanPairRecord> records;
    records.reserve(pairs.size());
    for (const auto& pair : pairs) {
      records.push_back({block_index, pair.first, pair.second, pair.primary, pair.secondary});
    }

    db::model::ScanCheckpointRecord checkpoint;
    checkpoint.fingerprint   = fingerprint;
    checkpoint.next_block    = block_index + 1;
    checkpoint.updated_at_ms = util::ToUnixMillis(util::Now());

    auto tx = repository_.Begin();
    ThrowIfFailed(repository_.InsertScanPairs(*tx, records), "store pair scan block " + std::to_string(block_index));
    ThrowIfFailed(repository_.UpsertScanCheckpoint(*tx, checkpoint), "store pair scan checkpoint");
    tx->Commit();
  }

 private:
  db::Repository& repository_;
};

} // namespace

Pipeline::Pipeline(std::shared_ptr<db::Repository> repository, config::Settings settings, std::shared_ptr<const classify::SiblingProbe> probe)
    : repository_(std::move(repository)), settings_(std::move(settings)), probe_(std::move(probe)) {
  if (!repository_) throw std::invalid_argument("pipeline requires a repository");
  if (!probe_) throw std::invalid_argument("pipeline requires a sibling probe");
}

void Pipeline::RecordStage(db::Transaction& tx, const std::string& stage, std::uint64_t count, const std::string& linkage, const std::string& notes) {
  db::model::StageRecord record;
  record.stage           = stage;
  record.completed_at_ms = util::ToUnixMillis(util::Now());
  record.count           = count;
  record.linkage         = linkage;
  record.notes           = notes;
  ThrowIfFailed(repository_->InsertStageRecord(tx, record), "record stage " + stage);
}

// ------------------------------------------------------------------
// classify
// ------------------------------------------------------------------

ClassifySummary Pipeline::Classify(bool clear) {
  const auto classifier = classify::IndividualClassifier::WithBuiltinRules(settings_.individual_rules, probe_);

  ClassifySummary summary;

  auto tx = repository_->Begin();
  if (clear) {
    ThrowIfFailed(repository_->ClearDecisions(*tx), "clear decisions");
  }

  for (const auto& photo : repository_->ListPhotos(*tx)) {
    if (repository_->GetDecision(*tx, photo.id)) continue;
    ++summary.examined;

    auto decision = classifier.Classify(photo, repository_->ListPhotoPaths(*tx, photo.id));
    if (!decision) {
      ++summary.undecided;
      continue;
    }

    ThrowIfFailed(repository_->InsertDecision(*tx, *decision), "record decision for photo " + photo.id);
    if (decision->decision == model::Decision::kReject) {
      ++summary.rejected;
    } else {
      ++summary.separated;
    }
    ++summary.by_rule[decision->rule_name];
  }

  RecordStage(*tx, "classify", summary.rejected + summary.separated, "", DescribeCounts(summary.by_rule));
  tx->Commit();

  PHOTOSIFT_LOG_INFO("Classify stage finished", {IntField("examined", I64(summary.examined)), IntField("rejected", I64(summary.rejected)),
                                                 IntField("separated", I64(summary.separated)), IntField("undecided", I64(summary.undecided)),
                                                 BoolField("clear", clear)});
  return summary;
}

// ------------------------------------------------------------------
// group
// ------------------------------------------------------------------

GroupSummary Pipeline::Group(bool clear) {
  const grouping::SimilarityGrouper grouper(settings_.grouping);

  GroupSummary summary;
  summary.linkage = settings_.grouping.linkage;

  std::vector<model::Photo> hashed;
  {
    auto tx = repository_->Begin();
    if (clear) {
      ThrowIfFailed(repository_->ClearScan(*tx), "clear pair scan");
    }
    for (auto& photo : repository_->ListPhotos(*tx)) {
      if (repository_->GetDecision(*tx, photo.id)) continue;
      if (!photo.primary_hash) {
        ++summary.skipped_unhashed;
        continue;
      }
      hashed.push_back(std::move(photo));
    }
    tx->Commit();
  }

  std::map<std::size_t, std::size_t> primary_widths;
  std::map<std::size_t, std::size_t> secondary_widths;
  for (const auto& photo : hashed) {
    ++primary_widths[photo.primary_hash->BitWidth()];
    if (photo.secondary_hash) ++secondary_widths[photo.secondary_hash->BitWidth()];
  }
  const std::size_t primary_width   = DominantWidth(primary_widths);
  const std::size_t secondary_width = DominantWidth(secondary_widths);

  std::vector<grouping::Candidate> candidates;
  candidates.reserve(hashed.size());
  for (auto& photo : hashed) {
    if (photo.primary_hash->BitWidth() != primary_width) {
      PHOTOSIFT_LOG_WARN("Leaving photo out of grouping, primary hash width differs",
                         {StringField("photo_id", photo.id), IntField("width", I64(photo.primary_hash->BitWidth())),
                          IntField("expected", I64(primary_width))});
      ++summary.skipped_unhashed;
      ++summary.off_width;
      continue;
    }
    if (photo.secondary_hash && photo.secondary_hash->BitWidth() != secondary_width) {
      PHOTOSIFT_LOG_WARN("Ignoring secondary hash of unexpected width",
                         {StringField("photo_id", photo.id), IntField("width", I64(photo.secondary_hash->BitWidth())),
                          IntField("expected", I64(secondary_width))});
      photo.secondary_hash.reset();
      ++summary.off_width;
    }
    if (settings_.grouping.require_secondary_hash && !photo.secondary_hash) {
      ++summary.skipped_unhashed;
      continue;
    }
    candidates.push_back({photo.id, {std::move(*photo.primary_hash), std::move(photo.secondary_hash)}});
  }
  summary.candidates = candidates.size();

  RepositoryScanCheckpoint checkpoint(*repository_);
  const auto               result = grouper.Group(std::move(candidates), &checkpoint);

  summary.singletons     = result.SingletonCount();
  summary.unlinked_pairs = result.unlinked_pairs;
  summary.resumed_blocks = result.resumed_blocks;
  summary.scanned_blocks = result.scanned_blocks;
  for (const auto& cluster : result.clusters) {
    if (cluster.size() < 2) continue;
    ++summary.groups;
    summary.grouped_photos += cluster.size();
    ++summary.size_distribution[cluster.size()];
  }

  auto tx = repository_->Begin();
  // rejections and aggregated paths point at the old group ids
  ThrowIfFailed(repository_->ClearGroups(*tx), "clear groups");
  ThrowIfFailed(repository_->ClearGroupRejections(*tx), "clear group rejections");
  ThrowIfFailed(repository_->ClearAggregatedPaths(*tx), "clear aggregated paths");

  for (const auto& membership : result.Memberships()) {
    ThrowIfFailed(repository_->InsertGroupMembership(*tx, membership), "record group membership for photo " + membership.photo_id);
  }

  std::ostringstream notes;
  notes << "candidates=" << summary.candidates << " singletons=" << summary.singletons << " unlinked_pairs=" << summary.unlinked_pairs
        << " off_width=" << summary.off_width << " sizes=" << DescribeSizes(summary.size_distribution);
  RecordStage(*tx, "group", summary.groups, model::ToString(summary.linkage), notes.str());
  tx->Commit();

  PHOTOSIFT_LOG_INFO("Group stage finished", {StringField("linkage", model::ToString(summary.linkage)), IntField("candidates", I64(summary.candidates)),
                                              IntField("groups", I64(summary.groups)), IntField("grouped_photos", I64(summary.grouped_photos)),
                                              IntField("skipped_unhashed", I64(summary.skipped_unhashed)),
                                              IntField("resumed_blocks", I64(summary.resumed_blocks)),
                                              IntField("scanned_blocks", I64(summary.scanned_blocks))});
  if (summary.linkage == model::LinkageMode::kComplete && summary.unlinked_pairs > 0) {
    PHOTOSIFT_LOG_INFO("Same-scene pairs left in different groups", {IntField("unlinked_pairs", I64(summary.unlinked_pairs))});
  }
  return summary;
}

// ------------------------------------------------------------------
// resolve
// ------------------------------------------------------------------

ResolveSummary Pipeline::Resolve() {
  const auto engine = resolve::GroupRuleEngine::WithBuiltinRules(settings_.group_rules);

  ResolveSummary summary;

  auto tx = repository_->Begin();
  ThrowIfFailed(repository_->ClearGroupRejections(*tx), "clear group rejections");
  ThrowIfFailed(repository_->ClearAggregatedPaths(*tx), "clear aggregated paths");

  // memberships arrive ordered by (group_id, photo_id): canonical member order
  std::map<std::uint64_t, std::vector<std::string>> groups;
  for (const auto& membership : repository_->ListGroupMemberships(*tx)) {
    groups[membership.group_id].push_back(membership.photo_id);
  }

  for (const auto& [group_id, photo_ids] : groups) {
    std::vector<resolve::ClusterMember> members;
    members.reserve(photo_ids.size());
    for (const auto& photo_id : photo_ids) {
      auto photo = repository_->GetPhoto(*tx, photo_id);
      if (!photo) {
        throw util::NotFound("group " + std::to_string(group_id) + " references unknown photo " + photo_id);
      }
      members.push_back({std::move(*photo), repository_->ListPhotoPaths(*tx, photo_id)});
    }
    ++summary.groups;

    const auto outcome = engine.Resolve(group_id, members);

    for (const auto& rejection : outcome.rejections) {
      const auto& photo_id = members[rejection.member].photo.id;
      ThrowIfFailed(repository_->InsertGroupRejection(*tx, {photo_id, group_id, rejection.rule_name}), "record group rejection for photo " + photo_id);
      ++summary.by_rule[rejection.rule_name];
    }
    summary.rejected += outcome.rejections.size();
    summary.kept += outcome.survivors.size();
    if (outcome.halted) ++summary.halted_groups;
    for (auto survivor : outcome.survivors) {
      PHOTOSIFT_LOG_DEBUG("Kept group member", {IntField("group_id", static_cast<std::int64_t>(group_id)), StringField("photo_id", members[survivor].photo.id),
                                                StringField("rank", resolve::DescribeRankHint(resolve::ComputeRankHint(members[survivor])))});
    }

    for (const auto& path : resolve::PathAggregator::Aggregate(members, outcome)) {
      ThrowIfFailed(repository_->InsertAggregatedPath(*tx, path), "record aggregated path " + path.source_path);
      ++summary.aggregated_paths;
    }
  }

  std::ostringstream notes;
  notes << "groups=" << summary.groups << " kept=" << summary.kept << " halted=" << summary.halted_groups
        << " aggregated_paths=" << summary.aggregated_paths << " " << DescribeCounts(summary.by_rule);
  RecordStage(*tx, "resolve", summary.rejected, "", notes.str());
  tx->Commit();

  PHOTOSIFT_LOG_INFO("Resolve stage finished", {IntField("groups", I64(summary.groups)), IntField("rejected", I64(summary.rejected)),
                                                IntField("kept", I64(summary.kept)), IntField("halted_groups", I64(summary.halted_groups)),
                                                IntField("aggregated_paths", I64(summary.aggregated_paths))});
  return summary;
}

RunSummary Pipeline::Run(bool clear) {
  RunSummary summary;
  summary.classify = Classify(clear);
  summary.group    = Group(clear);
  summary.resolve  = Resolve();
  return summary;
}

// ------------------------------------------------------------------
// import-hashes
// ------------------------------------------------------------------

ImportSummary Pipeline::ImportHashes(db::Repository& source) {
  std::vector<model::Photo> source_photos;
  {
    auto source_tx = source.Begin();
    source_photos  = source.ListPhotos(*source_tx);
    source_tx->Commit();
  }

  ImportSummary summary;

  auto tx = repository_->Begin();

  // imported hashes must be comparable with the ones the target already has;
  // an unhashed target adopts the width most source hashes use
  std::map<std::size_t, std::size_t> primary_widths;
  std::map<std::size_t, std::size_t> secondary_widths;
  for (const auto& photo : repository_->ListPhotos(*tx)) {
    if (photo.primary_hash) ++primary_widths[photo.primary_hash->BitWidth()];
    if (photo.secondary_hash) ++secondary_widths[photo.secondary_hash->BitWidth()];
  }
  for (const auto& photo : source_photos) {
    if (primary_widths.empty() && photo.primary_hash) ++primary_widths[photo.primary_hash->BitWidth()];
  }
  const std::size_t primary_width = DominantWidth(primary_widths);
  if (secondary_widths.empty()) {
    for (const auto& photo : source_photos) {
      if (photo.secondary_hash) ++secondary_widths[photo.secondary_hash->BitWidth()];
    }
  }
  const std::size_t secondary_width = DominantWidth(secondary_widths);

  for (const auto& incoming : source_photos) {
    if (!incoming.primary_hash) {
      ++summary.source_unhashed;
      continue;
    }
    if (incoming.primary_hash->BitWidth() != primary_width) {
      PHOTOSIFT_LOG_WARN("Not importing hash of unexpected width", {StringField("photo_id", incoming.id),
                                                                    IntField("width", I64(incoming.primary_hash->BitWidth())),
                                                                    IntField("expected", I64(primary_width))});
      ++summary.off_width;
      continue;
    }

    auto existing = repository_->GetPhoto(*tx, incoming.id);
    if (!existing) {
      ++summary.unknown_photos;
      continue;
    }
    // never overwrite
    if (existing->primary_hash) {
      ++summary.already_hashed;
      continue;
    }

    std::optional<hash::HashValue> secondary;
    if (!existing->secondary_hash && incoming.secondary_hash && incoming.secondary_hash->BitWidth() == secondary_width) {
      secondary = incoming.secondary_hash;
    }
    ThrowIfFailed(repository_->SetHashes(*tx, incoming.id, *incoming.primary_hash, secondary), "import hashes for photo " + incoming.id);
    ++summary.imported;
  }

  std::ostringstream notes;
  notes << "already_hashed=" << summary.already_hashed << " unknown=" << summary.unknown_photos << " off_width=" << summary.off_width;
  RecordStage(*tx, "import-hashes", summary.imported, "", notes.str());
  tx->Commit();

  PHOTOSIFT_LOG_INFO("Hash import finished", {IntField("imported", I64(summary.imported)), IntField("already_hashed", I64(summary.already_hashed)),
                                              IntField("unknown_photos", I64(summary.unknown_photos)),
                                              IntField("source_unhashed", I64(summary.source_unhashed)),
                                              IntField("off_width", I64(summary.off_width))});
  return summary;
}

// ------------------------------------------------------------------
// status
// ------------------------------------------------------------------

StatusReport Pipeline::Status() {
  StatusReport report;

  auto tx = repository_->Begin();
  for (const auto& photo : repository_->ListPhotos(*tx)) {
    ++report.photos;
    if (photo.primary_hash) ++report.hashed;
  }

  for (const auto& decision : repository_->ListDecisions(*tx)) {
    if (decision.decision == model::Decision::kReject) {
      ++report.rejected;
    } else {
      ++report.separated;
    }
    ++report.decisions_by_rule[std::string(model::ToString(decision.decision)) + "/" + decision.rule_name];
  }

  std::uint64_t last_group = 0;
  for (const auto& membership : repository_->ListGroupMemberships(*tx)) {
    ++report.grouped_photos;
    if (report.groups == 0 || membership.group_id != last_group) {
      ++report.groups;
      last_group = membership.group_id;
    }
  }

  for (const auto& rejection : repository_->ListGroupRejections(*tx)) {
    ++report.group_rejected;
    ++report.group_rejections_by_rule[rejection.rule_name];
  }

  report.aggregated_paths = repository_->ListAggregatedPaths(*tx).size();
  report.history          = repository_->ListStageRecords(*tx);
  tx->Commit();
  return report;
}

} // namespace photosift::core
