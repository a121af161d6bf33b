#include "similarity_grouper.hpp"

#include <algorithm>
#include <cstdio>
#include <stdexcept>

#include "internal/observability/logging.hpp"

namespace photosift::grouping {
namespace {

// FNV-1a, 64 bit
class Fnv1a {
 public:
  void Add(std::string_view bytes) {
    for (unsigned char c : bytes) {
      state_ ^= c;
      state_ *= 1099511628211ULL;
    }
    // field separator so ("ab","c") != ("a","bc")
    state_ ^= 0xFF;
    state_ *= 1099511628211ULL;
  }

  void Add(std::uint64_t value) {
    Add(std::to_string(value));
  }

  std::string Hex() const {
    char buffer[17];
    std::snprintf(buffer, sizeof(buffer), "%016llx", static_cast<unsigned long long>(state_));
    return buffer;
  }

 private:
  std::uint64_t state_ = 14695981039346656037ULL;
};

void AddThresholds(Fnv1a& digest, const SameSceneThresholds& t) {
  digest.Add(t.safe_primary_max);
  digest.Add(t.borderline_primary_max);
  digest.Add(t.borderline_secondary_below);
  digest.Add(t.confirm_primary_max);
  digest.Add(t.confirm_secondary_max);
}

} // namespace

std::vector<model::GroupMembership> GroupingResult::Memberships() const {
  std::vector<model::GroupMembership> memberships;
  std::uint64_t                       next_group = 1;
  for (const auto& cluster : clusters) {
    if (cluster.size() < 2) continue;
    for (auto index : cluster) {
      memberships.push_back({canonical_ids[index], next_group});
    }
    ++next_group;
  }
  return memberships;
}

std::size_t GroupingResult::SingletonCount() const {
  return static_cast<std::size_t>(std::count_if(clusters.begin(), clusters.end(), [](const auto& c) { return c.size() == 1; }));
}

std::size_t GroupingResult::GroupCount() const {
  return clusters.size() - SingletonCount();
}

SimilarityGrouper::SimilarityGrouper(GroupingOptions options)
    : options_(std::move(options)), strategy_(MakeClusteringStrategy(options_.linkage, options_.same_scene, options_.bridge)) {
  if (options_.scan.block_rows == 0) {
    throw std::invalid_argument("grouping block_rows must be > 0");
  }
}

std::string SimilarityGrouper::Fingerprint(const std::vector<Candidate>& sorted_candidates) const {
  Fnv1a digest;
  digest.Add(model::ToString(options_.linkage));
  digest.Add(options_.require_secondary_hash ? "secondary-required" : "secondary-optional");
  digest.Add(options_.scan.block_rows);
  AddThresholds(digest, options_.same_scene);
  if (options_.linkage == model::LinkageMode::kComplete) {
    AddThresholds(digest, options_.bridge.thresholds);
  }

  digest.Add(sorted_candidates.size());
  for (const auto& candidate : sorted_candidates) {
    digest.Add(candidate.photo_id);
    digest.Add(candidate.hashes.primary.ToHex());
    digest.Add(candidate.hashes.secondary ? candidate.hashes.secondary->ToHex() : std::string("-"));
  }
  return digest.Hex();
}

GroupingResult SimilarityGrouper::Group(std::vector<Candidate> candidates, PairScanCheckpoint* checkpoint) const {
  std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) { return a.photo_id < b.photo_id; });

  for (std::size_t i = 0; i < candidates.size(); ++i) {
    if (i > 0 && candidates[i].photo_id == candidates[i - 1].photo_id) {
      throw std::invalid_argument("duplicate grouping candidate " + candidates[i].photo_id);
    }
    if (options_.require_secondary_hash && !candidates[i].hashes.secondary) {
      throw std::invalid_argument("grouping candidate " + candidates[i].photo_id + " has no secondary hash");
    }
  }

  GroupingResult result;
  result.linkage     = options_.linkage;
  result.fingerprint = Fingerprint(candidates);

  std::vector<hash::HashPair> hashes;
  hashes.reserve(candidates.size());
  result.canonical_ids.reserve(candidates.size());
  for (auto& candidate : candidates) {
    result.canonical_ids.push_back(std::move(candidate.photo_id));
    hashes.push_back(candidate.hashes);
  }

  auto strategy = strategy_;
  PairScanner scanner(options_.scan, [strategy](unsigned primary, std::optional<unsigned> secondary) { return strategy->KeepsPair(primary, secondary); });

  std::size_t first_block = 0;
  if (checkpoint) {
    auto progress = checkpoint->Load(result.fingerprint);
    first_block   = progress.next_block;
    result.pairs  = std::move(progress.pairs);
    if (first_block > 0) {
      PHOTOSIFT_LOG_INFO("Resuming pair scan", {observability::StringField("fingerprint", result.fingerprint),
                                                observability::IntField("next_block", static_cast<std::int64_t>(first_block)),
                                                observability::IntField("stored_pairs", static_cast<std::int64_t>(result.pairs.size()))});
    }
  }
  result.resumed_blocks = first_block;

  scanner.Scan(hashes, first_block, [&](std::size_t block_index, std::vector<PairDistance> pairs) {
    if (checkpoint) {
      checkpoint->StoreBlock(result.fingerprint, block_index, pairs);
    }
    result.pairs.insert(result.pairs.end(), pairs.begin(), pairs.end());
    ++result.scanned_blocks;
  });

  result.clusters = strategy_->Cluster(candidates.size(), result.pairs);

  std::vector<std::uint32_t> cluster_of(candidates.size(), 0);
  for (std::uint32_t c = 0; c < result.clusters.size(); ++c) {
    for (auto member : result.clusters[c]) {
      cluster_of[member] = c;
    }
  }
  for (const auto& pair : result.pairs) {
    if (strategy_->IsSameScene(pair) && cluster_of[pair.first] != cluster_of[pair.second]) {
      ++result.unlinked_pairs;
    }
  }

  PHOTOSIFT_LOG_DEBUG("Grouping finished", {observability::StringField("linkage", model::ToString(options_.linkage)),
                                           observability::IntField("candidates", static_cast<std::int64_t>(candidates.size())),
                                           observability::IntField("pairs", static_cast<std::int64_t>(result.pairs.size())),
                                           observability::IntField("groups", static_cast<std::int64_t>(result.GroupCount())),
                                           observability::IntField("unlinked_pairs", static_cast<std::int64_t>(result.unlinked_pairs))});
  return result;
}

} // namespace photosift::grouping
