#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "internal/grouping/clustering.hpp"
#include "internal/grouping/pair_scanner.hpp"
#include "internal/hash/hash_codec.hpp"
#include "internal/model/decision.hpp"

namespace photosift::grouping {

struct GroupingOptions {
  model::LinkageMode  linkage                = model::LinkageMode::kSingle;
  bool                require_secondary_hash = true;
  PairScanOptions     scan;
  SameSceneThresholds same_scene;
  BridgeOptions       bridge;
};

struct Candidate {
  std::string    photo_id;
  hash::HashPair hashes;
};

/*
  Durable progress of the pairwise scan.

  Keyed by the scan fingerprint: a different candidate set or threshold
  table never resumes someone else's blocks.
*/
class PairScanCheckpoint {
 public:
  struct Progress {
    std::size_t               next_block = 0;
    std::vector<PairDistance> pairs;
  };

  virtual ~PairScanCheckpoint() = default;

  virtual Progress Load(const std::string& fingerprint) = 0;

  // Called once per completed block, in block order.
  virtual void StoreBlock(const std::string& fingerprint, std::size_t block_index, const std::vector<PairDistance>& pairs) = 0;
};

struct GroupingResult {
  model::LinkageMode       linkage = model::LinkageMode::kSingle;
  std::string              fingerprint;
  std::vector<std::string> canonical_ids; // canonical index -> photo id
  Clusters                 clusters;      // all clusters, singletons included
  std::vector<PairDistance> pairs;        // every stored pair
  std::size_t              resumed_blocks = 0;
  std::size_t              scanned_blocks = 0;

  // Same-scene pairs whose photos ended up in different clusters.
  std::size_t unlinked_pairs = 0;

  // Clusters of two or more, numbered 1.. in canonical order.
  std::vector<model::GroupMembership> Memberships() const;

  std::size_t SingletonCount() const;
  std::size_t GroupCount() const;
};

/*
  Partitions hashed candidates into near-duplicate clusters.

  Candidates are sorted by photo id first; that position is the canonical
  index used everywhere downstream, so neither caller order nor worker count
  can change the result.
*/
class SimilarityGrouper {
 public:
  explicit SimilarityGrouper(GroupingOptions options);

  GroupingResult Group(std::vector<Candidate> candidates, PairScanCheckpoint* checkpoint = nullptr) const;

  // Stable hex digest of (sorted candidates, thresholds, linkage, block size).
  std::string Fingerprint(const std::vector<Candidate>& sorted_candidates) const;

 private:
  GroupingOptions                          options_;
  std::shared_ptr<const ClusteringStrategy> strategy_;
};

} // namespace photosift::grouping
