#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "internal/grouping/pair_scanner.hpp"
#include "internal/grouping/same_scene.hpp"
#include "internal/model/decision.hpp"

namespace photosift::grouping {

using Clusters = std::vector<std::vector<std::uint32_t>>;

struct BridgeOptions {
  std::size_t         min_pairs = 50;
  SameSceneThresholds thresholds;
};

/*
  Turns the stored pair list into a partition of candidate indices.

  Output clusters hold sorted canonical indices and are ordered by their
  smallest member; every candidate appears exactly once (singletons
  included).
*/
class ClusteringStrategy {
 public:
  virtual ~ClusteringStrategy() = default;

  virtual model::LinkageMode Mode() const = 0;

  // Which compared pairs the scan has to keep for this strategy.
  virtual bool KeepsPair(unsigned primary, std::optional<unsigned> secondary) const = 0;

  // True when the pair is a same-scene edge (as opposed to bridge-only).
  virtual bool IsSameScene(const PairDistance& pair) const = 0;

  virtual Clusters Cluster(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const = 0;
};

/*
  Connected components over same-scene edges.
*/
class SingleLinkage final : public ClusteringStrategy {
 public:
  explicit SingleLinkage(SameSceneThresholds same_scene);

  model::LinkageMode Mode() const override {
    return model::LinkageMode::kSingle;
  }
  bool     KeepsPair(unsigned primary, std::optional<unsigned> secondary) const override;
  bool     IsSameScene(const PairDistance& pair) const override;
  Clusters Cluster(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const override;

 private:
  SameScenePredicate same_scene_;
};

/*
  Complete-linkage cores plus bridge merge.

  Inside each same-scene component, clusters merge lowest (p, s) first and
  only while every cross pair is a same-scene edge. Cores are then joined
  (transitively) when at least bridge.min_pairs cross pairs satisfy the
  bridge thresholds.
*/
class CompleteLinkage final : public ClusteringStrategy {
 public:
  CompleteLinkage(SameSceneThresholds same_scene, BridgeOptions bridge);

  model::LinkageMode Mode() const override {
    return model::LinkageMode::kComplete;
  }
  bool     KeepsPair(unsigned primary, std::optional<unsigned> secondary) const override;
  bool     IsSameScene(const PairDistance& pair) const override;
  Clusters Cluster(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const override;

  // Core formation alone (no bridge merge).
  Clusters Cores(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const;

 private:
  SameScenePredicate same_scene_;
  SameScenePredicate bridge_;
  std::size_t        bridge_min_pairs_;
};

std::unique_ptr<ClusteringStrategy> MakeClusteringStrategy(model::LinkageMode mode, const SameSceneThresholds& same_scene, const BridgeOptions& bridge);

} // namespace photosift::grouping
