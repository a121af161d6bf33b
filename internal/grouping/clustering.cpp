#include "clustering.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <queue>
#include <stdexcept>
#include <tuple>
#include <unordered_map>
#include <utility>

#include "internal/grouping/disjoint_set.hpp"

namespace photosift::grouping {
namespace {

// (primary, secondary); a missing secondary sorts after every real one
using DistanceKey = std::pair<std::uint16_t, std::uint16_t>;

constexpr std::uint16_t kNoSecondary = 0xFFFF;

DistanceKey KeyOf(const PairDistance& pair) {
  return {pair.primary, pair.secondary.value_or(kNoSecondary)};
}

std::optional<unsigned> SecondaryOf(const PairDistance& pair) {
  if (!pair.secondary) return std::nullopt;
  return static_cast<unsigned>(*pair.secondary);
}

std::uint64_t EdgeKey(std::uint32_t a, std::uint32_t b) {
  if (a > b) std::swap(a, b);
  return (static_cast<std::uint64_t>(a) << 32) | b;
}

void SortClusters(Clusters& clusters) {
  for (auto& cluster : clusters) {
    std::sort(cluster.begin(), cluster.end());
  }
  std::sort(clusters.begin(), clusters.end(), [](const auto& a, const auto& b) { return a.front() < b.front(); });
}

void CheckPairs(std::size_t candidate_count, const std::vector<PairDistance>& pairs) {
  for (const auto& pair : pairs) {
    if (pair.first >= candidate_count || pair.second >= candidate_count || pair.first == pair.second) {
      throw std::invalid_argument("pair (" + std::to_string(pair.first) + ", " + std::to_string(pair.second) + ") outside " +
                                  std::to_string(candidate_count) + " candidates");
    }
  }
}

// Largest cross distance when every cross pair is an edge, else nullopt.
std::optional<DistanceKey> CompleteDistance(const std::vector<std::uint32_t>& a, const std::vector<std::uint32_t>& b,
                                            const std::unordered_map<std::uint64_t, DistanceKey>& edges) {
  std::optional<DistanceKey> worst;
  for (auto x : a) {
    for (auto y : b) {
      auto it = edges.find(EdgeKey(x, y));
      if (it == edges.end()) {
        return std::nullopt;
      }
      if (!worst || it->second > *worst) {
        worst = it->second;
      }
    }
  }
  return worst;
}

// Priority-ordered complete linkage over one component. Cluster ids are the
// smallest member, so ties in distance break on canonical index.
Clusters CompleteLinkageCores(const std::vector<std::uint32_t>& members, const std::unordered_map<std::uint64_t, DistanceKey>& edges) {
  std::map<std::uint32_t, std::vector<std::uint32_t>> clusters;
  for (auto m : members) {
    clusters[m] = {m};
  }

  using Entry = std::tuple<DistanceKey, std::uint32_t, std::uint32_t>;
  std::priority_queue<Entry, std::vector<Entry>, std::greater<Entry>> heap;
  std::unordered_map<std::uint64_t, DistanceKey>                      cluster_distance;

  for (std::size_t i = 0; i < members.size(); ++i) {
    for (std::size_t j = i + 1; j < members.size(); ++j) {
      auto it = edges.find(EdgeKey(members[i], members[j]));
      if (it == edges.end()) continue;
      cluster_distance[it->first] = it->second;
      heap.emplace(it->second, members[i], members[j]);
    }
  }

  while (!heap.empty()) {
    const auto [distance, c1, c2] = heap.top();
    heap.pop();

    if (clusters.count(c1) == 0 || clusters.count(c2) == 0) continue;
    auto current = cluster_distance.find(EdgeKey(c1, c2));
    if (current == cluster_distance.end() || current->second != distance) continue;
    cluster_distance.erase(current);

    // c1 < c2 always, so the merged cluster keeps the smaller id
    auto& merged = clusters[c1];
    auto& absorbed = clusters[c2];
    merged.insert(merged.end(), absorbed.begin(), absorbed.end());
    std::sort(merged.begin(), merged.end());
    clusters.erase(c2);

    for (const auto& [other, other_members] : clusters) {
      if (other == c1) continue;
      cluster_distance.erase(EdgeKey(c1, other));
      cluster_distance.erase(EdgeKey(c2, other));

      if (auto linkage = CompleteDistance(merged, other_members, edges)) {
        cluster_distance[EdgeKey(c1, other)] = *linkage;
        heap.emplace(*linkage, std::min(c1, other), std::max(c1, other));
      }
    }
  }

  Clusters cores;
  cores.reserve(clusters.size());
  for (auto& [id, cluster] : clusters) {
    cores.push_back(std::move(cluster));
  }
  return cores;
}

} // namespace

// ------------------------------------------------------------
// Single linkage
// ------------------------------------------------------------

SingleLinkage::SingleLinkage(SameSceneThresholds same_scene) : same_scene_(same_scene) {
}

bool SingleLinkage::KeepsPair(unsigned primary, std::optional<unsigned> secondary) const {
  return same_scene_.Matches(primary, secondary);
}

bool SingleLinkage::IsSameScene(const PairDistance& pair) const {
  return same_scene_.Matches(pair.primary, SecondaryOf(pair));
}

Clusters SingleLinkage::Cluster(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const {
  CheckPairs(candidate_count, pairs);

  DisjointSet sets(candidate_count);
  for (const auto& pair : pairs) {
    if (IsSameScene(pair)) {
      sets.Union(pair.first, pair.second);
    }
  }
  return sets.Components();
}

// ------------------------------------------------------------
// Complete linkage + bridge merge
// ------------------------------------------------------------

CompleteLinkage::CompleteLinkage(SameSceneThresholds same_scene, BridgeOptions bridge)
    : same_scene_(same_scene), bridge_(bridge.thresholds), bridge_min_pairs_(bridge.min_pairs) {
  if (bridge_min_pairs_ == 0) {
    throw std::invalid_argument("bridge min_pairs must be >= 1");
  }
}

bool CompleteLinkage::KeepsPair(unsigned primary, std::optional<unsigned> secondary) const {
  return same_scene_.Matches(primary, secondary) || bridge_.Matches(primary, secondary);
}

bool CompleteLinkage::IsSameScene(const PairDistance& pair) const {
  return same_scene_.Matches(pair.primary, SecondaryOf(pair));
}

Clusters CompleteLinkage::Cores(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const {
  CheckPairs(candidate_count, pairs);

  std::unordered_map<std::uint64_t, DistanceKey> edges;
  DisjointSet                                    components(candidate_count);
  for (const auto& pair : pairs) {
    if (!IsSameScene(pair)) continue;
    edges[EdgeKey(pair.first, pair.second)] = KeyOf(pair);
    components.Union(pair.first, pair.second);
  }

  Clusters cores;
  for (const auto& component : components.Components()) {
    if (component.size() == 1) {
      cores.push_back(component);
      continue;
    }
    auto component_cores = CompleteLinkageCores(component, edges);
    cores.insert(cores.end(), std::make_move_iterator(component_cores.begin()), std::make_move_iterator(component_cores.end()));
  }

  SortClusters(cores);
  return cores;
}

Clusters CompleteLinkage::Cluster(std::size_t candidate_count, const std::vector<PairDistance>& pairs) const {
  Clusters cores = Cores(candidate_count, pairs);

  std::vector<std::uint32_t> core_of(candidate_count, 0);
  for (std::uint32_t c = 0; c < cores.size(); ++c) {
    for (auto member : cores[c]) {
      core_of[member] = c;
    }
  }

  // qualifying cross pairs per core pair
  std::map<std::uint64_t, std::size_t> cross_pairs;
  for (const auto& pair : pairs) {
    const auto a = core_of[pair.first];
    const auto b = core_of[pair.second];
    if (a == b) continue;
    if (!bridge_.Matches(pair.primary, SecondaryOf(pair))) continue;
    ++cross_pairs[EdgeKey(a, b)];
  }

  DisjointSet bridged(cores.size());
  for (const auto& [key, count] : cross_pairs) {
    if (count >= bridge_min_pairs_) {
      bridged.Union(static_cast<std::uint32_t>(key >> 32), static_cast<std::uint32_t>(key & 0xFFFFFFFFu));
    }
  }

  Clusters clusters;
  for (const auto& joined : bridged.Components()) {
    std::vector<std::uint32_t> members;
    for (auto core : joined) {
      members.insert(members.end(), cores[core].begin(), cores[core].end());
    }
    clusters.push_back(std::move(members));
  }

  SortClusters(clusters);
  return clusters;
}

std::unique_ptr<ClusteringStrategy> MakeClusteringStrategy(model::LinkageMode mode, const SameSceneThresholds& same_scene, const BridgeOptions& bridge) {
  switch (mode) {
    case model::LinkageMode::kSingle:
      return std::make_unique<SingleLinkage>(same_scene);
    case model::LinkageMode::kComplete:
      return std::make_unique<CompleteLinkage>(same_scene, bridge);
  }
  throw std::invalid_argument("unknown linkage mode");
}

} // namespace photosift::grouping
