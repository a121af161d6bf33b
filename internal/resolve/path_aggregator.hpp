#pragma once

#include <vector>

#include "internal/model/decision.hpp"
#include "internal/resolve/cluster_member.hpp"
#include "internal/resolve/group_rule_engine.hpp"

namespace photosift::resolve {

/*
  Moves the provenance of rejected members onto survivors.

  Rejections are replayed in order. Each rejected member hands its own paths,
  plus anything already aggregated onto it, to the counterpart its rule named
  if that counterpart is still alive, otherwise to the first alive member in
  canonical order. Every path therefore ends on a final survivor and keeps
  the id of the photo it was observed for.
*/
class PathAggregator {
 public:
  static std::vector<model::AggregatedPath> Aggregate(const std::vector<ClusterMember>& members, const ClusterOutcome& outcome);
};

} // namespace photosift::resolve
