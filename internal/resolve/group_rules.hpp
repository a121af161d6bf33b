#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "internal/resolve/cluster_member.hpp"
#include "internal/resolve/member_distances.hpp"

namespace photosift::resolve {

struct GroupRuleOptions {
  unsigned thumbnail_max_distance           = 4;
  unsigned derivative_max_distance          = 2;
  double   derivative_max_area_ratio        = 0.9;
  unsigned tie_break_max_distance           = 2;
  unsigned tie_break_max_secondary_distance = 4;
};

/*
  What a group rule sees: the full cluster plus the members still alive when
  the rule starts (ascending member indices). Rules must only propose
  rejections among alive members.
*/
struct ClusterView {
  const std::vector<ClusterMember>& members;
  const MemberDistances&            distances;
  const std::vector<std::size_t>&   alive;
};

// Reject `rejected` in favor of `kept`. A rule without a concrete counterpart
// leaves kept empty.
struct RejectionProposal {
  std::size_t                rejected = 0;
  std::optional<std::size_t> kept;
};

using GroupPredicate = std::function<std::vector<RejectionProposal>(const ClusterView&)>;

struct GroupRule {
  std::string    name;
  GroupPredicate propose;
};

// THUMBNAIL .. SAME_RESOLUTION_DUPLICATE, in evaluation order.
std::vector<GroupRule> BuiltinGroupRules(const GroupRuleOptions& options);

} // namespace photosift::resolve
