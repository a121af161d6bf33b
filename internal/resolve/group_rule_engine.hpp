#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/resolve/group_rules.hpp"

namespace photosift::resolve {

struct MemberRejection {
  std::size_t                member = 0;
  std::optional<std::size_t> kept;
  std::string                rule_name;
};

struct ClusterOutcome {
  std::vector<MemberRejection> rejections; // in the order they were applied
  std::vector<std::size_t>     survivors;
  bool                         halted = false;
  std::string                  halted_by; // rule whose proposal hit the last survivor
};

/*
  Applies the ordered group rules to one cluster.

  Each rule sees only members no earlier rule rejected. Within a rule,
  proposals are applied in order; a proposal is dropped when its member is
  already gone or its named counterpart no longer survives. A proposal that
  would remove the last survivor halts the cluster (warning, outcome.halted).
*/
class GroupRuleEngine {
 public:
  explicit GroupRuleEngine(std::vector<GroupRule> rules);

  static GroupRuleEngine WithBuiltinRules(const GroupRuleOptions& options);

  // members must be in canonical order; group_id is only used for messages.
  ClusterOutcome Resolve(std::uint64_t group_id, const std::vector<ClusterMember>& members) const;

  const std::vector<GroupRule>& rules() const {
    return rules_;
  }

 private:
  std::vector<GroupRule> rules_;
};

} // namespace photosift::resolve
