#include "group_rule_engine.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/resolve/cluster_ledger.hpp"
#include "internal/util/errors.hpp"

namespace photosift::resolve {

GroupRuleEngine::GroupRuleEngine(std::vector<GroupRule> rules) : rules_(std::move(rules)) {
  for (const auto& rule : rules_) {
    if (!rule.propose) {
      throw std::invalid_argument("group rule " + rule.name + " has no predicate");
    }
  }
}

GroupRuleEngine GroupRuleEngine::WithBuiltinRules(const GroupRuleOptions& options) {
  return GroupRuleEngine(BuiltinGroupRules(options));
}

ClusterOutcome GroupRuleEngine::Resolve(std::uint64_t group_id, const std::vector<ClusterMember>& members) const {
  const MemberDistances distances(members);
  ClusterLedger         ledger("group " + std::to_string(group_id), members.size());
  ClusterOutcome        outcome;

  for (const auto& rule : rules_) {
    if (members.size() < 2 || outcome.halted) {
      break;
    }

    const auto                     alive = ledger.Survivors();
    const ClusterView              view{members, distances, alive};
    std::vector<RejectionProposal> proposals;
    try {
      proposals = rule.propose(view);
    } catch (const std::exception& e) {
      throw util::RuleEvaluationError(rule.name, members.front().photo.id, e.what());
    }

    for (const auto& proposal : proposals) {
      if (proposal.rejected >= members.size() || (proposal.kept && (*proposal.kept >= members.size() || *proposal.kept == proposal.rejected))) {
        throw util::RuleEvaluationError(rule.name, members.front().photo.id, "proposal names a member outside the cluster or itself");
      }

      if (!ledger.IsAlive(proposal.rejected)) continue;
      // counterpart already rejected (earlier rule, or earlier in this one)
      if (proposal.kept && !ledger.IsAlive(*proposal.kept)) continue;

      if (ledger.SurvivorCount() == 1) {
        PHOTOSIFT_LOG_WARN("Group rule would reject last survivor; halting group",
                           {observability::IntField("group_id", static_cast<std::int64_t>(group_id)), observability::StringField("rule", rule.name),
                            observability::StringField("photo_id", members[proposal.rejected].photo.id)});
        outcome.halted    = true;
        outcome.halted_by = rule.name;
        break;
      }

      ledger.Reject(proposal.rejected);
      outcome.rejections.push_back({proposal.rejected, proposal.kept, rule.name});
    }
  }

  outcome.survivors = ledger.Survivors();
  return outcome;
}

} // namespace photosift::resolve
