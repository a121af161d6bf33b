#pragma once

#include <memory>
#include <optional>
#include <vector>

#include "internal/classify/individual_rules.hpp"

namespace photosift::classify {

/*
  Judges one photo on its own properties.

  Rejection rules are tried first, in list order, then separation rules; the
  first match wins. No match means no decision (the photo moves on to
  grouping). Rules only see the photo and its own paths, so a decision never
  depends on which other photos were classified before it.

  A rule that throws is a bug, not a "no match": the exception is wrapped in
  util::RuleEvaluationError and propagated.
*/
class IndividualClassifier {
 public:
  IndividualClassifier(std::vector<IndividualRule> rejection_rules, std::vector<IndividualRule> separation_rules);

  static IndividualClassifier WithBuiltinRules(const IndividualRuleOptions& options, std::shared_ptr<const SiblingProbe> probe);

  std::optional<model::IndividualDecision> Classify(const model::Photo& photo, const std::vector<model::PhotoPath>& paths) const;

  const std::vector<IndividualRule>& rejection_rules() const {
    return rejection_rules_;
  }
  const std::vector<IndividualRule>& separation_rules() const {
    return separation_rules_;
  }

 private:
  std::vector<IndividualRule> rejection_rules_;
  std::vector<IndividualRule> separation_rules_;
};

} // namespace photosift::classify
