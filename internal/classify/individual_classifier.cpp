#include "individual_classifier.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace photosift::classify {
namespace {

void RequireDecision(const std::vector<IndividualRule>& rules, model::Decision expected, const char* list_name) {
  for (const auto& rule : rules) {
    if (rule.decision != expected) {
      throw std::invalid_argument(std::string("rule ") + rule.name + " does not belong in the " + list_name + " list");
    }
    if (!rule.matches) {
      throw std::invalid_argument("rule " + rule.name + " has no predicate");
    }
  }
}

std::optional<model::IndividualDecision> FirstMatch(const std::vector<IndividualRule>& rules, const model::Photo& photo,
                                                    const std::vector<model::PhotoPath>& paths) {
  for (const auto& rule : rules) {
    bool matched = false;
    try {
      matched = rule.matches(photo, paths);
    } catch (const std::exception& e) {
      throw util::RuleEvaluationError(rule.name, photo.id, e.what());
    }
    if (matched) {
      return model::IndividualDecision{photo.id, rule.decision, rule.name};
    }
  }
  return std::nullopt;
}

} // namespace

IndividualClassifier::IndividualClassifier(std::vector<IndividualRule> rejection_rules, std::vector<IndividualRule> separation_rules)
    : rejection_rules_(std::move(rejection_rules)), separation_rules_(std::move(separation_rules)) {
  RequireDecision(rejection_rules_, model::Decision::kReject, "rejection");
  RequireDecision(separation_rules_, model::Decision::kSeparate, "separation");
}

IndividualClassifier IndividualClassifier::WithBuiltinRules(const IndividualRuleOptions& options, std::shared_ptr<const SiblingProbe> probe) {
  return IndividualClassifier(BuiltinRejectionRules(options, std::move(probe)), BuiltinSeparationRules(options));
}

std::optional<model::IndividualDecision> IndividualClassifier::Classify(const model::Photo&                  photo,
                                                                        const std::vector<model::PhotoPath>& paths) const {
  if (auto rejected = FirstMatch(rejection_rules_, photo, paths)) {
    return rejected;
  }
  return FirstMatch(separation_rules_, photo, paths);
}

} // namespace photosift::classify
