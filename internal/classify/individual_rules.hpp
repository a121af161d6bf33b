#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "internal/classify/sibling_probe.hpp"
#include "internal/model/decision.hpp"
#include "internal/model/photo.hpp"

namespace photosift::classify {

struct IndividualRuleOptions {
  std::uint64_t            tiny_area_min_pixels = 5000;
  std::vector<std::string> reject_path_substrings;
  std::vector<std::string> separate_path_substrings;
};

using IndividualPredicate = std::function<bool(const model::Photo&, const std::vector<model::PhotoPath>&)>;

/*
  One entry of an ordered rule list. Built once at startup; the list order is
  the evaluation order.
*/
struct IndividualRule {
  std::string         name;
  model::Decision     decision = model::Decision::kReject;
  IndividualPredicate matches;
};

// TINY_AREA .. CUSTOM_PATH_REJECT, in evaluation order.
std::vector<IndividualRule> BuiltinRejectionRules(const IndividualRuleOptions& options, std::shared_ptr<const SiblingProbe> probe);

// PHOTOBOOTH, SEPARATE_PATH.
std::vector<IndividualRule> BuiltinSeparationRules(const IndividualRuleOptions& options);

} // namespace photosift::classify
