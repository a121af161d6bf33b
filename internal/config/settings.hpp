#pragma once

#include <string>

#include "config/config.pb.h"
#include "internal/classify/individual_rules.hpp"
#include "internal/grouping/similarity_grouper.hpp"
#include "internal/resolve/group_rules.hpp"

namespace photosift::config {

/*
  Typed view of RuntimeConfig.

  Unset fields take the built-in defaults; the result is validated once so
  stage code never re-checks tunables.
*/
struct Settings {
  classify::IndividualRuleOptions individual_rules;
  grouping::GroupingOptions       grouping;
  resolve::GroupRuleOptions       group_rules;
};

// Throws std::runtime_error naming the offending key.
Settings SettingsFromConfig(const photosift::runtime::config::RuntimeConfig& config);

} // namespace photosift::config
