#include "same_scene.hpp"

#include <stdexcept>

namespace photosift::grouping {

void ValidateThresholds(const SameSceneThresholds& t, const std::string& label) {
  if (t.safe_primary_max > t.borderline_primary_max || t.borderline_primary_max > t.confirm_primary_max) {
    throw std::invalid_argument(label + ": primary bands must satisfy safe <= borderline <= confirm (got " + std::to_string(t.safe_primary_max) +
                                ", " + std::to_string(t.borderline_primary_max) + ", " + std::to_string(t.confirm_primary_max) + ")");
  }
}

SameScenePredicate::SameScenePredicate(SameSceneThresholds thresholds) : thresholds_(thresholds) {
  ValidateThresholds(thresholds_, "same-scene thresholds");
}

bool SameScenePredicate::Matches(unsigned primary, std::optional<unsigned> secondary) const {
  if (primary <= thresholds_.safe_primary_max) {
    return true;
  }
  if (!secondary.has_value()) {
    return false;
  }
  if (primary <= thresholds_.borderline_primary_max) {
    return *secondary < thresholds_.borderline_secondary_below;
  }
  if (primary <= thresholds_.confirm_primary_max) {
    return *secondary <= thresholds_.confirm_secondary_max;
  }
  return false;
}

} // namespace photosift::grouping
