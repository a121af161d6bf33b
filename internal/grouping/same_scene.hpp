#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace photosift::grouping {

/*
  Same-scene decision table over primary distance p and secondary distance s.

    p <= safe_primary_max                                          same scene
    p <= borderline_primary_max and s <  borderline_secondary_below same scene
    p <= confirm_primary_max    and s <= confirm_secondary_max      same scene
    anything else                                                   different

  A pair outside the safe band with no secondary distance is "different".
*/
struct SameSceneThresholds {
  unsigned safe_primary_max           = 10;
  unsigned borderline_primary_max     = 12;
  unsigned borderline_secondary_below = 22;
  unsigned confirm_primary_max        = 14;
  unsigned confirm_secondary_max      = 17;

  bool operator==(const SameSceneThresholds&) const = default;
};

// Throws std::invalid_argument when the primary bands are not ordered.
void ValidateThresholds(const SameSceneThresholds& thresholds, const std::string& label);

class SameScenePredicate {
 public:
  explicit SameScenePredicate(SameSceneThresholds thresholds);

  bool Matches(unsigned primary, std::optional<unsigned> secondary) const;

 private:
  SameSceneThresholds thresholds_;
};

} // namespace photosift::grouping
