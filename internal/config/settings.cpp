#include "settings.hpp"

#include <stdexcept>

#include "internal/model/decision.hpp"

namespace photosift::config {

namespace {

using photosift::runtime::config::SameSceneConfig;

grouping::SameSceneThresholds ThresholdsFrom(const SameSceneConfig& cfg, grouping::SameSceneThresholds base) {
  if (cfg.has_safe_primary_max()) base.safe_primary_max = cfg.safe_primary_max();
  if (cfg.has_borderline_primary_max()) base.borderline_primary_max = cfg.borderline_primary_max();
  if (cfg.has_borderline_secondary_below()) base.borderline_secondary_below = cfg.borderline_secondary_below();
  if (cfg.has_confirm_primary_max()) base.confirm_primary_max = cfg.confirm_primary_max();
  if (cfg.has_confirm_secondary_max()) base.confirm_secondary_max = cfg.confirm_secondary_max();
  return base;
}

void CheckThresholds(const grouping::SameSceneThresholds& thresholds, const std::string& key) {
  try {
    grouping::ValidateThresholds(thresholds, key);
  } catch (const std::invalid_argument& e) {
    throw std::runtime_error(std::string("invalid config: ") + e.what());
  }
}

} // namespace

Settings SettingsFromConfig(const photosift::runtime::config::RuntimeConfig& config) {
  Settings settings;

  // ------------------------------------------------------------------
  // individual_rules
  // ------------------------------------------------------------------
  const auto& individual = config.individual_rules();
  if (individual.has_tiny_area_min_pixels()) {
    settings.individual_rules.tiny_area_min_pixels = individual.tiny_area_min_pixels();
  }
  settings.individual_rules.reject_path_substrings.assign(individual.reject_path_substrings().begin(), individual.reject_path_substrings().end());
  settings.individual_rules.separate_path_substrings.assign(individual.separate_path_substrings().begin(), individual.separate_path_substrings().end());

  for (const auto& needle : settings.individual_rules.reject_path_substrings) {
    if (needle.empty()) throw std::runtime_error("invalid config: individual_rules.reject_path_substrings contains an empty entry");
  }
  for (const auto& needle : settings.individual_rules.separate_path_substrings) {
    if (needle.empty()) throw std::runtime_error("invalid config: individual_rules.separate_path_substrings contains an empty entry");
  }

  // ------------------------------------------------------------------
  // grouping
  // ------------------------------------------------------------------
  const auto& grouping_cfg = config.grouping();
  auto&       grouping     = settings.grouping;

  if (!grouping_cfg.linkage().empty()) {
    auto linkage = model::LinkageModeFromString(grouping_cfg.linkage());
    if (!linkage) {
      throw std::runtime_error("invalid config: grouping.linkage must be 'single' or 'complete', got '" + grouping_cfg.linkage() + "'");
    }
    grouping.linkage = *linkage;
  }

  if (grouping_cfg.has_require_secondary_hash()) grouping.require_secondary_hash = grouping_cfg.require_secondary_hash();
  if (grouping_cfg.has_workers()) grouping.scan.workers = grouping_cfg.workers();
  if (grouping_cfg.has_block_rows()) {
    if (grouping_cfg.block_rows() == 0) throw std::runtime_error("invalid config: grouping.block_rows must be > 0");
    grouping.scan.block_rows = grouping_cfg.block_rows();
  }

  grouping.same_scene = ThresholdsFrom(grouping_cfg.same_scene(), grouping::SameSceneThresholds{});
  CheckThresholds(grouping.same_scene, "grouping.same_scene");

  // bridge thresholds default to the effective same-scene table
  grouping.bridge.thresholds = ThresholdsFrom(grouping_cfg.bridge().thresholds(), grouping.same_scene);
  CheckThresholds(grouping.bridge.thresholds, "grouping.bridge.thresholds");

  if (grouping_cfg.bridge().has_min_pairs()) {
    if (grouping_cfg.bridge().min_pairs() == 0) throw std::runtime_error("invalid config: grouping.bridge.min_pairs must be >= 1");
    grouping.bridge.min_pairs = grouping_cfg.bridge().min_pairs();
  }

  // ------------------------------------------------------------------
  // group_rules
  // ------------------------------------------------------------------
  const auto& rules_cfg = config.group_rules();
  auto&       rules     = settings.group_rules;

  if (rules_cfg.has_thumbnail_max_distance()) rules.thumbnail_max_distance = rules_cfg.thumbnail_max_distance();
  if (rules_cfg.has_derivative_max_distance()) rules.derivative_max_distance = rules_cfg.derivative_max_distance();
  if (rules_cfg.has_tie_break_max_distance()) rules.tie_break_max_distance = rules_cfg.tie_break_max_distance();
  if (rules_cfg.has_tie_break_max_secondary_distance()) rules.tie_break_max_secondary_distance = rules_cfg.tie_break_max_secondary_distance();
  if (rules_cfg.has_derivative_max_area_ratio()) {
    const double ratio = rules_cfg.derivative_max_area_ratio();
    if (!(ratio > 0.0 && ratio <= 1.0)) {
      throw std::runtime_error("invalid config: group_rules.derivative_max_area_ratio must be in (0, 1]");
    }
    rules.derivative_max_area_ratio = ratio;
  }

  return settings;
}

} // namespace photosift::config
