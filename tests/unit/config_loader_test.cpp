#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "internal/config/settings.hpp"

namespace {

using photosift::config::ConfigLoader;
using photosift::config::SettingsFromConfig;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "photosift_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool SettingsRejected(const std::string& yaml) {
  try {
    (void)SettingsFromConfig(ConfigLoader::LoadFromString(yaml));
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(database:
  sqlite:
    path: "C:\\recovered\\\"disk 2\"\\photos.db"
individual_rules:
  reject_path_substrings:
    - "12345"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\recovered\\\"disk 2\"\\photos.db");
  // quoted numbers stay strings
  assert(config.individual_rules().reject_path_substrings_size() == 1);
  assert(config.individual_rules().reject_path_substrings(0) == "12345");
}

void TestPlainWordsStayStrings() {
  auto config = ConfigLoader::LoadFromString(R"(individual_rules:
  reject_path_substrings:
    - inf
    - nan
)");
  assert(config.individual_rules().reject_path_substrings_size() == 2);
  assert(config.individual_rules().reject_path_substrings(0) == "inf");
  assert(config.individual_rules().reject_path_substrings(1) == "nan");
}

void TestErrorsNameTheSource() {
  const auto yaml_path = WriteYaml("bad_type", "grouping:\n  linkage: [single]\n");
  std::string message;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error& e) {
    message = e.what();
  }
  assert(message.find(yaml_path.string()) != std::string::npos);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(database:
  sqlite:
    path: "/tmp/photos.db"
grouping:
  linkage: "single"
  neighbours: 3
)");

  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml((std::filesystem::temp_directory_path() / "photosift_config_loader_tests" / "absent.yaml").string());
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyDocumentGivesDefaults() {
  const auto config   = ConfigLoader::LoadFromString("");
  const auto settings = SettingsFromConfig(config);

  assert(!config.database().has_sqlite());
  assert(settings.individual_rules.tiny_area_min_pixels == 5000);
  assert(settings.individual_rules.reject_path_substrings.empty());
  assert(settings.grouping.linkage == photosift::model::LinkageMode::kSingle);
  assert(settings.grouping.require_secondary_hash);
  assert(settings.grouping.same_scene.safe_primary_max == 10);
  assert(settings.grouping.same_scene.confirm_secondary_max == 17);
  assert(settings.grouping.bridge.min_pairs == 50);
  assert(settings.grouping.bridge.thresholds == settings.grouping.same_scene);
  assert(settings.group_rules.thumbnail_max_distance == 4);
  assert(settings.group_rules.derivative_max_area_ratio == 0.9);
}

void TestOverridesAreApplied() {
  const auto settings = SettingsFromConfig(ConfigLoader::LoadFromString(R"(individual_rules:
  tiny_area_min_pixels: 9000
  separate_path_substrings:
    - "/tor/Pictures/2013/03/03/"
grouping:
  linkage: "complete"
  require_secondary_hash: false
  workers: 2
  block_rows: 64
  same_scene:
    safe_primary_max: 8
  bridge:
    min_pairs: 3
    thresholds:
      confirm_secondary_max: 12
group_rules:
  derivative_max_area_ratio: 0.75
  tie_break_max_secondary_distance: 6
)"));

  assert(settings.individual_rules.tiny_area_min_pixels == 9000);
  assert(settings.individual_rules.separate_path_substrings.size() == 1);
  assert(settings.grouping.linkage == photosift::model::LinkageMode::kComplete);
  assert(!settings.grouping.require_secondary_hash);
  assert(settings.grouping.scan.workers == 2);
  assert(settings.grouping.scan.block_rows == 64);
  assert(settings.grouping.same_scene.safe_primary_max == 8);
  assert(settings.grouping.same_scene.borderline_primary_max == 12);
  // bridge starts from the effective same-scene table
  assert(settings.grouping.bridge.min_pairs == 3);
  assert(settings.grouping.bridge.thresholds.safe_primary_max == 8);
  assert(settings.grouping.bridge.thresholds.confirm_secondary_max == 12);
  assert(settings.group_rules.derivative_max_area_ratio == 0.75);
  assert(settings.group_rules.tie_break_max_secondary_distance == 6);
}

void TestInvalidValuesAreRejected() {
  assert(SettingsRejected("grouping:\n  linkage: \"average\"\n"));
  assert(SettingsRejected("grouping:\n  block_rows: 0\n"));
  assert(SettingsRejected("grouping:\n  bridge:\n    min_pairs: 0\n"));
  assert(SettingsRejected("grouping:\n  same_scene:\n    safe_primary_max: 13\n    borderline_primary_max: 12\n"));
  assert(SettingsRejected("grouping:\n  bridge:\n    thresholds:\n      confirm_primary_max: 11\n"));
  assert(SettingsRejected("group_rules:\n  derivative_max_area_ratio: 1.5\n"));
  assert(SettingsRejected("group_rules:\n  derivative_max_area_ratio: 0\n"));
  assert(SettingsRejected("individual_rules:\n  reject_path_substrings:\n    - \"\"\n"));
  assert(!SettingsRejected("group_rules:\n  derivative_max_area_ratio: 1.0\n"));
}

void TestExampleConfigLoads() {
  const auto config   = ConfigLoader::LoadFromYaml(PHOTOSIFT_EXAMPLE_CONFIG);
  const auto settings = SettingsFromConfig(config);
  assert(config.database().sqlite().path() == "output/photos.db");
  assert(config.logging().level() == "info");
  assert(settings.grouping.scan.workers == 4);
  assert(settings.individual_rules.separate_path_substrings.size() == 1);
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestUnknownFieldsAreRejected();
  TestPlainWordsStayStrings();
  TestErrorsNameTheSource();
  TestMissingFileIsReported();
  TestEmptyDocumentGivesDefaults();
  TestOverridesAreApplied();
  TestInvalidValuesAreRejected();
  TestExampleConfigLoads();

  std::cout << "photosift_unit_config_loader: pass\n";
  return 0;
}
