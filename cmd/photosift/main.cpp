#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/classify/sibling_probe.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/core/pipeline.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

using photosift::core::Pipeline;

static void Usage() {
  std::cerr << "Usage:\n"
            << "  photosift [--config <file.yaml>] classify [--clear]\n"
            << "  photosift [--config <file.yaml>] group [--clear]\n"
            << "  photosift [--config <file.yaml>] resolve\n"
            << "  photosift [--config <file.yaml>] run [--clear]\n"
            << "  photosift [--config <file.yaml>] import-hashes <other.db>\n"
            << "  photosift [--config <file.yaml>] status\n";
}

static void PrintCounts(const std::string& title, const std::map<std::string, std::size_t>& counts) {
  if (counts.empty()) return;
  std::cout << title << "\n";
  for (const auto& [name, count] : counts) {
    std::cout << "  " << name << ": " << count << "\n";
  }
}

static void Print(const photosift::core::ClassifySummary& s) {
  std::cout << "classify: examined=" << s.examined << " rejected=" << s.rejected << " separated=" << s.separated << " undecided=" << s.undecided << "\n";
  PrintCounts("by rule:", s.by_rule);
}

static void Print(const photosift::core::GroupSummary& s) {
  std::cout << "group: linkage=" << photosift::model::ToString(s.linkage) << " candidates=" << s.candidates << " groups=" << s.groups
            << " grouped_photos=" << s.grouped_photos << " singletons=" << s.singletons << " skipped_unhashed=" << s.skipped_unhashed
            << " resumed_blocks=" << s.resumed_blocks << " scanned_blocks=" << s.scanned_blocks << "\n";
  if (s.off_width > 0) {
    std::cout << "  hashes of unexpected width: " << s.off_width << "\n";
  }
  if (s.linkage == photosift::model::LinkageMode::kComplete) {
    std::cout << "  unlinked same-scene pairs: " << s.unlinked_pairs << "\n";
  }
  if (!s.size_distribution.empty()) {
    std::cout << "group sizes:\n";
    for (const auto& [size, count] : s.size_distribution) {
      std::cout << "  " << size << ": " << count << "\n";
    }
  }
}

static void Print(const photosift::core::ResolveSummary& s) {
  std::cout << "resolve: groups=" << s.groups << " rejected=" << s.rejected << " kept=" << s.kept << " halted_groups=" << s.halted_groups
            << " aggregated_paths=" << s.aggregated_paths << "\n";
  PrintCounts("by rule:", s.by_rule);
}

static void Print(const photosift::core::ImportSummary& s) {
  std::cout << "import-hashes: imported=" << s.imported << " already_hashed=" << s.already_hashed << " unknown_photos=" << s.unknown_photos
            << " source_unhashed=" << s.source_unhashed << " off_width=" << s.off_width << "\n";
}

static void Print(const photosift::core::StatusReport& r) {
  std::cout << "photos: " << r.photos << " (hashed " << r.hashed << ")\n"
            << "individual: rejected=" << r.rejected << " separated=" << r.separated << "\n";
  PrintCounts("decisions:", r.decisions_by_rule);
  std::cout << "groups: " << r.groups << " (" << r.grouped_photos << " photos)\n"
            << "group rejections: " << r.group_rejected << "\n";
  PrintCounts("group rejections by rule:", r.group_rejections_by_rule);
  std::cout << "aggregated paths: " << r.aggregated_paths << "\n";

  if (!r.history.empty()) {
    std::cout << "history:\n";
    for (const auto& stage : r.history) {
      std::cout << "  " << photosift::util::FormatUtc(stage.completed_at_ms) << " " << stage.stage << " count=" << stage.count;
      if (!stage.linkage.empty()) std::cout << " linkage=" << stage.linkage;
      if (!stage.notes.empty()) std::cout << " " << stage.notes;
      std::cout << "\n";
    }
  }
}

int main(int argc, char** argv) {
  std::string              config_path;
  std::vector<std::string> args;
  bool                     clear = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config") {
      if (i + 1 >= argc) {
        Usage();
        return 1;
      }
      config_path = argv[++i];
    } else if (arg == "--clear") {
      clear = true;
    } else {
      args.push_back(arg);
    }
  }

  if (args.empty()) {
    Usage();
    return 1;
  }

  const std::string cmd = args[0];
  if (cmd == "import-hashes" ? args.size() != 2 : args.size() != 1) {
    Usage();
    return 1;
  }
  if (clear && cmd != "classify" && cmd != "group" && cmd != "run") {
    Usage();
    return 1;
  }
  if (cmd != "classify" && cmd != "group" && cmd != "resolve" && cmd != "run" && cmd != "import-hashes" && cmd != "status") {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = config_path.empty() ? photosift::config::ConfigLoader::LoadFromString("") : photosift::config::ConfigLoader::LoadFromYaml(config_path);

    photosift::observability::InitializeLogging(config);

    auto settings = photosift::config::SettingsFromConfig(config);

    // ------------------------------------------------------------
    // Build pipeline
    // ------------------------------------------------------------
    auto     repository = photosift::factory::BuildRepository(config);
    Pipeline pipeline(repository, settings, std::make_shared<photosift::classify::FilesystemProbe>());

    if (cmd == "classify") {
      Print(pipeline.Classify(clear));
    } else if (cmd == "group") {
      Print(pipeline.Group(clear));
    } else if (cmd == "resolve") {
      Print(pipeline.Resolve());
    } else if (cmd == "run") {
      auto summary = pipeline.Run(clear);
      Print(summary.classify);
      Print(summary.group);
      Print(summary.resolve);
    } else if (cmd == "import-hashes") {
#if PHOTOSIFT_DB_SQLITE
      auto source = photosift::factory::OpenSqliteSource(args[1]);
      Print(pipeline.ImportHashes(*source));
#else
      throw std::runtime_error("import-hashes needs the sqlite backend");
#endif
    } else {
      Print(pipeline.Status());
    }

    photosift::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    PHOTOSIFT_LOG_ERROR("Fatal error", {photosift::observability::StringField("command", cmd), photosift::observability::StringField("error", e.what())});
    photosift::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
