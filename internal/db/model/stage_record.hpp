#pragma once

#include <cstdint>
#include <string>

namespace photosift::db::model {

/*
  Run metadata: one row per completed stage run (history, newest last).
*/
struct StageRecord {
  std::string   stage;            // "classify", "group", "resolve", "import-hashes"
  std::uint64_t completed_at_ms = 0;
  std::uint64_t count           = 0; // decisions / groups / rejections / hashes written
  std::string   linkage;          // active linkage mode for "group", empty otherwise
  std::string   notes;
};

} // namespace photosift::db::model
