#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace photosift::db::model {

/*
  One stored pair of the resumable pairwise scan.

  Indices are canonical candidate positions for the scan identified by
  fingerprint; they mean nothing under another fingerprint.
*/
struct ScanPairRecord {
  std::uint64_t                block_index = 0;
  std::uint32_t                first       = 0;
  std::uint32_t                second      = 0;
  std::uint16_t                primary     = 0;
  std::optional<std::uint16_t> secondary;
};

// Progress marker: every block below next_block is stored.
struct ScanCheckpointRecord {
  std::string   fingerprint;
  std::uint64_t next_block    = 0;
  std::uint64_t updated_at_ms = 0;
};

} // namespace photosift::db::model
