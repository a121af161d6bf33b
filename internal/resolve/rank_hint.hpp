#pragma once

#include <cstdint>
#include <string>
#include <tuple>

#include "internal/resolve/cluster_member.hpp"

namespace photosift::resolve {

/*
  Display / tie-break ranking: resolution > file size > EXIF > path quality.

  Rules use it only to pick which concrete member to compare against; the
  comparison itself (size, resolution, distance) is the recorded evidence.
  A rejection is never justified by rank alone.
*/
struct RankHint {
  std::uint64_t resolution   = 0;
  std::uint64_t size_bytes   = 0;
  bool          has_exif     = false;
  int           path_quality = 0; // 3 Photos library, 2 iPhoto library, 1 other, 0 only previews

  auto Tie() const {
    return std::tie(resolution, size_bytes, has_exif, path_quality);
  }
  bool operator<(const RankHint& other) const {
    return Tie() < other.Tie();
  }
};

RankHint ComputeRankHint(const ClusterMember& member);

// Short "res=.. size=.. exif=.. path=.." text for the resolve debug log.
std::string DescribeRankHint(const RankHint& hint);

} // namespace photosift::resolve
