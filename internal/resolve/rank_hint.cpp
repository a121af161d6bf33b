#include "rank_hint.hpp"

#include <algorithm>

#include "internal/resolve/path_markers.hpp"

namespace photosift::resolve {

RankHint ComputeRankHint(const ClusterMember& member) {
  RankHint hint;
  hint.resolution = member.photo.Area().value_or(0);
  hint.size_bytes = member.photo.size_bytes;
  hint.has_exif   = member.photo.has_exif;

  for (const auto& path : member.paths) {
    if (IsThumbnailPath(path) || IsPreviewsPath(path.source_path)) {
      continue;
    }
    if (IsPhotosLibrary(path.source_path)) {
      hint.path_quality = 3;
    } else if (IsIPhotoLibrary(path.source_path)) {
      hint.path_quality = std::max(hint.path_quality, 2);
    } else {
      hint.path_quality = std::max(hint.path_quality, 1);
    }
  }
  return hint;
}

std::string DescribeRankHint(const RankHint& hint) {
  return "res=" + std::to_string(hint.resolution) + " size=" + std::to_string(hint.size_bytes) + " exif=" + (hint.has_exif ? "1" : "0") +
         " path=" + std::to_string(hint.path_quality);
}

} // namespace photosift::resolve
