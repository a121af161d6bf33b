#include "group_rules.hpp"

#include <algorithm>
#include <map>

#include "internal/resolve/path_markers.hpp"
#include "internal/resolve/rank_hint.hpp"
#include "internal/util/path_text.hpp"

namespace photosift::resolve {
namespace {

using Indices = std::vector<std::size_t>;

template <typename Pred>
bool AnyPath(const ClusterMember& member, Pred pred) {
  return std::any_of(member.paths.begin(), member.paths.end(), pred);
}

// Splits alive members by a per-member test, preserving index order.
template <typename Pred>
std::pair<Indices, Indices> Partition(const ClusterView& view, Pred pred) {
  Indices matching;
  Indices rest;
  for (auto index : view.alive) {
    (pred(view.members[index]) ? matching : rest).push_back(index);
  }
  return {std::move(matching), std::move(rest)};
}

// Highest rank hint; ties go to the lower member index.
std::size_t BestByRank(const ClusterView& view, const Indices& candidates) {
  std::size_t best      = candidates.front();
  RankHint    best_hint = ComputeRankHint(view.members[best]);
  for (std::size_t k = 1; k < candidates.size(); ++k) {
    auto hint = ComputeRankHint(view.members[candidates[k]]);
    if (best_hint < hint) {
      best      = candidates[k];
      best_hint = hint;
    }
  }
  return best;
}

std::optional<std::uint64_t> Resolution(const ClusterView& view, std::size_t index) {
  return view.members[index].photo.Area();
}

// Largest known resolution; ties broken by rank hint, then index.
std::optional<std::size_t> LargestByResolution(const ClusterView& view, const Indices& candidates) {
  std::optional<std::size_t> best;
  for (auto index : candidates) {
    const auto area = Resolution(view, index);
    if (!area) continue;
    if (!best) {
      best = index;
      continue;
    }
    const auto best_area = *Resolution(view, *best);
    if (*area > best_area || (*area == best_area && ComputeRankHint(view.members[*best]) < ComputeRankHint(view.members[index]))) {
      best = index;
    }
  }
  return best;
}

bool WithinPrimary(const ClusterView& view, std::size_t a, std::size_t b, unsigned max_distance) {
  const auto distance = view.distances.Primary(a, b);
  return distance.has_value() && *distance <= max_distance;
}

bool SameFileName(const ClusterMember& a, const ClusterMember& b) {
  for (const auto& pa : a.paths) {
    const auto name_a = util::ToLower(FileNameOf(pa));
    for (const auto& pb : b.paths) {
      if (name_a == util::ToLower(FileNameOf(pb))) return true;
    }
  }
  return false;
}

bool HasCameraGeneratedName(const ClusterMember& member) {
  return !member.paths.empty() &&
         std::all_of(member.paths.begin(), member.paths.end(), [](const model::PhotoPath& p) { return util::IsCameraGeneratedName(FileNameOf(p)); });
}

// ------------------------------------------------------------
// Rules
// ------------------------------------------------------------

std::vector<RejectionProposal> Thumbnail(const ClusterView& view, const GroupRuleOptions& options) {
  auto [thumbnails, masters] = Partition(view, [](const ClusterMember& m) { return AnyPath(m, IsThumbnailPath); });
  if (thumbnails.empty() || masters.empty()) return {};

  const auto master = LargestByResolution(view, masters);
  if (!master) return {};
  const auto master_area = *Resolution(view, *master);

  std::vector<RejectionProposal> proposals;
  for (auto thumb : thumbnails) {
    const auto thumb_area = Resolution(view, thumb);
    if (!thumb_area || master_area <= *thumb_area) continue;
    if (WithinPrimary(view, thumb, *master, options.thumbnail_max_distance)) {
      proposals.push_back({thumb, *master});
    }
  }
  return proposals;
}

std::vector<RejectionProposal> Preview(const ClusterView& view) {
  auto [previews, originals] = Partition(view, [](const ClusterMember& m) {
    return AnyPath(m, [](const model::PhotoPath& p) { return IsPreviewsPath(p.source_path); });
  });
  if (previews.empty() || originals.empty()) return {};

  // compare against originals best-first
  std::stable_sort(originals.begin(), originals.end(), [&](std::size_t a, std::size_t b) {
    return ComputeRankHint(view.members[b]) < ComputeRankHint(view.members[a]);
  });

  std::vector<RejectionProposal> proposals;
  for (auto preview : previews) {
    const auto& p = view.members[preview];
    for (auto original : originals) {
      const auto& o = view.members[original];
      if (SameFileName(p, o) && o.photo.size_bytes > p.photo.size_bytes) {
        proposals.push_back({preview, original});
        break;
      }
    }
  }
  return proposals;
}

std::vector<RejectionProposal> OlderLibraryCopy(const ClusterView& view) {
  Indices legacy;
  Indices current;
  for (auto index : view.alive) {
    const auto& member = view.members[index];
    if (AnyPath(member, [](const model::PhotoPath& p) { return IsIPhotoLibrary(p.source_path); })) legacy.push_back(index);
    if (AnyPath(member, [](const model::PhotoPath& p) { return IsPhotosLibrary(p.source_path); })) current.push_back(index);
  }

  std::vector<RejectionProposal> proposals;
  for (auto old_copy : legacy) {
    const auto old_area = Resolution(view, old_copy);
    if (!old_area) continue;
    for (auto newer : current) {
      if (newer == old_copy) continue;
      if (Resolution(view, newer) == old_area) {
        proposals.push_back({old_copy, newer});
        break;
      }
    }
  }
  return proposals;
}

std::vector<RejectionProposal> PhotoBoothFiltered(const ClusterView& view) {
  Indices filtered;
  Indices originals;
  for (auto index : view.alive) {
    const auto& member = view.members[index];
    if (AnyPath(member, [](const model::PhotoPath& p) { return IsPhotoBoothPictures(p.source_path); })) filtered.push_back(index);
    if (AnyPath(member, [](const model::PhotoPath& p) { return IsPhotoBoothOriginals(p.source_path); })) originals.push_back(index);
  }
  if (filtered.empty() || originals.empty()) return {};

  const auto original = BestByRank(view, originals);

  std::vector<RejectionProposal> proposals;
  for (auto index : filtered) {
    if (index == original) continue;
    proposals.push_back({index, original});
  }
  return proposals;
}

std::vector<RejectionProposal> Derivative(const ClusterView& view, const GroupRuleOptions& options) {
  const auto largest = LargestByResolution(view, view.alive);
  if (!largest) return {};
  const double largest_area = static_cast<double>(*Resolution(view, *largest));

  std::vector<RejectionProposal> proposals;
  for (auto index : view.alive) {
    if (index == *largest) continue;
    const auto area = Resolution(view, index);
    if (!area) continue;
    if (static_cast<double>(*area) < largest_area * options.derivative_max_area_ratio &&
        WithinPrimary(view, index, *largest, options.derivative_max_distance)) {
      proposals.push_back({index, *largest});
    }
  }
  return proposals;
}

std::vector<RejectionProposal> GenericName(const ClusterView& view) {
  // pixel-identical copies share a byte size
  std::map<std::uint64_t, Indices> by_size;
  for (auto index : view.alive) {
    by_size[view.members[index].photo.size_bytes].push_back(index);
  }

  std::vector<RejectionProposal> proposals;
  for (const auto& [size, same_size] : by_size) {
    if (same_size.size() < 2) continue;

    Indices camera_named;
    Indices human_named;
    for (auto index : same_size) {
      (HasCameraGeneratedName(view.members[index]) ? camera_named : human_named).push_back(index);
    }
    if (camera_named.empty() || human_named.empty()) continue;

    const auto human = BestByRank(view, human_named);
    for (auto camera : camera_named) {
      if (WithinPrimary(view, camera, human, 0)) {
        proposals.push_back({camera, human});
      }
    }
  }
  return proposals;
}

std::vector<RejectionProposal> SameResolutionDuplicate(const ClusterView& view, const GroupRuleOptions& options) {
  std::map<std::uint64_t, Indices> by_resolution;
  for (auto index : view.alive) {
    if (const auto area = Resolution(view, index)) {
      by_resolution[*area].push_back(index);
    }
  }

  std::vector<RejectionProposal> proposals;
  for (auto& [area, same] : by_resolution) {
    if (same.size() < 2) continue;

    // keep: larger file, then EXIF, then smaller photo id
    std::sort(same.begin(), same.end(), [&](std::size_t a, std::size_t b) {
      const auto& pa = view.members[a].photo;
      const auto& pb = view.members[b].photo;
      if (pa.size_bytes != pb.size_bytes) return pa.size_bytes > pb.size_bytes;
      if (pa.has_exif != pb.has_exif) return pa.has_exif;
      return pa.id < pb.id;
    });

    const auto keeper = same.front();
    for (std::size_t k = 1; k < same.size(); ++k) {
      const auto other = same[k];
      if (!WithinPrimary(view, other, keeper, options.tie_break_max_distance)) continue;
      const auto secondary = view.distances.Secondary(other, keeper);
      if (secondary && *secondary > options.tie_break_max_secondary_distance) continue;
      proposals.push_back({other, keeper});
    }
  }
  return proposals;
}

} // namespace

std::vector<GroupRule> BuiltinGroupRules(const GroupRuleOptions& options) {
  std::vector<GroupRule> rules;
  rules.push_back({"THUMBNAIL", [options](const ClusterView& view) { return Thumbnail(view, options); }});
  rules.push_back({"PREVIEW", [](const ClusterView& view) { return Preview(view); }});
  rules.push_back({"OLDER_LIBRARY_COPY", [](const ClusterView& view) { return OlderLibraryCopy(view); }});
  rules.push_back({"PHOTOBOOTH_FILTERED", [](const ClusterView& view) { return PhotoBoothFiltered(view); }});
  rules.push_back({"DERIVATIVE", [options](const ClusterView& view) { return Derivative(view, options); }});
  rules.push_back({"GENERIC_NAME", [](const ClusterView& view) { return GenericName(view); }});
  rules.push_back({"SAME_RESOLUTION_DUPLICATE", [options](const ClusterView& view) { return SameResolutionDuplicate(view, options); }});
  return rules;
}

} // namespace photosift::resolve
