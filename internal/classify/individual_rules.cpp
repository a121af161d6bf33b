#include "individual_rules.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <string_view>

#include "internal/util/path_text.hpp"

namespace photosift::classify {
namespace {

using model::Decision;
using model::Photo;
using model::PhotoPath;
using Paths = std::vector<PhotoPath>;

std::string_view FileNameOf(const PhotoPath& path) {
  if (!path.filename.empty()) {
    return path.filename;
  }
  return util::BaseName(path.source_path);
}

bool AnyPathContains(const Paths& paths, std::string_view marker) {
  return std::any_of(paths.begin(), paths.end(), [&](const PhotoPath& p) { return util::ContainsIgnoreCase(p.source_path, marker); });
}

bool AnyPathContainsAny(const Paths& paths, const std::vector<std::string>& markers) {
  return std::any_of(markers.begin(), markers.end(), [&](const std::string& m) { return !m.empty() && AnyPathContains(paths, m); });
}

std::uint32_t MaxDimension(const Photo& photo) {
  return std::max(*photo.width, *photo.height);
}

bool IsThreeDigits(std::string_view text) {
  return text.size() == 3 && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

// "<base>_files/..." saved next to "<base>.htm" or "<base>.html"
bool IsSavedWebPageAsset(const PhotoPath& path, const SiblingProbe& probe) {
  static constexpr std::string_view kFilesDir = "_files/";

  const std::string lowered = util::ToLower(path.source_path);
  const auto        pos     = lowered.rfind(kFilesDir);
  if (pos == std::string::npos || pos == 0) {
    return false;
  }

  const std::string base = path.source_path.substr(0, pos);
  return probe.Exists(base + ".htm") || probe.Exists(base + ".html");
}

} // namespace

std::vector<IndividualRule> BuiltinRejectionRules(const IndividualRuleOptions& options, std::shared_ptr<const SiblingProbe> probe) {
  if (!probe) {
    throw std::invalid_argument("rejection rules need a sibling probe");
  }

  std::vector<IndividualRule> rules;

  const auto min_area = options.tiny_area_min_pixels;
  rules.push_back({"TINY_AREA", Decision::kReject, [min_area](const Photo& photo, const Paths&) {
                     const auto area = photo.Area();
                     return area.has_value() && *area < min_area;
                   }});

  rules.push_back({"MINECRAFT_TEXTURE", Decision::kReject, [](const Photo&, const Paths& paths) { return AnyPathContains(paths, "minecraft"); }});

  rules.push_back({"HUE_ANIMATION", Decision::kReject, [](const Photo&, const Paths& paths) { return AnyPathContains(paths, "HUE Animation"); }});

  rules.push_back({"CHAT_ICON", Decision::kReject, [](const Photo& photo, const Paths& paths) {
                     if (!photo.HasDimensions()) return false;
                     static const std::vector<std::string> kChatDirs = {"/iChat Icons/", "/Messages/", "/Skype/"};
                     return AnyPathContainsAny(paths, kChatDirs) && MaxDimension(photo) < 200;
                   }});

  rules.push_back({"WEB_ASSET", Decision::kReject, [probe](const Photo&, const Paths& paths) {
                     return std::any_of(paths.begin(), paths.end(), [&](const PhotoPath& p) { return IsSavedWebPageAsset(p, *probe); });
                   }});

  rules.push_back({"FACE_CROP", Decision::kReject, [](const Photo& photo, const Paths& paths) {
                     if (!AnyPathContains(paths, "/modelresources/")) return false;
                     if (!photo.HasDimensions() || *photo.width == 0 || *photo.height == 0) return false;
                     if (MaxDimension(photo) > 500) return false;
                     const double aspect = static_cast<double>(*photo.width) / static_cast<double>(*photo.height);
                     return std::abs(aspect - 1.0) <= 0.1;
                   }});

  rules.push_back({"STOCK_GREETING", Decision::kReject, [](const Photo&, const Paths& paths) {
                     for (const auto& path : paths) {
                       if (!util::ContainsIgnoreCase(path.source_path, "/thumbnails/")) continue;
                       std::string_view stem = util::Stem(FileNameOf(path));
                       if (stem.size() > 5 && stem.substr(stem.size() - 5) == "_1024") {
                         stem.remove_suffix(5);
                       }
                       if (IsThreeDigits(stem)) return true;
                     }
                     return false;
                   }});

  rules.push_back({"FLAG_ICON", Decision::kReject, [](const Photo&, const Paths& paths) { return AnyPathContains(paths, "20121223-175144"); }});

  rules.push_back({"SYSTEM_CACHE", Decision::kReject, [](const Photo&, const Paths& paths) {
                     static const std::vector<std::string> kCacheDirs = {"/.cache/", "/cache/", "/.thumbnails/", "/temp/",
                                                                         "/.Trash/", "/Trash/",  "/My Flip Video Prefs/"};
                     return AnyPathContainsAny(paths, kCacheDirs);
                   }});

  rules.push_back({"FLIP_VIDEO_THUMB", Decision::kReject,
                   [](const Photo&, const Paths& paths) { return AnyPathContains(paths, "/FlipShare Data/Previews/"); }});

  const auto reject_markers = options.reject_path_substrings;
  rules.push_back({"CUSTOM_PATH_REJECT", Decision::kReject,
                   [reject_markers](const Photo&, const Paths& paths) { return AnyPathContainsAny(paths, reject_markers); }});

  return rules;
}

std::vector<IndividualRule> BuiltinSeparationRules(const IndividualRuleOptions& options) {
  std::vector<IndividualRule> rules;

  rules.push_back({"PHOTOBOOTH", Decision::kSeparate, [](const Photo&, const Paths& paths) {
                     return AnyPathContains(paths, "Photo Booth Library/Originals/") || AnyPathContains(paths, "Photo Booth Library/Pictures/");
                   }});

  const auto separate_markers = options.separate_path_substrings;
  rules.push_back({"SEPARATE_PATH", Decision::kSeparate,
                   [separate_markers](const Photo&, const Paths& paths) { return AnyPathContainsAny(paths, separate_markers); }});

  return rules;
}

} // namespace photosift::classify
