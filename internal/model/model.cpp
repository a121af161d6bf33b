#include "internal/model/decision.hpp"
#include "internal/model/photo.hpp"

namespace photosift::model {

const char* ToString(DateSource source) {
  switch (source) {
    case DateSource::kExif:
      return "exif";
    case DateSource::kFilename:
      return "filename";
    case DateSource::kMtime:
      return "mtime";
    case DateSource::kUnknown:
      break;
  }
  return "";
}

DateSource DateSourceFromString(const std::string& value) {
  if (value == "exif") return DateSource::kExif;
  if (value == "filename") return DateSource::kFilename;
  if (value == "mtime") return DateSource::kMtime;
  return DateSource::kUnknown;
}

const char* ToString(Decision decision) {
  switch (decision) {
    case Decision::kReject:
      return "reject";
    case Decision::kSeparate:
      return "separate";
  }
  return "unknown";
}

std::optional<Decision> DecisionFromString(const std::string& value) {
  if (value == "reject") return Decision::kReject;
  if (value == "separate") return Decision::kSeparate;
  return std::nullopt;
}

const char* ToString(LinkageMode mode) {
  switch (mode) {
    case LinkageMode::kSingle:
      return "single";
    case LinkageMode::kComplete:
      return "complete";
  }
  return "unknown";
}

std::optional<LinkageMode> LinkageModeFromString(const std::string& value) {
  if (value == "single") return LinkageMode::kSingle;
  if (value == "complete") return LinkageMode::kComplete;
  return std::nullopt;
}

} // namespace photosift::model
