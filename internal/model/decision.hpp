#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace photosift::model {

enum class Decision : std::uint8_t {
  kReject   = 1,
  kSeparate = 2,
};

const char*             ToString(Decision decision);
std::optional<Decision> DecisionFromString(const std::string& value);

struct IndividualDecision {
  std::string photo_id;
  Decision    decision = Decision::kReject;
  std::string rule_name;
};

struct GroupMembership {
  std::string   photo_id;
  std::uint64_t group_id = 0;
};

struct GroupRejection {
  std::string   photo_id;
  std::uint64_t group_id = 0;
  std::string   rule_name;
};

struct AggregatedPath {
  std::string kept_photo_id;
  std::string source_path;
  std::string from_photo_id;
};

enum class LinkageMode : std::uint8_t {
  kSingle   = 1,
  kComplete = 2,
};

const char*                ToString(LinkageMode mode);
std::optional<LinkageMode> LinkageModeFromString(const std::string& value);

} // namespace photosift::model
