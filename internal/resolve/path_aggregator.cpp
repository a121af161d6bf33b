#include "path_aggregator.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace photosift::resolve {

std::vector<model::AggregatedPath> PathAggregator::Aggregate(const std::vector<ClusterMember>& members, const ClusterOutcome& outcome) {
  struct Held {
    std::string source_path;
    std::string from_photo_id;
  };

  std::vector<bool>              alive(members.size(), true);
  std::vector<std::vector<Held>> holdings(members.size());

  for (const auto& rejection : outcome.rejections) {
    const auto rejected = rejection.member;
    if (rejected >= members.size() || !alive[rejected]) {
      throw util::InvariantViolation("aggregation replay rejects member " + std::to_string(rejected) + " twice or out of range");
    }
    alive[rejected] = false;

    std::size_t target = members.size();
    if (rejection.kept && *rejection.kept < members.size() && alive[*rejection.kept]) {
      target = *rejection.kept;
    } else {
      auto first = std::find(alive.begin(), alive.end(), true);
      if (first == alive.end()) {
        throw util::InvariantViolation("no survivor left to take paths of " + members[rejected].photo.id);
      }
      target = static_cast<std::size_t>(first - alive.begin());
    }

    auto& into = holdings[target];
    for (const auto& path : members[rejected].paths) {
      into.push_back({path.source_path, members[rejected].photo.id});
    }
    auto& carried = holdings[rejected];
    into.insert(into.end(), std::make_move_iterator(carried.begin()), std::make_move_iterator(carried.end()));
    carried.clear();
  }

  std::vector<model::AggregatedPath> aggregated;
  for (std::size_t i = 0; i < members.size(); ++i) {
    for (auto& held : holdings[i]) {
      aggregated.push_back({members[i].photo.id, std::move(held.source_path), std::move(held.from_photo_id)});
    }
  }
  return aggregated;
}

} // namespace photosift::resolve
