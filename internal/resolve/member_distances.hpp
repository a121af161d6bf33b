#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/resolve/cluster_member.hpp"

namespace photosift::resolve {

/*
  Hamming distances between members of one cluster, by member index.

  Computed when asked; rules only look at a few pairs per member and a
  single-linkage chain can hold tens of thousands of photos, so nothing is
  tabulated. A distance is absent when either side lacks the hash or the
  two hashes differ in width; rules needing it then do not match.

  Holds a reference: the member vector must outlive this object.
*/
class MemberDistances {
 public:
  explicit MemberDistances(const std::vector<ClusterMember>& members) : members_(members) {
  }

  std::optional<unsigned> Primary(std::size_t i, std::size_t j) const;
  std::optional<unsigned> Secondary(std::size_t i, std::size_t j) const;

  std::size_t Size() const {
    return members_.size();
  }

 private:
  const model::Photo& PhotoAt(std::size_t index) const;

  const std::vector<ClusterMember>& members_;
};

} // namespace photosift::resolve
