#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace photosift::resolve {

/*
  Survivor bookkeeping for one cluster.

  Reject() refuses to remove the last survivor (util::InvariantViolation),
  so no caller can empty a cluster by accident.
*/
class ClusterLedger {
 public:
  ClusterLedger(std::string cluster_label, std::size_t size);

  bool IsAlive(std::size_t index) const;

  std::size_t SurvivorCount() const {
    return survivors_;
  }

  void Reject(std::size_t index);

  // Ascending member indices still alive.
  std::vector<std::size_t> Survivors() const;

 private:
  std::string       cluster_label_;
  std::vector<bool> alive_;
  std::size_t       survivors_;
};

} // namespace photosift::resolve
