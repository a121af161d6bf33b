#include "cluster_ledger.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace photosift::resolve {

ClusterLedger::ClusterLedger(std::string cluster_label, std::size_t size)
    : cluster_label_(std::move(cluster_label)), alive_(size, true), survivors_(size) {
}

bool ClusterLedger::IsAlive(std::size_t index) const {
  return index < alive_.size() && alive_[index];
}

void ClusterLedger::Reject(std::size_t index) {
  if (index >= alive_.size()) {
    throw std::out_of_range("member " + std::to_string(index) + " not in " + cluster_label_);
  }
  if (!alive_[index]) {
    throw util::InvariantViolation("member " + std::to_string(index) + " of " + cluster_label_ + " already rejected");
  }
  if (survivors_ == 1) {
    throw util::InvariantViolation("refusing to reject the last survivor (member " + std::to_string(index) + ") of " + cluster_label_);
  }
  alive_[index] = false;
  --survivors_;
}

std::vector<std::size_t> ClusterLedger::Survivors() const {
  std::vector<std::size_t> out;
  out.reserve(survivors_);
  for (std::size_t i = 0; i < alive_.size(); ++i) {
    if (alive_[i]) out.push_back(i);
  }
  return out;
}

} // namespace photosift::resolve
