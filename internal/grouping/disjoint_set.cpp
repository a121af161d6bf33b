#include "disjoint_set.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace photosift::grouping {

DisjointSet::DisjointSet(std::size_t size) : parent_(size), size_(size, 1) {
  for (std::size_t i = 0; i < size; ++i) {
    parent_[i] = static_cast<std::uint32_t>(i);
  }
}

std::uint32_t DisjointSet::Find(std::uint32_t x) {
  if (x >= parent_.size()) {
    throw std::out_of_range("disjoint set index " + std::to_string(x) + " out of range");
  }
  while (parent_[x] != x) {
    parent_[x] = parent_[parent_[x]];
    x          = parent_[x];
  }
  return x;
}

bool DisjointSet::Union(std::uint32_t x, std::uint32_t y) {
  auto rx = Find(x);
  auto ry = Find(y);
  if (rx == ry) {
    return false;
  }
  if (size_[rx] < size_[ry]) {
    std::swap(rx, ry);
  }
  parent_[ry] = rx;
  size_[rx] += size_[ry];
  return true;
}

std::vector<std::vector<std::uint32_t>> DisjointSet::Components() {
  // slot per root, assigned in order of each set's first (smallest) index
  std::vector<std::int64_t>               slot(parent_.size(), -1);
  std::vector<std::vector<std::uint32_t>> components;

  for (std::uint32_t i = 0; i < parent_.size(); ++i) {
    const auto root = Find(i);
    if (slot[root] < 0) {
      slot[root] = static_cast<std::int64_t>(components.size());
      components.emplace_back();
    }
    components[static_cast<std::size_t>(slot[root])].push_back(i);
  }
  return components;
}

} // namespace photosift::grouping
