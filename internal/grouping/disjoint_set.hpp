#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace photosift::grouping {

/*
  Index-based union-find with union by size and path compression (halving).

  Elements are dense indices 0..n-1. The final partition depends only on
  which unions happened, never on their order.
*/
class DisjointSet {
 public:
  explicit DisjointSet(std::size_t size);

  std::uint32_t Find(std::uint32_t x);

  // Returns true when x and y were in different sets.
  bool Union(std::uint32_t x, std::uint32_t y);

  std::size_t Size() const {
    return parent_.size();
  }

  // Sets as sorted index lists, ordered by their smallest element.
  std::vector<std::vector<std::uint32_t>> Components();

 private:
  std::vector<std::uint32_t> parent_;
  std::vector<std::uint32_t> size_;
};

} // namespace photosift::grouping
