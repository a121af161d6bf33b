#include "member_distances.hpp"

#include <stdexcept>
#include <string>

namespace photosift::resolve {
namespace {

std::optional<unsigned> Distance(const std::optional<hash::HashValue>& a, const std::optional<hash::HashValue>& b) {
  if (!a || !b || a->BitWidth() != b->BitWidth()) {
    return std::nullopt;
  }
  return hash::HammingDistance(*a, *b);
}

} // namespace

const model::Photo& MemberDistances::PhotoAt(std::size_t index) const {
  if (index >= members_.size()) {
    throw std::out_of_range("member " + std::to_string(index) + " outside cluster of " + std::to_string(members_.size()));
  }
  return members_[index].photo;
}

std::optional<unsigned> MemberDistances::Primary(std::size_t i, std::size_t j) const {
  return Distance(PhotoAt(i).primary_hash, PhotoAt(j).primary_hash);
}

std::optional<unsigned> MemberDistances::Secondary(std::size_t i, std::size_t j) const {
  return Distance(PhotoAt(i).secondary_hash, PhotoAt(j).secondary_hash);
}

} // namespace photosift::resolve
