#pragma once

#include <vector>

#include "internal/model/photo.hpp"

namespace photosift::resolve {

// A grouped photo with every path it was observed at.
struct ClusterMember {
  model::Photo                  photo;
  std::vector<model::PhotoPath> paths;
};

} // namespace photosift::resolve
