#include "path_text.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace photosift::util {

std::string ToLower(std::string_view text) {
  std::string out(text);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle) {
  if (needle.empty()) {
    return true;
  }
  auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
  return it != haystack.end();
}

std::string_view BaseName(std::string_view path) {
  const auto slash = path.find_last_of('/');
  if (slash == std::string_view::npos) {
    return path;
  }
  return path.substr(slash + 1);
}

std::string_view Stem(std::string_view filename) {
  const auto dot = filename.find_last_of('.');
  if (dot == std::string_view::npos || dot == 0) {
    return filename;
  }
  return filename.substr(0, dot);
}

bool IsCameraGeneratedName(std::string_view filename) {
  static const std::regex kCameraName(R"(^(IMG_\d+|DSC_?\d+|DSCN?\d+|P\d{7}|\d{8}_\d+)$)", std::regex::icase);

  const std::string stem(Stem(filename));
  return std::regex_match(stem, kCameraName);
}

} // namespace photosift::util
