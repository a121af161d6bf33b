#pragma once

#include <string>
#include <string_view>

namespace photosift::util {

/*
  Path text helpers shared by the individual and group rules.

  Recovered paths come from several filesystems with inconsistent casing,
  so every marker test is ASCII case-insensitive.
*/

std::string ToLower(std::string_view text);

bool ContainsIgnoreCase(std::string_view haystack, std::string_view needle);

// Final path component ("a/b/IMG_1.JPG" -> "IMG_1.JPG").
std::string_view BaseName(std::string_view path);

// Filename without its last extension ("IMG_1.JPG" -> "IMG_1"). Dotfiles keep
// their name.
std::string_view Stem(std::string_view filename);

// IMG_n, DSC_n, DSCn, DSCNn, Pnnnnnnn, YYYYMMDD_n
bool IsCameraGeneratedName(std::string_view filename);

} // namespace photosift::util
