#pragma once

#include <string_view>

#include "internal/model/photo.hpp"

namespace photosift::resolve {

// Directory / filename markers the group rules treat as evidence.

bool IsThumbnailPath(const model::PhotoPath& path); // /thumbnails/, /previews/, thumb_ prefix
bool IsPreviewsPath(std::string_view source_path);
bool IsIPhotoLibrary(std::string_view source_path); // legacy .photolibrary/
bool IsPhotosLibrary(std::string_view source_path); // current .photoslibrary/
bool IsPhotoBoothPictures(std::string_view source_path);
bool IsPhotoBoothOriginals(std::string_view source_path);

std::string_view FileNameOf(const model::PhotoPath& path);

} // namespace photosift::resolve
