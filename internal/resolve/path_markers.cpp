#include "path_markers.hpp"

#include "internal/util/path_text.hpp"

namespace photosift::resolve {

std::string_view FileNameOf(const model::PhotoPath& path) {
  if (!path.filename.empty()) {
    return path.filename;
  }
  return util::BaseName(path.source_path);
}

bool IsThumbnailPath(const model::PhotoPath& path) {
  if (util::ContainsIgnoreCase(path.source_path, "/thumbnails/") || IsPreviewsPath(path.source_path)) {
    return true;
  }
  const std::string name = util::ToLower(FileNameOf(path));
  return name.rfind("thumb_", 0) == 0;
}

bool IsPreviewsPath(std::string_view source_path) {
  return util::ContainsIgnoreCase(source_path, "/previews/");
}

bool IsIPhotoLibrary(std::string_view source_path) {
  return util::ContainsIgnoreCase(source_path, ".photolibrary/");
}

bool IsPhotosLibrary(std::string_view source_path) {
  return util::ContainsIgnoreCase(source_path, ".photoslibrary/");
}

bool IsPhotoBoothPictures(std::string_view source_path) {
  return util::ContainsIgnoreCase(source_path, "photo booth library/pictures/");
}

bool IsPhotoBoothOriginals(std::string_view source_path) {
  return util::ContainsIgnoreCase(source_path, "photo booth library/originals/");
}

} // namespace photosift::resolve
