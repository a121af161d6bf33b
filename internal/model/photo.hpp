#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/hash/hash_codec.hpp"

namespace photosift::model {

enum class DateSource : std::uint8_t {
  kUnknown  = 0,
  kExif     = 1,
  kFilename = 2,
  kMtime    = 3,
};

/*
  One unique image, keyed by content checksum.

  Created by the external scanner; only the two hash fields are filled in
  later, exactly once each.
*/
struct Photo {
  std::string id; // content checksum (sha256 hex)

  std::string   mime_type;
  std::uint64_t size_bytes = 0;

  std::optional<std::uint32_t> width;
  std::optional<std::uint32_t> height;

  std::optional<std::string> date_taken; // ISO-8601, as estimated upstream
  DateSource                 date_source = DateSource::kUnknown;
  bool                       has_exif    = false;

  std::optional<hash::HashValue> primary_hash;
  std::optional<hash::HashValue> secondary_hash;

  bool HasDimensions() const {
    return width.has_value() && height.has_value();
  }

  // Pixel area, or nullopt when either dimension is unknown.
  std::optional<std::uint64_t> Area() const {
    if (!HasDimensions()) return std::nullopt;
    return static_cast<std::uint64_t>(*width) * static_cast<std::uint64_t>(*height);
  }
};

/*
  Observed source location of a photo. Append-only: provenance survives
  rejection of the photo it points at.
*/
struct PhotoPath {
  std::string photo_id;
  std::string source_path; // full path as found on the recovered media
  std::string filename;
};

const char* ToString(DateSource source);
DateSource  DateSourceFromString(const std::string& value);

} // namespace photosift::model
