#pragma once

#include <filesystem>
#include <string>
#include <system_error>

namespace photosift::classify {

/*
  Answers "does this companion file exist?" for rules that look at the
  directory around a photo (saved web pages). Injected so the classifier
  stays deterministic under test.
*/
class SiblingProbe {
 public:
  virtual ~SiblingProbe() = default;

  virtual bool Exists(const std::string& path) const = 0;
};

class FilesystemProbe final : public SiblingProbe {
 public:
  bool Exists(const std::string& path) const override {
    // unreadable media counts as "not there"
    std::error_code ec;
    return std::filesystem::exists(path, ec) && !ec;
  }
};

} // namespace photosift::classify
