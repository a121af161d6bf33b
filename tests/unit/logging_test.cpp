#include "internal/observability/logging.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "config/config.pb.h"

namespace {

using photosift::observability::BoolField;
using photosift::observability::FormatFields;
using photosift::observability::IntField;
using photosift::observability::StringField;

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream      in(path);
  std::ostringstream out;
  out << in.rdbuf();
  return out.str();
}

void TestFieldsAreKeyValuePairs() {
  assert(FormatFields({}).empty());
  assert(FormatFields({IntField("groups", 12), BoolField("clear", false)}) == "groups=12 clear=false");
}

void TestValuesWithSpacesAreQuoted() {
  assert(FormatFields({StringField("path", "/Volumes/rescue/Beach day.jpg")}) == "path=\"/Volumes/rescue/Beach day.jpg\"");
  assert(FormatFields({StringField("note", "say \"hi\"")}) == "note=\"say \\\"hi\\\"\"");
  assert(FormatFields({StringField("empty", "")}) == "empty=\"\"");
}

void TestFileSinkReceivesRecords() {
  const auto dir = std::filesystem::temp_directory_path() / "photosift_logging_tests";
  std::filesystem::remove_all(dir);
  const auto log_path = dir / "run.log";

  photosift::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_pattern("%l %v");
  config.mutable_logging()->set_file(log_path.string());

  photosift::observability::InitializeLogging(config);
  PHOTOSIFT_LOG_DEBUG("Scanning block", {IntField("block", 3)});
  PHOTOSIFT_LOG_INFO("Kept photo", {StringField("path", "/Volumes/rescue/Beach day.jpg")});
  photosift::observability::FlushLogging();

  const auto contents = ReadFile(log_path);
  assert(contents.find("debug Scanning block block=3") != std::string::npos);
  assert(contents.find("info Kept photo path=\"/Volumes/rescue/Beach day.jpg\"") != std::string::npos);

  // reconfiguring drops the file sink and raises the level
  photosift::runtime::config::RuntimeConfig quiet;
  quiet.mutable_logging()->set_level("warn");
  photosift::observability::InitializeLogging(quiet);
  PHOTOSIFT_LOG_WARN("Only on stdout");
  photosift::observability::FlushLogging();
  assert(ReadFile(log_path).find("Only on stdout") == std::string::npos);

  std::filesystem::remove_all(dir);
}

} // namespace

int main() {
  TestFieldsAreKeyValuePairs();
  TestValuesWithSpacesAreQuoted();
  TestFileSinkReceivesRecords();

  std::cout << "photosift_unit_logging: pass\n";
  return 0;
}
