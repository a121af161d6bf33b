#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace photosift::config {
namespace {

using photosift::runtime::config::RuntimeConfig;

// Only plain scalars that look like numbers become numbers. Rule substrings
// such as "inf" or "nan" must reach the proto as strings.
bool LooksNumeric(const std::string& text) {
  if (text.empty()) {
    return false;
  }
  const unsigned char first = static_cast<unsigned char>(text[0]);
  return std::isdigit(first) || first == '-' || first == '+' || first == '.';
}

void ScalarToValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& text = node.Scalar();

  // quoted scalars always stay strings
  if (node.Tag() == "!") {
    value->set_string_value(text);
    return;
  }

  if (text == "true" || text == "false") {
    value->set_bool_value(text == "true");
    return;
  }

  if (LooksNumeric(text)) {
    char*        end    = nullptr;
    const double number = std::strtod(text.c_str(), &end);
    if (end && *end == '\0') {
      value->set_number_value(number);
      return;
    }
  }

  value->set_string_value(text);
}

// key_path ("grouping.thresholds") only feeds error messages.
void NodeToValue(const YAML::Node& node, const std::string& key_path, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NULL_VALUE);
      return;

    case YAML::NodeType::Scalar:
      ScalarToValue(node, value);
      return;

    case YAML::NodeType::Sequence: {
      auto* list = value->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        NodeToValue(node[i], key_path + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }

    case YAML::NodeType::Map: {
      auto* fields = value->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("non-scalar key under '" + key_path + "'");
        }
        const std::string& key = entry.first.Scalar();
        NodeToValue(entry.second, key_path.empty() ? key : key_path + "." + key, &(*fields)[key]);
      }
      return;
    }

    case YAML::NodeType::Undefined:
      break;
  }
  throw std::runtime_error("undefined YAML node at '" + key_path + "'");
}

// YAML -> google.protobuf.Value -> JSON -> RuntimeConfig, so the proto
// schema alone decides which keys exist and what types they take.
RuntimeConfig Parse(const YAML::Node& yaml, const std::string& source) {
  RuntimeConfig config;

  // an empty document means "all defaults"
  if (yaml.IsNull()) {
    return config;
  }
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration in " + source + ": top level must be a mapping");
  }

  google::protobuf::Value root;
  try {
    NodeToValue(yaml, "", &root);
  } catch (const std::runtime_error& e) {
    throw std::runtime_error("Invalid configuration in " + source + ": " + e.what());
  }

  std::string json;
  const auto  to_json = google::protobuf::util::MessageToJsonString(root, &json);
  if (!to_json.ok()) {
    throw std::runtime_error("Cannot convert " + source + " to JSON: " + std::string(to_json.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false; // a misspelt key is an error, not a silent default

  const auto parsed = google::protobuf::util::JsonStringToMessage(json, &config, options);
  if (!parsed.ok()) {
    throw std::runtime_error("Invalid configuration in " + source + ": " + std::string(parsed.message()));
  }
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load config " + path + ": " + e.what());
  }
  return Parse(yaml, path);
}

RuntimeConfig ConfigLoader::LoadFromString(const std::string& yaml_text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(yaml_text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error(std::string("Failed to parse config text: ") + e.what());
  }
  return Parse(yaml, "<inline config>");
}

} // namespace photosift::config
