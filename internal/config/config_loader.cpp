#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <string>

#include "internal/util/errors.hpp"

namespace upload::config {

namespace {

using google::protobuf::Value;

bool IsNumber(const std::string& text, double* number) {
  if (text.empty()) return false;
  char* end = nullptr;
  *number   = std::strtod(text.c_str(), &end);
  return end != nullptr && *end == '\0';
}

// Quoted scalars carry the "!" tag and are never reinterpreted, so "64MiB"
// and "4096" both reach byte-size fields as strings.
Value ScalarValue(const YAML::Node& node) {
  Value       value;
  const auto& text = node.Scalar();
  double      number;
  if (node.Tag() == "!") {
    value.set_string_value(text);
  } else if (text == "true" || text == "false") {
    value.set_bool_value(text == "true");
  } else if (IsNumber(text, &number)) {
    value.set_number_value(number);
  } else {
    value.set_string_value(text);
  }
  return value;
}

Value ToValue(const YAML::Node& node) {
  Value value;
  if (node.IsNull()) {
    value.set_null_value(google::protobuf::NULL_VALUE);
  } else if (node.IsScalar()) {
    value = ScalarValue(node);
  } else if (node.IsSequence()) {
    auto* list = value.mutable_list_value();
    for (const auto& item : node) {
      *list->add_values() = ToValue(item);
    }
  } else if (node.IsMap()) {
    auto& fields = *value.mutable_struct_value()->mutable_fields();
    for (const auto& entry : node) {
      fields[entry.first.Scalar()] = ToValue(entry.second);
    }
  } else {
    throw util::InvalidArgument("unsupported YAML node at line " + std::to_string(node.Mark().line + 1));
  }
  return value;
}

template <typename Message>
Message YamlToMessage(const YAML::Node& yaml, const std::string& what) {
  Message message;
  // an empty document is an empty message
  if (yaml.IsNull()) {
    return message;
  }

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(ToValue(yaml), &json);
  if (!to_json_status.ok()) {
    throw util::InvalidArgument("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid " + what + ": " + std::string(status.message()));
  }

  return message;
}

YAML::Node LoadYamlFile(const std::string& path, const std::string& what) {
  try {
    return YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to load YAML " + what + " " + path + ": " + e.what());
  }
}

} // namespace

upload::runtime::config::RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  return YamlToMessage<upload::runtime::config::RuntimeConfig>(LoadYamlFile(path, "config"), "configuration");
}

upload::runtime::config::RuntimeConfig ConfigLoader::ParseYaml(const std::string& yaml) {
  YAML::Node node;
  try {
    node = YAML::Load(yaml);
  } catch (const std::exception& e) {
    throw util::InvalidArgument("Failed to parse YAML config: " + std::string(e.what()));
  }
  return YamlToMessage<upload::runtime::config::RuntimeConfig>(node, "configuration");
}

upload::v1::UploadManifest ConfigLoader::LoadManifest(const std::string& path) {
  return YamlToMessage<upload::v1::UploadManifest>(LoadYamlFile(path, "manifest"), "manifest");
}

} // namespace upload::config
