#pragma once

#include <string>

#include "config/config.pb.h"
#include "upload/v1/manifest.pb.h"

namespace upload::config {

/*
  Loads protobuf messages from YAML files.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Throws util::InvalidArgument on unreadable or invalid input.
*/
class ConfigLoader {
 public:
  static upload::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static upload::runtime::config::RuntimeConfig ParseYaml(const std::string& yaml);

  static upload::v1::UploadManifest LoadManifest(const std::string& path);
};

} // namespace upload::config
