#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "prepush/v1/config.pb.h"

namespace prepush::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. The loaded message is
  completed with ApplyDefaults and checked with Validate; after that it is
  treated as immutable for the rest of the run.
*/
class ConfigLoader {
 public:
  static prepush::v1::RuntimeConfig LoadFromYaml(const std::string& path);

  // <root>/prepush.yaml when it exists; a path that cannot be inspected counts as absent.
  static std::optional<std::string> FindProjectConfig(const std::filesystem::path& root);

  // Built-in configuration used when no file is given.
  static prepush::v1::RuntimeConfig Default();

  static void ApplyDefaults(prepush::v1::RuntimeConfig* config);
  static void Validate(const prepush::v1::RuntimeConfig& config);
};

} // namespace prepush::config
