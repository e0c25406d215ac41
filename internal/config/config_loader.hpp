#pragma once

#include <optional>
#include <string>
#include <vector>

#include "config/config.pb.h"

namespace pef::config {

// Command-line values that take precedence over the YAML file.
struct Overrides {
  std::optional<std::string>              source_path;
  std::optional<std::string>              dest_path;
  std::optional<std::vector<std::string>> suffixes;
  std::optional<bool>                     force;
  std::optional<bool>                     write_tags;
};

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Finalize() applies overrides and defaults; Validate() throws
  ConfigurationError on anything a run cannot start with.
*/
class ConfigLoader {
 public:
  static pef::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static pef::runtime::config::RuntimeConfig Defaults();

  static void Finalize(pef::runtime::config::RuntimeConfig* config, const Overrides& overrides = {});

  static void Validate(const pef::runtime::config::RuntimeConfig& config);
};

} // namespace pef::config
