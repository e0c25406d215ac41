#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include "internal/match/matcher.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pef::config {

using pef::runtime::config::RuntimeConfig;
using pef::util::ConfigurationError;

namespace {

constexpr char     kDestSuffix[]        = "_pefProcessed";
constexpr uint32_t kDefaultSaveInterval = 100;
constexpr uint32_t kDefaultTimeoutMs    = 60000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  const std::string& scalar_value = node.Scalar();

  // Quoted scalars stay strings: suffixes such as "" or "-1" must not
  // turn into numbers.
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigurationError("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigurationError("Failed to load YAML config: " + std::string(e.what()));
  }

  RuntimeConfig config;
  if (yaml.IsNull()) {
    return config;
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw ConfigurationError("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw ConfigurationError("Invalid configuration: " + std::string(status.message()));
  }

  return config;
}

RuntimeConfig ConfigLoader::Defaults() {
  RuntimeConfig config;
  Finalize(&config);
  return config;
}

void ConfigLoader::Finalize(RuntimeConfig* config, const Overrides& overrides) {
  auto* run = config->mutable_run();

  if (overrides.source_path) {
    run->set_source_path(*overrides.source_path);
  }
  if (overrides.dest_path) {
    run->set_dest_path(*overrides.dest_path);
  }
  if (overrides.suffixes) {
    run->clear_suffixes();
    for (const auto& suffix : *overrides.suffixes) {
      run->add_suffixes(suffix);
    }
  }
  if (overrides.force) {
    run->set_force(*overrides.force);
  }
  if (overrides.write_tags) {
    run->set_write_tags(*overrides.write_tags);
  }

  if (!run->source_path().empty()) {
    run->set_source_path(storage::common::NormalizePath(run->source_path()).string());
  }
  if (run->dest_path().empty() && !run->source_path().empty()) {
    run->set_dest_path(run->source_path() + kDestSuffix);
  } else if (!run->dest_path().empty()) {
    run->set_dest_path(storage::common::NormalizePath(run->dest_path()).string());
  }

  if (run->suffixes_size() == 0) {
    run->add_suffixes("");
    run->add_suffixes("-edited");
  }
  if (!run->has_write_tags()) {
    run->set_write_tags(true);
  }
  if (run->save_interval() == 0) {
    run->set_save_interval(kDefaultSaveInterval);
  }
  if (run->copy_workers() == 0) {
    run->set_copy_workers(1);
  }

  auto* logging = config->mutable_logging();
  if (logging->level().empty()) {
    logging->set_level("info");
  }
  if (!logging->has_detailed_log()) {
    logging->set_detailed_log(true);
  }

  auto* tagging = config->mutable_tagging();
  if (tagging->exiftool_path().empty()) {
    tagging->set_exiftool_path("exiftool");
  }
  if (tagging->timeout_ms() == 0) {
    tagging->set_timeout_ms(kDefaultTimeoutMs);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& run = config.run();
  if (run.source_path().empty()) {
    throw ConfigurationError("run.source_path is required");
  }

  match::ValidateSuffixes(std::vector<std::string>(run.suffixes().begin(), run.suffixes().end()));

  const auto source = std::filesystem::absolute(run.source_path());
  const auto dest   = std::filesystem::absolute(run.dest_path());
  if (storage::common::IsWithin(dest, source)) {
    throw ConfigurationError("destination must not be inside the source: " + dest.string());
  }
}

} // namespace pef::config
