#include "factory.hpp"

#include <chrono>
#include <string>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/tagging/exiftool_writer.hpp"

namespace pef::factory {

using pef::observability::IntField;
using pef::observability::StringField;

namespace {

tagging::TagWriterPtr BuildTagWriter(const pef::runtime::config::TaggingConfig& config) {
  auto writer = std::make_shared<tagging::ExifToolTagWriter>(config.exiftool_path(), std::chrono::milliseconds(config.timeout_ms()));
  if (!writer->Available()) {
    PEF_LOG_WARN("Tagging tool not available, only timestamps will be applied", {StringField("executable", config.exiftool_path())});
    return nullptr;
  }
  PEF_LOG_DEBUG("Tagging tool found", {StringField("executable", config.exiftool_path()), IntField("timeout_ms", config.timeout_ms())});
  return writer;
}

} // namespace

core::RunOptions ToRunOptions(const pef::runtime::config::RuntimeConfig& config) {
  const auto& run = config.run();

  core::RunOptions options;
  options.source        = storage::common::NormalizePath(run.source_path());
  options.dest          = storage::common::NormalizePath(run.dest_path());
  options.suffixes      = std::vector<std::string>(run.suffixes().begin(), run.suffixes().end());
  options.write_tags    = !run.has_write_tags() || run.write_tags();
  options.force         = run.force();
  options.detailed_log  = !config.logging().has_detailed_log() || config.logging().detailed_log();
  options.copy_workers  = run.copy_workers() == 0 ? 1 : run.copy_workers();
  options.save_interval = run.save_interval() == 0 ? 100 : run.save_interval();
  return options;
}

/*
    Build full application dependency graph
*/
Application Build(const pef::runtime::config::RuntimeConfig& config, tagging::TagWriterPtr tag_writer) {
  Application app;

  auto options = ToRunOptions(config);

  // ------------------------------------------------------------------
  // Tagging collaborator
  // ------------------------------------------------------------------
  if (options.write_tags) {
    app.tag_writer = tag_writer ? std::move(tag_writer) : BuildTagWriter(config.tagging());
  }

  // ------------------------------------------------------------------
  // Orchestrator
  // ------------------------------------------------------------------
  app.cancel       = std::make_shared<core::CancellationToken>();
  app.orchestrator = std::make_shared<core::Orchestrator>(std::move(options), app.tag_writer, app.cancel);

  return app;
}

} // namespace pef::factory
