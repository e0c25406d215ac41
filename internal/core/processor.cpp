#include "processor.hpp"

#include <system_error>

#include "internal/metadata/tag_builder.hpp"
#include "internal/util/time.hpp"

namespace pef::core {

namespace fs = std::filesystem;

using pef::observability::StringField;

Processor::Processor(std::shared_ptr<storage::MediaStore> store, tagging::TagWriterPtr tag_writer, observability::RunLog& log)
    : store_(std::move(store)), tag_writer_(std::move(tag_writer)), log_(log) {
}

FileOutcome Processor::ApplyMatch(const model::MediaRecord& record, const model::SidecarMetadata& metadata) {
  FileOutcome     outcome;
  std::error_code ec;
  outcome.record = record;

  const auto dest = store_->Place(record.path, record.album, "", ec);
  if (ec || dest.empty()) {
    outcome.error = "copy failed: " + (ec ? ec.message() : std::string("no free file name"));
    log_.Error("Copy failed", {StringField("source", record.path.string()), StringField("error", outcome.error)});
    return outcome;
  }
  outcome.ok                  = true;
  outcome.record.dest_path    = dest;
  outcome.record.sidecar_path = metadata.path;

  // Tag writers rewrite the file, so timestamps go last.
  outcome.tag_failed = !WriteTags(dest, metadata);

  storage::MediaStore::SetFileTimes(dest, metadata.taken_at, ec);
  if (ec) {
    log_.Warn("Could not set file times", {StringField("path", dest.string()), StringField("error", ec.message())});
  }
  outcome.record.processed_at = util::Now();

  log_.Detail("Processed", {StringField("source", record.path.string()), StringField("dest", dest.string()),
                            StringField("sidecar", metadata.path.string())});
  return outcome;
}

FileOutcome Processor::CopyUnmatched(const model::MediaRecord& record) {
  FileOutcome     outcome;
  std::error_code ec;
  outcome.record = record;

  const auto dest = store_->Place(record.path, record.album, storage::kUnprocessedDirName, ec);
  if (ec || dest.empty()) {
    outcome.error = "copy failed: " + (ec ? ec.message() : std::string("no free file name"));
    log_.Error("Copy failed", {StringField("source", record.path.string()), StringField("error", outcome.error)});
    return outcome;
  }
  outcome.ok                  = true;
  outcome.record.dest_path    = dest;
  outcome.record.processed_at = util::Now();
  log_.Detail("Copied unmatched", {StringField("source", record.path.string()), StringField("dest", dest.string())});
  return outcome;
}

FileOutcome Processor::ExtendTags(const model::MediaRecord& record, const model::SidecarMetadata& metadata) {
  FileOutcome outcome;
  outcome.record           = record;
  outcome.record.dest_path = record.path;

  if (!tag_writer_) {
    outcome.error = "no tag writer";
    return outcome;
  }
  if (!WriteTags(record.path, metadata)) {
    outcome.tag_failed = true;
    outcome.error      = "tag write failed";
    return outcome;
  }
  outcome.ok                  = true;
  outcome.record.sidecar_path = metadata.path;
  outcome.record.processed_at = util::Now();
  log_.Detail("Tagged", {StringField("path", record.path.string()), StringField("sidecar", metadata.path.string())});
  return outcome;
}

bool Processor::WriteTags(const fs::path& file, const model::SidecarMetadata& metadata) {
  if (!tag_writer_) {
    return true;
  }
  const auto tags = metadata::BuildTags(metadata);
  if (tags.empty()) {
    return true;
  }
  if (!tag_writer_->WriteTags(file, tags)) {
    log_.Warn("Tag write failed", {StringField("path", file.string()), StringField("sidecar", metadata.path.string())});
    return false;
  }
  return true;
}

} // namespace pef::core
