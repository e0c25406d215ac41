#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/model/media_record.hpp"
#include "internal/model/sidecar_metadata.hpp"
#include "internal/observability/run_log.hpp"
#include "internal/storage/disk/media_store.hpp"
#include "internal/tagging/tag_writer.hpp"

namespace pef::core {

/*
  Result of handling one media file. `record` is the input record; once the
  file is in place its dest_path, sidecar_path (matched files only) and
  processed_at are set.
*/
struct FileOutcome {
  bool               ok = false;
  model::MediaRecord record;
  // Tags were requested and the writer reported a failure.
  bool        tag_failed = false;
  std::string error;
};

/*
  Applies sidecars to media files.

  Copy failures are returned, never thrown. Timestamp and tag failures do
  not undo a copy: the file stays in place and the failure is reported in
  the outcome. `tag_writer` may be null, in which case only timestamps are
  applied.
*/
class Processor {
 public:
  Processor(std::shared_ptr<storage::MediaStore> store, tagging::TagWriterPtr tag_writer, observability::RunLog& log);

  // Copies into <dest>/<album>/, stamps the capture time, writes tags.
  FileOutcome ApplyMatch(const model::MediaRecord& record, const model::SidecarMetadata& metadata);

  // Copies unmodified into <dest>/Unprocessed/<album>/.
  FileOutcome CopyUnmatched(const model::MediaRecord& record);

  // Writes tags onto an already copied file, no copy. `record` comes from a
  // scan of the destination.
  FileOutcome ExtendTags(const model::MediaRecord& record, const model::SidecarMetadata& metadata);

  bool tagging_enabled() const {
    return static_cast<bool>(tag_writer_);
  }

 private:
  bool WriteTags(const std::filesystem::path& file, const model::SidecarMetadata& metadata);

  std::shared_ptr<storage::MediaStore> store_;
  tagging::TagWriterPtr                tag_writer_;
  observability::RunLog&               log_;
};

} // namespace pef::core
