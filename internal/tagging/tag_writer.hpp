#pragma once

#include <filesystem>
#include <memory>

#include "internal/metadata/tag_builder.hpp"

namespace pef::tagging {

/*
  External metadata writer.

  WriteTags reports success or failure per file; a failure never stops a
  run, it is counted as a tag error. Implementations must tolerate calls
  from several threads.
*/
class TagWriter {
 public:
  virtual ~TagWriter() = default;

  virtual bool WriteTags(const std::filesystem::path& file, const metadata::TagMap& tags) = 0;
};

using TagWriterPtr = std::shared_ptr<TagWriter>;

} // namespace pef::tagging
