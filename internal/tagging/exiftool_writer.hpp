#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/tagging/tag_writer.hpp"

namespace pef::tagging {

/*
  TagWriter backed by the exiftool command line tool.

  Every call spawns one exiftool process that rewrites the file in place.
  A call that runs past `timeout` is killed and reported as a failure.
*/
class ExifToolTagWriter : public TagWriter {
 public:
  ExifToolTagWriter(std::string executable, std::chrono::milliseconds timeout);

  // True when `<executable> -ver` runs and exits cleanly.
  bool Available() const;

  bool WriteTags(const std::filesystem::path& file, const metadata::TagMap& tags) override;

  static std::vector<std::string> BuildArguments(const std::filesystem::path& file, const metadata::TagMap& tags);

  const std::string& executable() const {
    return executable_;
  }

 private:
  // Exit status of the child, or -1 when it could not be run or timed out.
  int Run(const std::vector<std::string>& args) const;

  std::string               executable_;
  std::chrono::milliseconds timeout_;
};

} // namespace pef::tagging
