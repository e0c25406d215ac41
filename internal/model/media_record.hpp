#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "internal/util/time.hpp"

namespace pef::model {

/*
  One media file found by the scanner.

  The destination fields are empty after a scan. The processor returns a
  copy with them set once the file has been copied or tagged.
*/
struct MediaRecord {
  std::string           filename;
  std::filesystem::path path;
  std::string           album;

  std::filesystem::path          dest_path;
  std::filesystem::path          sidecar_path;
  std::optional<util::TimePoint> processed_at;
};

} // namespace pef::model
