#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/media_record.hpp"

namespace pef::model {

struct MatchResult {
  bool                     found = false;
  std::filesystem::path    sidecar_path;
  std::string              title;
  std::vector<MediaRecord> records;
  // Filename that produced the hit, empty on a miss.
  std::string              matched_filename;
};

} // namespace pef::model
