#include "matcher.hpp"

#include <set>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pef::match {

std::vector<std::string> DefaultSuffixes() {
  return {"", "-edited"};
}

void ValidateSuffixes(const std::vector<std::string>& suffixes) {
  std::set<std::string> seen;
  for (const auto& suffix : suffixes) {
    if (suffix.find('/') != std::string::npos || suffix.find('\0') != std::string::npos) {
      throw util::ConfigurationError("suffix must not contain a path separator: '" + suffix + "'");
    }
    if (!seen.insert(suffix).second) {
      throw util::ConfigurationError("duplicate suffix: '" + suffix + "'");
    }
  }
}

Matcher::Matcher(const model::FileIndex& index, std::vector<std::string> suffixes) : index_(index), suffixes_(std::move(suffixes)) {
}

std::vector<std::string> Matcher::Candidates(const std::filesystem::path& sidecar_path, const std::string& title) const {
  const auto parsed = ParseTitle(title, sidecar_path);

  std::vector<std::string> out;
  for (const auto& suffix : suffixes_) {
    out.push_back(parsed.BuildFilename(suffix));
  }

  if (!parsed.duplicate_marker.empty()) {
    return out;
  }

  for (const auto& suffix : suffixes_) {
    if (suffix.empty()) {
      continue;
    }
    for (int n = 1; n <= kMaxVariantIndex; ++n) {
      out.push_back(parsed.base + suffix + "(" + std::to_string(n) + ")" + parsed.extension);
    }
  }
  return out;
}

model::MatchResult Matcher::Resolve(const std::filesystem::path& sidecar_path, const std::string& title) const {
  model::MatchResult result;
  result.sidecar_path = sidecar_path;
  result.title        = title;

  const auto album = storage::common::AlbumName(sidecar_path);
  for (const auto& filename : Candidates(sidecar_path, title)) {
    if (const auto* records = index_.Find(album, filename)) {
      result.found            = true;
      result.records          = *records;
      result.matched_filename = filename;
      return result;
    }
  }
  return result;
}

model::MatchResult Resolve(const std::filesystem::path& sidecar_path, const std::string& title, const model::FileIndex& index,
                           const std::vector<std::string>& suffixes) {
  return Matcher(index, suffixes).Resolve(sidecar_path, title);
}

} // namespace pef::match
