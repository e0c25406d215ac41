#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/file_index.hpp"
#include "internal/model/media_record.hpp"
#include "internal/model/progress.hpp"

namespace pef::scan {

inline constexpr char kSidecarExtension[] = ".json";

struct ScanResult {
  std::filesystem::path              root;
  std::vector<std::filesystem::path> sidecars;
  std::vector<model::MediaRecord>    media;
  model::FileIndex                   index;
  // One entry per directory or entry that could not be read.
  std::vector<std::string> warnings;

  std::size_t AlbumCount() const;
};

/*
  Walks a tree once and splits it into sidecar paths and media records.

  Sidecars are only collected here, never opened. Entries inside each
  directory are visited in name order so repeated scans of an unchanged
  tree produce identical results. An unreadable root throws
  ConfigurationError; unreadable subdirectories are skipped and reported
  through ScanResult::warnings.
*/
class Scanner {
 public:
  explicit Scanner(std::filesystem::path root);

  ScanResult Scan(const model::ProgressCallback& on_progress = {}) const;

  // Directories (relative names) left out of the walk, e.g. "_pef".
  void Exclude(std::string name);

  static bool IsSidecar(const std::filesystem::path& path);

 private:
  void Walk(const std::filesystem::path& dir, ScanResult* result, std::uint64_t* found, const model::ProgressCallback& on_progress) const;

  std::filesystem::path    root_;
  std::vector<std::string> excluded_;
};

} // namespace pef::scan
