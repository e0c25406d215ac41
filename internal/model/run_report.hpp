#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "internal/model/media_record.hpp"
#include "internal/model/processing_stats.hpp"
#include "internal/util/time.hpp"

namespace pef::model {

struct ProcessedItem {
  std::filesystem::path source_path;
  std::filesystem::path dest_path;
  std::filesystem::path sidecar_path;
  util::TimePoint       processed_at{};
};

inline ProcessedItem ToProcessedItem(const MediaRecord& record) {
  return {record.path, record.dest_path, record.sidecar_path, record.processed_at.value_or(util::Now())};
}

struct UnmatchedItem {
  std::filesystem::path source_path;
  // Empty for sidecars and for media that could not be copied.
  std::filesystem::path dest_path;
  std::string           reason;
};

/*
  Outcome of one process or extend invocation.

  `stats` covers this invocation only; `cumulative_stats` adds everything
  recorded by earlier invocations that this one resumed.
*/
struct RunReport {
  bool                  cancelled = false;
  bool                  resumed   = false;
  std::filesystem::path output_dir;
  // Sidecars skipped because an earlier invocation already resolved them.
  std::uint64_t skipped_count = 0;

  ProcessingStats stats;
  ProcessingStats cumulative_stats;

  std::vector<ProcessedItem> processed;
  std::vector<UnmatchedItem> unmatched_sidecars;
  std::vector<UnmatchedItem> unmatched_media;
  std::vector<std::string>   errors;
  std::vector<std::string>   warnings;

  util::TimePoint       started_at{};
  util::TimePoint       finished_at{};
  double                elapsed_seconds = 0.0;
  std::filesystem::path log_file;
  std::filesystem::path summary_file;
};

// Counts from a scan-and-match pass that writes nothing.
struct DryRunReport {
  bool cancelled = false;

  std::uint64_t sidecar_count      = 0;
  std::uint64_t media_count        = 0;
  std::uint64_t album_count        = 0;
  std::uint64_t matched_sidecars   = 0;
  std::uint64_t unmatched_sidecars = 0;
  std::uint64_t matched_media      = 0;
  std::uint64_t unmatched_media    = 0;
  std::uint64_t with_geo           = 0;
  std::uint64_t with_people        = 0;
  bool          tagging_available  = false;

  std::vector<UnmatchedItem> unmatched;
  std::vector<std::string>   errors;
  std::vector<std::string>   warnings;
};

} // namespace pef::model
