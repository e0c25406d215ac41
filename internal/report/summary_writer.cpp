#include "summary_writer.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace pef::report {

namespace {

void WriteItems(std::ostringstream& out, const char* heading, const std::vector<model::UnmatchedItem>& items) {
  out << "\n" << heading << " (" << items.size() << ")\n";
  for (const auto& item : items) {
    out << "  " << item.source_path.string();
    if (!item.dest_path.empty()) {
      out << " -> " << item.dest_path.string();
    }
    out << " [" << item.reason << "]\n";
  }
}

} // namespace

std::string FormatSummary(const model::RunReport& report) {
  const auto& s = report.stats;
  const auto& c = report.cumulative_stats;

  std::ostringstream out;
  out << "Photo export fixer summary\n";
  out << "==========================\n";
  out << "Status:      " << (report.cancelled ? "cancelled" : "completed") << (report.resumed ? " (resumed)" : "") << "\n";
  out << "Output:      " << report.output_dir.string() << "\n";
  out << "Started:     " << util::FormatLocal(report.started_at) << "\n";
  out << "Finished:    " << util::FormatLocal(report.finished_at) << "\n";
  out << "Elapsed:     " << std::fixed << std::setprecision(1) << report.elapsed_seconds << "s\n";
  out << "\n";
  out << "                     this run   total\n";
  out << "Processed:           " << std::setw(8) << s.processed << std::setw(8) << c.processed << "\n";
  out << "Skipped:             " << std::setw(8) << s.skipped << std::setw(8) << c.skipped << "\n";
  out << "Errors:              " << std::setw(8) << s.errors << std::setw(8) << c.errors << "\n";
  out << "Tag errors:          " << std::setw(8) << s.tag_errors << std::setw(8) << c.tag_errors << "\n";
  out << "With location:       " << std::setw(8) << s.with_geo << std::setw(8) << c.with_geo << "\n";
  out << "With people:         " << std::setw(8) << s.with_people << std::setw(8) << c.with_people << "\n";
  out << "Unmatched sidecars:  " << std::setw(8) << s.unmatched_sidecars << std::setw(8) << c.unmatched_sidecars << "\n";
  out << "Unmatched media:     " << std::setw(8) << s.unmatched_media << std::setw(8) << c.unmatched_media << "\n";
  if (report.skipped_count > 0) {
    out << "Already done:        " << std::setw(8) << report.skipped_count << "\n";
  }

  out << "\nProcessed files (" << report.processed.size() << ")\n";
  for (const auto& item : report.processed) {
    out << "  " << item.source_path.string() << " -> " << item.dest_path.string() << " [" << item.sidecar_path.string() << "] "
        << util::FormatLocal(item.processed_at) << "\n";
  }
  WriteItems(out, "Unmatched sidecars", report.unmatched_sidecars);
  WriteItems(out, "Unmatched media", report.unmatched_media);

  if (!report.errors.empty()) {
    out << "\nErrors (" << report.errors.size() << ")\n";
    for (const auto& error : report.errors) {
      out << "  " << error << "\n";
    }
  }
  return out.str();
}

void WriteSummary(const std::filesystem::path& file, const model::RunReport& report, std::error_code& ec) {
  ec.clear();
  std::filesystem::create_directories(file.parent_path(), ec);
  if (ec) {
    return;
  }

  std::ofstream out(file, std::ios::trunc);
  out << FormatSummary(report);
  out.flush();
  if (!out) {
    ec = std::make_error_code(std::errc::io_error);
  }
}

} // namespace pef::report
