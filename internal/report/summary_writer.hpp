#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include "internal/model/run_report.hpp"

namespace pef::report {

inline constexpr char kSummaryFileName[] = "summary.txt";

// Human readable summary: totals first, then one line per item.
std::string FormatSummary(const model::RunReport& report);

// Writes FormatSummary(report) to `file`; sets `ec` on failure.
void WriteSummary(const std::filesystem::path& file, const model::RunReport& report, std::error_code& ec);

} // namespace pef::report
