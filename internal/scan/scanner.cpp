#include "scanner.hpp"

#include <algorithm>
#include <set>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace pef::scan {

namespace fs = std::filesystem;

using observability::StringField;

namespace {

constexpr std::uint64_t kProgressInterval = 100;

bool EndsWith(const std::string& value, const std::string& suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::size_t ScanResult::AlbumCount() const {
  std::set<std::string> albums;
  for (const auto& record : media) {
    albums.insert(record.album);
  }
  return albums.size();
}

Scanner::Scanner(fs::path root) : root_(std::move(root)) {
}

void Scanner::Exclude(std::string name) {
  excluded_.push_back(std::move(name));
}

bool Scanner::IsSidecar(const fs::path& path) {
  return EndsWith(path.filename().string(), kSidecarExtension);
}

ScanResult Scanner::Scan(const model::ProgressCallback& on_progress) const {
  std::error_code ec;
  if (!fs::exists(root_, ec) || ec) {
    throw util::ConfigurationError("source path does not exist: " + root_.string());
  }
  if (!fs::is_directory(root_, ec) || ec) {
    throw util::ConfigurationError("source path is not a directory: " + root_.string());
  }

  fs::directory_iterator listing(root_, ec);
  if (ec) {
    throw util::ConfigurationError("source path is not readable: " + root_.string() + ": " + ec.message());
  }

  ScanResult result;
  result.root = root_;

  std::uint64_t found = 0;
  Walk(root_, &result, &found, on_progress);

  for (const auto& record : result.media) {
    result.index.Add(record);
  }

  const auto total = static_cast<std::uint64_t>(result.sidecars.size() + result.media.size());
  model::Report(on_progress, total, total, "Scan complete");
  return result;
}

void Scanner::Walk(const fs::path& dir, ScanResult* result, std::uint64_t* found, const model::ProgressCallback& on_progress) const {
  std::error_code        ec;
  fs::directory_iterator it(dir, ec);
  if (ec) {
    result->warnings.push_back("cannot read directory " + dir.string() + ": " + ec.message());
    PEF_LOG_WARN("Skipping unreadable directory", {StringField("path", dir.string()), StringField("error", ec.message())});
    return;
  }

  std::vector<fs::path> dirs;
  std::vector<fs::path> files;
  for (fs::directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      result->warnings.push_back("cannot list " + dir.string() + ": " + ec.message());
      PEF_LOG_WARN("Directory listing interrupted", {StringField("path", dir.string()), StringField("error", ec.message())});
      break;
    }

    std::error_code status_ec;
    const auto      status = it->symlink_status(status_ec);
    if (status_ec) {
      result->warnings.push_back("cannot stat " + it->path().string() + ": " + status_ec.message());
      continue;
    }

    if (fs::is_directory(status)) {
      const auto name = it->path().filename().string();
      if (dir == root_ && std::find(excluded_.begin(), excluded_.end(), name) != excluded_.end()) {
        continue;
      }
      dirs.push_back(it->path());
    } else if (fs::is_symlink(status) && fs::is_directory(it->status(status_ec))) {
      result->warnings.push_back("not following directory link " + it->path().string());
      PEF_LOG_WARN("Not following directory link", {StringField("path", it->path().string())});
    } else {
      files.push_back(it->path());
    }
  }

  std::sort(dirs.begin(), dirs.end());
  std::sort(files.begin(), files.end());

  const std::string album = dir.filename().string();
  if (*found > 0 && !files.empty()) {
    model::Report(on_progress, *found, 0, "Scanning: " + album + "...");
  }

  for (const auto& file : files) {
    if (IsSidecar(file)) {
      result->sidecars.push_back(file);
    } else {
      model::MediaRecord record;
      record.filename = file.filename().string();
      record.path     = file;
      record.album    = storage::common::AlbumName(file);
      result->media.push_back(std::move(record));
    }

    ++*found;
    if (*found % kProgressInterval == 0) {
      model::Report(on_progress, *found, 0, "Found " + std::to_string(*found) + " files...");
    }
  }

  for (const auto& sub : dirs) {
    Walk(sub, result, found, on_progress);
  }
}

} // namespace pef::scan
