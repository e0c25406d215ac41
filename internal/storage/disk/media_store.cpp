#include "media_store.hpp"

#include <fcntl.h>
#include <sys/stat.h>

#include <cerrno>

#include "internal/storage/common/path_utils.hpp"

namespace pef::storage {

namespace fs = std::filesystem;

namespace {

// Attempts before giving up on a name another worker keeps taking.
constexpr int kMaxPlaceAttempts = 16;

} // namespace

MediaStore::MediaStore(fs::path root) : root_(std::move(root)) {
}

fs::path MediaStore::AlbumDir(const std::string& album, const std::string& area, std::error_code& ec) {
  ec.clear();
  const auto key = area + '/' + album;

  std::lock_guard lock(mutex_);
  auto            it = dirs_.find(key);
  if (it != dirs_.end()) {
    return it->second;
  }

  fs::path dir = area.empty() ? root_ : root_ / area;
  dir /= common::SafeComponent(album);

  fs::create_directories(dir, ec);
  if (ec) {
    return {};
  }
  dirs_.emplace(key, dir);
  return dir;
}

fs::path MediaStore::Place(const fs::path& source, const std::string& album, const std::string& area, std::error_code& ec) {
  const auto dir = AlbumDir(album, area, ec);
  if (ec) {
    return {};
  }

  const auto name = source.filename();
  for (int attempt = 0; attempt < kMaxPlaceAttempts; ++attempt) {
    auto target = common::UniquePath(dir / name);

    // copy_options::none fails when a concurrent copy claimed the name first.
    ec.clear();
    fs::copy_file(source, target, fs::copy_options::none, ec);
    if (!ec) {
      return target;
    }
    if (ec != std::errc::file_exists) {
      return {};
    }
  }
  return {};
}

void MediaStore::SetFileTimes(const fs::path& file, util::TimePoint when, std::error_code& ec) {
  ec.clear();
  const auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(when.time_since_epoch()).count();

  struct timespec times[2];
  times[0].tv_sec  = static_cast<time_t>(nanos / 1000000000LL);
  times[0].tv_nsec = static_cast<long>(nanos % 1000000000LL);
  if (times[0].tv_nsec < 0) {
    times[0].tv_sec -= 1;
    times[0].tv_nsec += 1000000000L;
  }
  times[1] = times[0];

  if (::utimensat(AT_FDCWD, file.c_str(), times, 0) != 0) {
    ec.assign(errno, std::generic_category());
  }
}

} // namespace pef::storage
