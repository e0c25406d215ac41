#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>

#include "internal/util/time.hpp"

namespace pef::storage {

inline constexpr char kUnprocessedDirName[] = "Unprocessed";

/*
  Destination tree of one run.

  Properties:
    - never overwrites: colliding names get a "(n)" marker
    - album directories are created once and cached
    - safe to call from several copy workers
*/
class MediaStore {
 public:
  explicit MediaStore(std::filesystem::path root);

  // <root>/<album>, or <root>/<area>/<album> when `area` is set.
  std::filesystem::path AlbumDir(const std::string& album, const std::string& area, std::error_code& ec);

  /*
    Copies `source` into the album directory under its own file name (or
    the first free "(n)" variant). Returns the written path; on failure
    returns an empty path and sets `ec`. `source` is only read.
  */
  std::filesystem::path Place(const std::filesystem::path& source, const std::string& album, const std::string& area,
                              std::error_code& ec);

  // Sets access and modification time of `file`.
  static void SetFileTimes(const std::filesystem::path& file, util::TimePoint when, std::error_code& ec);

  const std::filesystem::path& root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;

  std::mutex                                             mutex_;
  std::unordered_map<std::string, std::filesystem::path> dirs_;
};

} // namespace pef::storage
