#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "internal/match/title.hpp"
#include "internal/model/file_index.hpp"
#include "internal/model/match_result.hpp"

namespace pef::match {

// Order matters: the first suffix whose candidate is indexed wins.
std::vector<std::string> DefaultSuffixes();

// Throws ConfigurationError for a suffix holding a path separator or a
// suffix listed twice.
void ValidateSuffixes(const std::vector<std::string>& suffixes);

// Highest "(n)" tried when an edited variant was also duplicate-numbered.
inline constexpr int kMaxVariantIndex = 10;

/*
  Resolves one sidecar to the media file(s) it describes.

  Candidates are built from the sidecar's title (truncated like the export
  truncates names), the configured suffixes in order, and the sidecar's own
  "(N)" marker moved in front of the media extension. The album is the
  sidecar's parent directory. The first candidate present in the index wins
  and every record under that key is returned.

  When nothing hits and the sidecar has no marker, each non-empty suffix is
  tried again with "(1)".."(10)" to catch duplicate-numbered edits such as
  photo-edited(1).jpg.

  A pure function of its inputs: same title, path, index and suffix order
  always give the same result.
*/
class Matcher {
 public:
  Matcher(const model::FileIndex& index, std::vector<std::string> suffixes);

  model::MatchResult Resolve(const std::filesystem::path& sidecar_path, const std::string& title) const;

  // Filenames looked up for this sidecar, in lookup order.
  std::vector<std::string> Candidates(const std::filesystem::path& sidecar_path, const std::string& title) const;

  const std::vector<std::string>& suffixes() const {
    return suffixes_;
  }

 private:
  const model::FileIndex&  index_;
  std::vector<std::string> suffixes_;
};

model::MatchResult Resolve(const std::filesystem::path& sidecar_path, const std::string& title, const model::FileIndex& index,
                           const std::vector<std::string>& suffixes);

} // namespace pef::match
