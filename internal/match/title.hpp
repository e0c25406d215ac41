#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace pef::match {

// The export truncates on-disk names to this many bytes (base + extension).
inline constexpr std::size_t kMaxFilenameBytes = 51;

inline constexpr int kMaxDuplicateIndex = 999;

/*
  A sidecar title reduced to the pieces candidate filenames are built from.

  base is already truncated the way the export truncates on-disk names.
  duplicate_marker is "(N)" when the sidecar itself carried one, else empty.
*/
struct ParsedTitle {
  std::string base;
  std::string extension;
  std::string duplicate_marker;

  // base + suffix + marker + extension, e.g. "photo-edited(1).jpg".
  std::string BuildFilename(std::string_view suffix = {}) const;
};

// Splits "name.ext" at the last dot. Leading dots do not start an extension.
std::pair<std::string, std::string> SplitExtension(const std::string& filename);

// Cuts `base` so that base + extension is exactly kMaxFilenameBytes bytes
// when the pair is longer than that; identity otherwise.
std::string TruncateBase(const std::string& base, const std::string& extension);

// N from a sidecar named "...(N).json", N in 1..999 without leading zeros.
std::optional<int> DuplicateIndex(const std::filesystem::path& sidecar_path);

// `title` is brought to NFC before it is split and truncated.
ParsedTitle ParseTitle(const std::string& title, const std::filesystem::path& sidecar_path);

} // namespace pef::match
