#pragma once

#include <filesystem>
#include <string>

namespace pef::storage::common {

// Name of the directory holding `path` ("Vacation 2023" for ".../Vacation 2023/a.jpg").
inline std::string AlbumName(const std::filesystem::path& path) {
  return path.parent_path().filename().string();
}

// Album names become a single destination path component.
inline std::string SafeComponent(const std::string& name) {
  if (name.empty() || name == "." || name == "..") {
    return "_";
  }
  return name;
}

/*
  Returns `path` when nothing exists there, otherwise the first free
  "name(n)" variant. Files keep their extension after the marker:
  photo.jpg -> photo(1).jpg. Directories get the marker appended.
*/
std::filesystem::path UniquePath(const std::filesystem::path& path, bool is_dir = false);

/*
  Ensures a directory exists and returns it. With only_new set, an existing
  directory is never reused and a fresh "(n)" sibling is created instead.
  Throws ConfigurationError when the path exists as a regular file.
*/
std::filesystem::path CheckoutDir(const std::filesystem::path& path, bool only_new = false);

// Trims whitespace, expands a leading "~" and drops trailing separators.
std::filesystem::path NormalizePath(const std::string& raw);

// True when `child` equals `parent` or lies beneath it (lexically).
bool IsWithin(const std::filesystem::path& child, const std::filesystem::path& parent);

} // namespace pef::storage::common
