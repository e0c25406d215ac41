#include "internal/scan/scanner.hpp"

#include <unistd.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace {

namespace fs = std::filesystem;

using pef::scan::Scanner;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "pef_scanner_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

void Touch(const fs::path& path) {
  fs::create_directories(path.parent_path());
  std::ofstream out(path);
  out << "data";
}

void TestClassifiesAndIndexes() {
  const auto root = FreshDir("classify");
  Touch(root / "AlbumA" / "a.jpg");
  Touch(root / "AlbumA" / "a.jpg.json");
  Touch(root / "AlbumA" / "metadata.json");
  Touch(root / "AlbumB" / "b.mp4");
  Touch(root / "AlbumB" / "Nested" / "c.png");

  const auto result = Scanner(root).Scan();
  assert(result.sidecars.size() == 2);
  assert(result.media.size() == 3);
  assert(result.AlbumCount() == 3);
  assert(result.index.Contains("AlbumA", "a.jpg"));
  assert(result.index.Contains("AlbumB", "b.mp4"));
  assert(result.index.Contains("Nested", "c.png"));
  assert(!result.index.Contains("AlbumA", "a.jpg.json"));
  assert(result.warnings.empty());
}

void TestOrderIsStable() {
  const auto root = FreshDir("order");
  Touch(root / "A" / "c.jpg");
  Touch(root / "A" / "a.jpg");
  Touch(root / "A" / "b.jpg");

  const auto first  = Scanner(root).Scan();
  const auto second = Scanner(root).Scan();
  assert(first.media.size() == 3);
  assert(first.media[0].filename == "a.jpg");
  assert(first.media[2].filename == "c.jpg");
  for (std::size_t i = 0; i < first.media.size(); ++i) {
    assert(first.media[i].path == second.media[i].path);
  }
}

void TestDuplicatesAreKept() {
  const auto root = FreshDir("duplicates");
  Touch(root / "one" / "Same" / "photo.jpg");
  Touch(root / "two" / "Same" / "photo.jpg");

  const auto result  = Scanner(root).Scan();
  const auto records = result.index.Find("Same", "photo.jpg");
  assert(records != nullptr);
  assert(records->size() == 2);
}

void TestExcludedRootDirectories() {
  const auto root = FreshDir("exclude");
  Touch(root / "Album" / "a.jpg");
  Touch(root / "_pef" / "processing_state.json");
  Touch(root / "Unprocessed" / "Album" / "x.jpg");

  Scanner scanner(root);
  scanner.Exclude("_pef");
  scanner.Exclude("Unprocessed");
  const auto result = scanner.Scan();
  assert(result.media.size() == 1);
  assert(result.sidecars.empty());
}

void TestProgressIsIndeterminateUntilDone() {
  const auto root = FreshDir("progress");
  for (int i = 0; i < 250; ++i) {
    Touch(root / "Album" / ("f" + std::to_string(i) + ".jpg"));
  }

  std::vector<std::pair<std::uint64_t, std::uint64_t>> calls;
  Scanner(root).Scan([&](std::uint64_t current, std::uint64_t total, std::string_view) { calls.emplace_back(current, total); });

  assert(calls.size() >= 3);
  for (std::size_t i = 0; i + 1 < calls.size(); ++i) {
    assert(calls[i].second == 0);
  }
  assert(calls.back().first == 250);
  assert(calls.back().second == 250);
}

void TestMissingRootIsConfigurationError() {
  bool threw = false;
  try {
    Scanner("/nonexistent/pef/source").Scan();
  } catch (const pef::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestUnreadableSubdirectoryIsWarning() {
  if (::geteuid() == 0) {
    // root reads everything
    return;
  }
  const auto root = FreshDir("unreadable");
  Touch(root / "Open" / "a.jpg");
  Touch(root / "Locked" / "b.jpg");
  fs::permissions(root / "Locked", fs::perms::none);

  const auto result = Scanner(root).Scan();
  fs::permissions(root / "Locked", fs::perms::owner_all);

  assert(result.media.size() == 1);
  assert(result.warnings.size() == 1);
}

void TestDirectoryLinksAreNotMedia() {
  const auto root = FreshDir("links");
  Touch(root / "Trip" / "a.jpg");
  Touch(fs::temp_directory_path() / "pef_scanner_tests" / "links_target" / "b.jpg");
  fs::create_directory_symlink(fs::temp_directory_path() / "pef_scanner_tests" / "links_target", root / "Trip" / "shared");
  fs::create_symlink(root / "Trip" / "a.jpg", root / "Trip" / "alias.jpg");

  const auto result = Scanner(root).Scan();

  // the file link is still media, the directory link is neither media nor walked
  assert(result.media.size() == 2);
  for (const auto& record : result.media) {
    assert(record.filename != "shared");
    assert(record.filename != "b.jpg");
  }
  assert(result.warnings.size() == 1);
  assert(result.warnings[0].find("shared") != std::string::npos);
}

} // namespace

int main() {
  TestClassifiesAndIndexes();
  TestOrderIsStable();
  TestDuplicatesAreKept();
  TestExcludedRootDirectories();
  TestProgressIsIndeterminateUntilDone();
  TestMissingRootIsConfigurationError();
  TestUnreadableSubdirectoryIsWarning();
  TestDirectoryLinksAreNotMedia();

  std::cout << "pef_unit_scanner: pass\n";
  return 0;
}
