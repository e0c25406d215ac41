#include "internal/match/matcher.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/unicode.hpp"

namespace {

using pef::match::Matcher;
using pef::model::FileIndex;
using pef::model::MediaRecord;

MediaRecord Media(const std::string& album, const std::string& filename, const std::string& root = "/takeout") {
  MediaRecord record;
  record.filename = filename;
  record.album    = album;
  record.path     = root + "/" + album + "/" + filename;
  return record;
}

const std::vector<std::string> kSuffixes = {"", "-edited"};

void TestPlainTitleMatchesWithEmptySuffix() {
  FileIndex index;
  index.Add(Media("AlbumX", "photo.jpg"));

  const auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(result.found);
  assert(result.records.size() == 1);
  assert(result.matched_filename == "photo.jpg");
  assert(result.title == "photo.jpg");
}

void TestDuplicateMarkerIsReinserted() {
  FileIndex index;
  index.Add(Media("AlbumX", "photo.jpg"));
  index.Add(Media("AlbumX", "photo(1).jpg"));

  const auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg(1).json", "photo.jpg", index, kSuffixes);
  assert(result.found);
  assert(result.records.size() == 1);
  assert(result.records[0].filename == "photo(1).jpg");
}

void TestMarkedSidecarTriesEverySuffixWithMarker() {
  const FileIndex empty{};
  const Matcher   matcher(empty, kSuffixes);
  const auto      candidates = matcher.Candidates("/takeout/A/photo.jpg(2).json", "photo.jpg");
  assert(candidates.size() == 2);
  assert(candidates[0] == "photo(2).jpg");
  assert(candidates[1] == "photo-edited(2).jpg");
}

void TestEditedVariantMatchesWhenOriginalMissing() {
  FileIndex index;
  index.Add(Media("AlbumX", "photo-edited.jpg"));

  const auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(result.found);
  assert(result.matched_filename == "photo-edited.jpg");
}

void TestFirstSuffixWins() {
  FileIndex index;
  index.Add(Media("AlbumX", "photo.jpg"));
  index.Add(Media("AlbumX", "photo-edited.jpg"));

  auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(result.records.size() == 1);
  assert(result.matched_filename == "photo.jpg");

  result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, {"-edited", ""});
  assert(result.matched_filename == "photo-edited.jpg");
}

void TestAllDuplicatesUnderOneKeyAreReturned() {
  FileIndex index;
  index.Add(Media("AlbumX", "photo.jpg", "/takeout"));
  index.Add(Media("AlbumX", "photo.jpg", "/other"));
  index.Add(Media("AlbumX", "photo.jpg", "/third"));
  assert(index.KeyCount() == 1);
  assert(index.RecordCount() == 3);

  const auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(result.found);
  assert(result.records.size() == 3);
  assert(result.records[0].path == "/takeout/AlbumX/photo.jpg");
  assert(result.records[2].path == "/third/AlbumX/photo.jpg");
}

void TestAlbumComesFromSidecarDirectory() {
  FileIndex index;
  index.Add(Media("AlbumY", "photo.jpg"));

  const auto result = pef::match::Resolve("/takeout/AlbumX/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(!result.found);
  assert(result.records.empty());
  assert(result.sidecar_path == "/takeout/AlbumX/photo.jpg.json");
}

void TestTruncatedTitleMatchesTruncatedFile() {
  const std::string title = std::string(70, 'L') + ".jpg";
  const std::string disk  = std::string(47, 'L') + ".jpg";

  FileIndex index;
  index.Add(Media("A", disk));

  const auto result = pef::match::Resolve("/takeout/A/" + std::string(46, 'L') + ".json", title, index, kSuffixes);
  assert(result.found);
  assert(result.matched_filename == disk);
}

void TestNumberedEditFallback() {
  FileIndex index;
  index.Add(Media("A", "photo-edited(3).jpg"));

  const auto result = pef::match::Resolve("/takeout/A/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(result.found);
  assert(result.matched_filename == "photo-edited(3).jpg");

  // a marked sidecar never falls back
  const auto marked = pef::match::Resolve("/takeout/A/photo.jpg(1).json", "photo.jpg", index, kSuffixes);
  assert(!marked.found);
}

void TestMissIsDeterministic() {
  FileIndex index;
  index.Add(Media("A", "other.jpg"));

  const auto first  = pef::match::Resolve("/takeout/A/photo.jpg.json", "photo.jpg", index, kSuffixes);
  const auto second = pef::match::Resolve("/takeout/A/photo.jpg.json", "photo.jpg", index, kSuffixes);
  assert(!first.found && !second.found);
  assert(first.matched_filename.empty());
}

void TestValidateSuffixes() {
  pef::match::ValidateSuffixes(kSuffixes);

  bool threw = false;
  try {
    pef::match::ValidateSuffixes({"", "-edited", ""});
  } catch (const pef::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    pef::match::ValidateSuffixes({"x/y"});
  } catch (const pef::util::ConfigurationError&) {
    threw = true;
  }
  assert(threw);
}

void TestDecomposedNamesMatchComposedTitles() {
  // "Café.jpg" in "München", decomposed on disk as a macOS copy leaves it
  const std::string nfd_album = "Mu\xCC\x88nchen";
  const std::string nfd_file  = "Cafe\xCC\x81.jpg";
  const std::string nfc_album = "M\xC3\xBCnchen";
  const std::string nfc_title = "Caf\xC3\xA9.jpg";

  FileIndex decomposed;
  decomposed.Add(Media(nfd_album, nfd_file));
  const auto result =
      pef::match::Resolve("/takeout/" + nfc_album + "/" + nfc_title + ".json", nfc_title, decomposed, kSuffixes);
  assert(result.found);
  assert(result.records.size() == 1);
  // the record keeps its on-disk spelling
  assert(result.records[0].filename == nfd_file);

  FileIndex composed;
  composed.Add(Media(nfc_album, nfc_title));
  assert(pef::match::Resolve("/takeout/" + nfd_album + "/" + nfd_file + ".json", nfd_file, composed, kSuffixes).found);
}

void TestNfcLeavesAsciiAndInvalidBytesAlone() {
  assert(pef::util::ToNfc("photo.jpg") == "photo.jpg");
  assert(pef::util::ToNfc("Cafe\xCC\x81") == "Caf\xC3\xA9");
  assert(pef::util::ToNfc("Caf\xC3\xA9") == "Caf\xC3\xA9");
  const std::string latin1 = "Caf\xE9.jpg";
  assert(pef::util::ToNfc(latin1) == latin1);
}

} // namespace

int main() {
  TestPlainTitleMatchesWithEmptySuffix();
  TestDuplicateMarkerIsReinserted();
  TestMarkedSidecarTriesEverySuffixWithMarker();
  TestEditedVariantMatchesWhenOriginalMissing();
  TestFirstSuffixWins();
  TestAllDuplicatesUnderOneKeyAreReturned();
  TestAlbumComesFromSidecarDirectory();
  TestTruncatedTitleMatchesTruncatedFile();
  TestNumberedEditFallback();
  TestMissIsDeterministic();
  TestValidateSuffixes();
  TestDecomposedNamesMatchComposedTitles();
  TestNfcLeavesAsciiAndInvalidBytesAlone();

  std::cout << "pef_unit_matcher: pass\n";
  return 0;
}
