#include "internal/core/processor.hpp"

#include <sys/stat.h>

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "tests/common/recording_tag_writer.hpp"

namespace {

namespace fs = std::filesystem;

using pef::core::Processor;
using pef::model::MediaRecord;
using pef::model::SidecarMetadata;
using pef::observability::RunLog;
using pef::storage::MediaStore;
using pef::testing::RecordingTagWriter;

fs::path FreshDir(const std::string& name) {
  const auto dir = fs::temp_directory_path() / "pef_processor_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

MediaRecord WriteMedia(const fs::path& root, const std::string& album, const std::string& name, const std::string& body) {
  fs::create_directories(root / album);
  {
    std::ofstream out(root / album / name);
    out << body;
  }
  MediaRecord record;
  record.filename = name;
  record.album    = album;
  record.path     = root / album / name;
  return record;
}

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

SidecarMetadata Metadata(const fs::path& sidecar) {
  SidecarMetadata md;
  md.path     = sidecar;
  md.title    = "a.jpg";
  md.taken_at = pef::util::FromUnixSeconds(1262304000);  // 2010-01-01
  md.people   = {"Alice"};
  return md;
}

void TestApplyMatchCopiesStampsAndTags() {
  const auto src    = FreshDir("apply_src");
  const auto dst    = FreshDir("apply_dst");
  const auto record = WriteMedia(src, "Trip", "a.jpg", "original");
  auto       writer = std::make_shared<RecordingTagWriter>();

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), writer, log);

  const auto outcome = processor.ApplyMatch(record, Metadata(src / "Trip" / "a.jpg.json"));
  assert(outcome.ok);
  assert(!outcome.tag_failed);
  assert(outcome.record.dest_path == dst / "Trip" / "a.jpg");
  assert(ReadAll(outcome.record.dest_path) == "original");
  assert(ReadAll(record.path) == "original");
  assert(outcome.record.path == record.path);
  assert(outcome.record.sidecar_path == src / "Trip" / "a.jpg.json");
  assert(outcome.record.processed_at.has_value());
  assert(record.dest_path.empty());

  struct stat st {};
  assert(::stat(outcome.record.dest_path.c_str(), &st) == 0);
  assert(st.st_mtime == 1262304000);

  const auto calls = writer->calls();
  assert(calls.size() == 1);
  assert(calls[0].file == outcome.record.dest_path);
  assert(calls[0].tags.at("PersonInImage")[0] == "Alice");

  // a second copy never overwrites the first
  const auto again = processor.ApplyMatch(record, Metadata(src / "Trip" / "a.jpg.json"));
  assert(again.ok);
  assert(again.record.dest_path == dst / "Trip" / "a(1).jpg");
}

void TestTagFailureKeepsCopy() {
  const auto src    = FreshDir("tagfail_src");
  const auto dst    = FreshDir("tagfail_dst");
  const auto record = WriteMedia(src, "Trip", "a.jpg", "x");
  auto       writer = std::make_shared<RecordingTagWriter>();
  writer->FailFor("a.jpg");

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), writer, log);

  const auto outcome = processor.ApplyMatch(record, Metadata(src / "Trip" / "a.jpg.json"));
  assert(outcome.ok);
  assert(outcome.tag_failed);
  assert(fs::exists(outcome.record.dest_path));
}

void TestNoTagsMeansNoCall() {
  const auto src    = FreshDir("notags_src");
  const auto dst    = FreshDir("notags_dst");
  const auto record = WriteMedia(src, "Trip", "a.jpg", "x");
  auto       writer = std::make_shared<RecordingTagWriter>();

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), writer, log);

  auto md   = Metadata(src / "Trip" / "a.jpg.json");
  md.people = {};
  assert(processor.ApplyMatch(record, md).ok);
  assert(writer->calls().empty());

  // without a writer only timestamps are applied
  Processor bare(std::make_shared<MediaStore>(dst), nullptr, log);
  const auto outcome = bare.ApplyMatch(record, Metadata(src / "Trip" / "a.jpg.json"));
  assert(outcome.ok && !outcome.tag_failed);
}

void TestCopyUnmatchedGoesToUnprocessed() {
  const auto src    = FreshDir("unmatched_src");
  const auto dst    = FreshDir("unmatched_dst");
  const auto record = WriteMedia(src, "Trip", "b.mov", "movie");
  auto       writer = std::make_shared<RecordingTagWriter>();

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), writer, log);

  const auto outcome = processor.CopyUnmatched(record);
  assert(outcome.ok);
  assert(outcome.record.dest_path == dst / "Unprocessed" / "Trip" / "b.mov");
  assert(ReadAll(outcome.record.dest_path) == "movie");
  assert(outcome.record.sidecar_path.empty());
  assert(outcome.record.processed_at.has_value());
  assert(writer->calls().empty());
}

void TestMissingSourceIsReportedNotThrown() {
  const auto dst = FreshDir("missing_dst");

  MediaRecord record;
  record.filename = "gone.jpg";
  record.album    = "Trip";
  record.path     = "/nonexistent/pef/Trip/gone.jpg";

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), nullptr, log);

  const auto outcome = processor.CopyUnmatched(record);
  assert(!outcome.ok);
  assert(!outcome.error.empty());
  assert(outcome.record.dest_path.empty());
  assert(!outcome.record.processed_at.has_value());
}

void TestExtendTagsOnly() {
  const auto dst    = FreshDir("extend_dst");
  const auto record = WriteMedia(dst, "Trip", "a.jpg", "copied");
  auto       writer = std::make_shared<RecordingTagWriter>();

  RunLog    log;
  Processor processor(std::make_shared<MediaStore>(dst), writer, log);

  const auto outcome = processor.ExtendTags(record, Metadata("/src/Trip/a.jpg.json"));
  assert(outcome.ok);
  assert(outcome.record.dest_path == record.path);
  assert(outcome.record.sidecar_path == "/src/Trip/a.jpg.json");
  assert(writer->calls().size() == 1);
  assert(!fs::exists(dst / "Trip" / "a(1).jpg"));

  Processor bare(std::make_shared<MediaStore>(dst), nullptr, log);
  assert(!bare.ExtendTags(record, Metadata("/src/Trip/a.jpg.json")).ok);
}

} // namespace

int main() {
  TestApplyMatchCopiesStampsAndTags();
  TestTagFailureKeepsCopy();
  TestNoTagsMeansNoCall();
  TestCopyUnmatchedGoesToUnprocessed();
  TestMissingSourceIsReportedNotThrown();
  TestExtendTagsOnly();

  std::cout << "pef_unit_processor: pass\n";
  return 0;
}
