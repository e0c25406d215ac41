#include "internal/metadata/sidecar_reader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using pef::metadata::ParseSidecar;
using pef::metadata::ReadSidecar;
using pef::util::SidecarParseError;

const char* kFullSidecar = R"({
  "title": "IMG_0001.jpg",
  "description": "Eiffel tower",
  "imageViews": "12",
  "creationTime": {"timestamp": "1600000100", "formatted": "Sep 13, 2020"},
  "photoTakenTime": {"timestamp": "1600000000", "formatted": "Sep 13, 2020, 12:26:40 PM UTC"},
  "geoData": {"latitude": 48.8584, "longitude": 2.2945, "altitude": 35.0, "latitudeSpan": 0.0, "longitudeSpan": 0.0},
  "geoDataExif": {"latitude": 0.0, "longitude": 0.0, "altitude": 0.0},
  "people": [{"name": "Alice"}, {"name": ""}, {"name": "Bob"}],
  "url": "https://photos.example/abc",
  "googlePhotosOrigin": {"mobileUpload": {"deviceType": "ANDROID_PHONE"}}
})";

bool ThrowsParseError(const std::string& json) {
  try {
    (void)ParseSidecar(json, "test.json");
  } catch (const SidecarParseError&) {
    return true;
  }
  return false;
}

void TestFullSidecar() {
  const auto md = ParseSidecar(kFullSidecar, "/t/A/IMG_0001.jpg.json");
  assert(md.title == "IMG_0001.jpg");
  assert(md.path == "/t/A/IMG_0001.jpg.json");
  assert(pef::util::ToUnixSeconds(md.taken_at) == 1600000000);
  assert(md.description == "Eiffel tower");
  assert(md.HasLocation());
  assert(md.geo->latitude == 48.8584);
  assert(md.geo->altitude == 35.0);
  assert(md.people.size() == 2);
  assert(md.people[0] == "Alice");
  assert(md.people[1] == "Bob");
}

void TestNumericTimestampAccepted() {
  const auto md = ParseSidecar(R"({"title":"a.jpg","photoTakenTime":{"timestamp":1500000000}})", "a.json");
  assert(pef::util::ToUnixSeconds(md.taken_at) == 1500000000);
  assert(!md.HasLocation());
  assert(!md.HasPeople());
  assert(!md.HasDescription());
}

void TestZeroGeoIsAbsent() {
  const auto md = ParseSidecar(
      R"({"title":"a.jpg","photoTakenTime":{"timestamp":"1"},"geoData":{"latitude":0.0,"longitude":0.0}})", "a.json");
  assert(!md.geo.has_value());
  assert(!md.HasLocation());
}

void TestExifGeoFallback() {
  const auto md = ParseSidecar(R"({"title":"a.jpg","photoTakenTime":{"timestamp":"1"},
      "geoData":{"latitude":0.0,"longitude":0.0},
      "geoDataExif":{"latitude":-33.8568,"longitude":151.2153,"altitude":-2.5}})",
                               "a.json");
  assert(md.HasLocation());
  assert(md.geo->latitude == -33.8568);
  assert(md.geo->altitude == -2.5);
}

void TestMissingRequiredFields() {
  assert(ThrowsParseError(R"({"photoTakenTime":{"timestamp":"1"}})"));
  assert(ThrowsParseError(R"({"title":"a.jpg"})"));
  assert(ThrowsParseError(R"({"title":"a.jpg","photoTakenTime":{"formatted":"x"}})"));
  assert(ThrowsParseError(R"({"title":"a.jpg","photoTakenTime":{"timestamp":"soon"}})"));
  assert(ThrowsParseError("not json"));
}

void TestReadFromDisk() {
  const auto dir = std::filesystem::temp_directory_path() / "pef_sidecar_reader_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "IMG_0001.jpg.json";
  {
    std::ofstream out(path);
    out << kFullSidecar;
  }
  assert(ReadSidecar(path).title == "IMG_0001.jpg");

  bool threw = false;
  try {
    (void)ReadSidecar(dir / "missing.json");
  } catch (const SidecarParseError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullSidecar();
  TestNumericTimestampAccepted();
  TestZeroGeoIsAbsent();
  TestExifGeoFallback();
  TestMissingRequiredFields();
  TestReadFromDisk();

  std::cout << "pef_unit_sidecar_reader: pass\n";
  return 0;
}
