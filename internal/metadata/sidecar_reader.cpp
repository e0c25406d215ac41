#include "sidecar_reader.hpp"

#include <google/protobuf/util/json_util.h>

#include <fstream>
#include <sstream>

#include "internal/util/errors.hpp"

namespace pef::metadata {

using pef::util::SidecarParseError;

namespace {

std::optional<model::GeoCoordinate> ToGeo(const pef::takeout::v1::GeoData& geo) {
  model::GeoCoordinate out;
  out.latitude  = geo.latitude();
  out.longitude = geo.longitude();
  out.altitude  = geo.altitude();
  if (!out.IsValid()) {
    return std::nullopt;
  }
  return out;
}

} // namespace

model::SidecarMetadata FromProto(const pef::takeout::v1::Sidecar& sidecar, const std::filesystem::path& path) {
  if (!sidecar.has_title()) {
    throw SidecarParseError("missing title: " + path.string());
  }
  if (!sidecar.has_photo_taken_time() || !sidecar.photo_taken_time().has_timestamp()) {
    throw SidecarParseError("missing photoTakenTime.timestamp: " + path.string());
  }

  model::SidecarMetadata out;
  out.path        = path;
  out.title       = sidecar.title();
  out.taken_at    = util::FromUnixSeconds(sidecar.photo_taken_time().timestamp());
  out.description = sidecar.description();

  out.geo = ToGeo(sidecar.geo_data());
  if (!out.geo) {
    out.geo = ToGeo(sidecar.geo_data_exif());
  }

  for (const auto& person : sidecar.people()) {
    if (!person.name().empty()) {
      out.people.push_back(person.name());
    }
  }
  return out;
}

model::SidecarMetadata ParseSidecar(const std::string& json, const std::filesystem::path& path) {
  pef::takeout::v1::Sidecar sidecar;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, &sidecar, options);
  if (!status.ok()) {
    throw SidecarParseError("invalid sidecar " + path.string() + ": " + std::string(status.message()));
  }
  return FromProto(sidecar, path);
}

model::SidecarMetadata ReadSidecar(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw SidecarParseError("cannot open sidecar: " + path.string());
  }

  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    throw SidecarParseError("cannot read sidecar: " + path.string());
  }
  return ParseSidecar(buffer.str(), path);
}

} // namespace pef::metadata
