#include "tag_builder.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace pef::metadata {

namespace {

std::string FormatNumber(double value) {
  std::ostringstream out;
  out << std::setprecision(10) << value;
  return out.str();
}

} // namespace

TagMap BuildGpsTags(const model::SidecarMetadata& metadata) {
  if (!metadata.HasLocation()) {
    return {};
  }

  const auto& geo = *metadata.geo;
  return {
      {"GPSLatitude", {FormatNumber(std::fabs(geo.latitude))}},
      {"GPSLatitudeRef", {geo.latitude >= 0 ? "N" : "S"}},
      {"GPSLongitude", {FormatNumber(std::fabs(geo.longitude))}},
      {"GPSLongitudeRef", {geo.longitude >= 0 ? "E" : "W"}},
      {"GPSAltitude", {FormatNumber(std::fabs(geo.altitude))}},
      {"GPSAltitudeRef", {geo.altitude >= 0 ? "0" : "1"}},
  };
}

TagMap BuildPeopleTags(const model::SidecarMetadata& metadata) {
  if (!metadata.HasPeople()) {
    return {};
  }

  std::string joined;
  for (const auto& name : metadata.people) {
    if (!joined.empty()) {
      joined += ';';
    }
    joined += name;
  }

  return {
      {"PersonInImage", metadata.people},
      {"Keywords", metadata.people},
      {"Subject", metadata.people},
      {"XPKeywords", {joined}},
  };
}

TagMap BuildDescriptionTags(const model::SidecarMetadata& metadata) {
  if (!metadata.HasDescription()) {
    return {};
  }
  return {
      {"ImageDescription", {metadata.description}},
      {"Caption-Abstract", {metadata.description}},
      {"Description", {metadata.description}},
  };
}

TagMap BuildTags(const model::SidecarMetadata& metadata) {
  TagMap tags = BuildGpsTags(metadata);
  tags.merge(BuildPeopleTags(metadata));
  tags.merge(BuildDescriptionTags(metadata));
  return tags;
}

} // namespace pef::metadata
