#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace pef::model {

struct GeoCoordinate {
  double latitude  = 0.0;
  double longitude = 0.0;
  double altitude  = 0.0;

  // The export writes (0,0) when it has no location.
  bool IsValid() const {
    return latitude != 0.0 || longitude != 0.0;
  }
};

/*
  Parsed form of one sidecar file. Built once per sidecar, never mutated.
*/
struct SidecarMetadata {
  std::filesystem::path        path;
  std::string                  title;
  util::TimePoint              taken_at{};
  std::optional<GeoCoordinate> geo;
  std::vector<std::string>     people;
  std::string                  description;

  bool HasLocation() const {
    return geo.has_value() && geo->IsValid();
  }

  bool HasPeople() const {
    return !people.empty();
  }

  bool HasDescription() const {
    return !description.empty();
  }
};

} // namespace pef::model
