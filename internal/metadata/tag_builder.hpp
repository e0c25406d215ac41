#pragma once

#include <map>
#include <string>
#include <vector>

#include "internal/model/sidecar_metadata.hpp"

namespace pef::metadata {

// Tag name -> values. List tags carry one value per entry.
using TagMap = std::map<std::string, std::vector<std::string>>;

TagMap BuildGpsTags(const model::SidecarMetadata& metadata);
TagMap BuildPeopleTags(const model::SidecarMetadata& metadata);
TagMap BuildDescriptionTags(const model::SidecarMetadata& metadata);

// Union of the three; empty when the sidecar has nothing to write.
TagMap BuildTags(const model::SidecarMetadata& metadata);

} // namespace pef::metadata
