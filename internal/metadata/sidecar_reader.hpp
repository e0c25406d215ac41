#pragma once

#include <filesystem>
#include <string>

#include "internal/model/sidecar_metadata.hpp"
#include "pef/takeout/v1/sidecar.pb.h"

namespace pef::metadata {

/*
  Parses one sidecar file.

  Throws SidecarParseError when the file cannot be read, is not JSON, or
  lacks a title or a photoTakenTime timestamp. Unknown keys are ignored.
*/
model::SidecarMetadata ReadSidecar(const std::filesystem::path& path);

// Same as ReadSidecar for an in-memory document; `path` is only recorded.
model::SidecarMetadata ParseSidecar(const std::string& json, const std::filesystem::path& path);

// Conversion of an already decoded message.
model::SidecarMetadata FromProto(const pef::takeout::v1::Sidecar& sidecar, const std::filesystem::path& path);

} // namespace pef::metadata
