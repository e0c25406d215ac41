#pragma once

#include <cstdint>

#include "pef/state/v1/state.pb.h"

namespace pef::model {

struct ProcessingStats {
  std::uint64_t processed          = 0;
  std::uint64_t skipped            = 0;
  std::uint64_t errors             = 0;
  std::uint64_t tag_errors         = 0;
  std::uint64_t with_geo           = 0;
  std::uint64_t with_people        = 0;
  std::uint64_t unmatched_sidecars = 0;
  std::uint64_t unmatched_media    = 0;

  std::uint64_t Total() const {
    return processed + skipped + errors;
  }

  ProcessingStats& operator+=(const ProcessingStats& other);
};

pef::state::v1::ProcessingStats ToProto(const ProcessingStats& stats);
ProcessingStats                 FromProto(const pef::state::v1::ProcessingStats& stats);

} // namespace pef::model
