#pragma once

#include <cstdint>

#include "pef/state/v1/state.pb.h"

namespace pef::model {

enum class RunPhase : std::uint8_t {
  kUnspecified   = 0,
  kScanSource    = 1,
  kScanDest      = 2,
  kLoadState     = 3,
  kMatchAndCopy  = 4,
  kCopyUnmatched = 5,
  kFinalize      = 6,
  kDone          = 7,
  kCancelled     = 8,
};

constexpr bool IsTerminal(RunPhase phase) {
  return phase == RunPhase::kDone || phase == RunPhase::kCancelled;
}

constexpr bool CanTransition(RunPhase from, RunPhase to) {
  if (from == to) {
    return true;
  }
  if (IsTerminal(from)) {
    return false;
  }
  if (to == RunPhase::kUnspecified) {
    return false;
  }
  if (to == RunPhase::kCancelled) {
    return true;
  }
  // scan-dest and load-state are alternatives after the source scan
  if (from == RunPhase::kScanDest && to == RunPhase::kLoadState) {
    return false;
  }

  return static_cast<std::uint8_t>(to) > static_cast<std::uint8_t>(from);
}

const char* PhaseName(RunPhase phase);

// Persisted phase marker for a live phase.
pef::state::v1::RunPhase ToPersisted(RunPhase phase);

// Phase a resumed run continues from.
RunPhase FromPersisted(pef::state::v1::RunPhase phase);

} // namespace pef::model
