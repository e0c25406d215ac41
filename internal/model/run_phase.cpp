#include "run_phase.hpp"

namespace pef::model {

using pef::state::v1::RUN_PHASE_COPYING_UNMATCHED;
using pef::state::v1::RUN_PHASE_DONE;
using pef::state::v1::RUN_PHASE_MATCHING;
using pef::state::v1::RUN_PHASE_SCANNING;
using pef::state::v1::RUN_PHASE_UNSPECIFIED;

const char* PhaseName(RunPhase phase) {
  switch (phase) {
    case RunPhase::kScanSource:
      return "scan_source";
    case RunPhase::kScanDest:
      return "scan_dest";
    case RunPhase::kLoadState:
      return "load_state";
    case RunPhase::kMatchAndCopy:
      return "match_and_copy";
    case RunPhase::kCopyUnmatched:
      return "copy_unmatched";
    case RunPhase::kFinalize:
      return "finalize";
    case RunPhase::kDone:
      return "done";
    case RunPhase::kCancelled:
      return "cancelled";
    default:
      return "unspecified";
  }
}

pef::state::v1::RunPhase ToPersisted(RunPhase phase) {
  switch (phase) {
    case RunPhase::kScanSource:
    case RunPhase::kScanDest:
    case RunPhase::kLoadState:
      return RUN_PHASE_SCANNING;
    case RunPhase::kMatchAndCopy:
      return RUN_PHASE_MATCHING;
    case RunPhase::kCopyUnmatched:
      return RUN_PHASE_COPYING_UNMATCHED;
    case RunPhase::kFinalize:
    case RunPhase::kDone:
      return RUN_PHASE_DONE;
    default:
      return RUN_PHASE_UNSPECIFIED;
  }
}

RunPhase FromPersisted(pef::state::v1::RunPhase phase) {
  switch (phase) {
    case RUN_PHASE_MATCHING:
      return RunPhase::kMatchAndCopy;
    case RUN_PHASE_COPYING_UNMATCHED:
      return RunPhase::kCopyUnmatched;
    case RUN_PHASE_DONE:
      return RunPhase::kDone;
    default:
      return RunPhase::kScanSource;
  }
}

} // namespace pef::model
