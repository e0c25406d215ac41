#include "internal/model/run_phase.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using namespace pef::model;

static_assert(CanTransition(RunPhase::kScanSource, RunPhase::kScanDest));
static_assert(CanTransition(RunPhase::kScanSource, RunPhase::kLoadState));
static_assert(!CanTransition(RunPhase::kScanDest, RunPhase::kLoadState));
static_assert(!CanTransition(RunPhase::kCopyUnmatched, RunPhase::kMatchAndCopy));
static_assert(!CanTransition(RunPhase::kDone, RunPhase::kScanSource));
static_assert(!CanTransition(RunPhase::kCancelled, RunPhase::kDone));
static_assert(IsTerminal(RunPhase::kDone));
static_assert(IsTerminal(RunPhase::kCancelled));
static_assert(!IsTerminal(RunPhase::kFinalize));

void TestEveryLivePhaseCanCancel() {
  for (auto phase : {RunPhase::kScanSource, RunPhase::kScanDest, RunPhase::kLoadState, RunPhase::kMatchAndCopy,
                     RunPhase::kCopyUnmatched, RunPhase::kFinalize}) {
    assert(CanTransition(phase, RunPhase::kCancelled));
  }
}

void TestResumeSkipsFinishedPhases() {
  assert(CanTransition(RunPhase::kLoadState, RunPhase::kCopyUnmatched));
  assert(CanTransition(RunPhase::kLoadState, RunPhase::kFinalize));
}

void TestPersistedMapping() {
  assert(ToPersisted(RunPhase::kScanSource) == pef::state::v1::RUN_PHASE_SCANNING);
  assert(ToPersisted(RunPhase::kMatchAndCopy) == pef::state::v1::RUN_PHASE_MATCHING);
  assert(ToPersisted(RunPhase::kCopyUnmatched) == pef::state::v1::RUN_PHASE_COPYING_UNMATCHED);
  assert(ToPersisted(RunPhase::kDone) == pef::state::v1::RUN_PHASE_DONE);

  for (auto phase : {RunPhase::kMatchAndCopy, RunPhase::kCopyUnmatched, RunPhase::kDone}) {
    assert(FromPersisted(ToPersisted(phase)) == phase);
  }
  assert(FromPersisted(pef::state::v1::RUN_PHASE_UNSPECIFIED) == RunPhase::kScanSource);
  assert(std::string(PhaseName(RunPhase::kCopyUnmatched)) == "copy_unmatched");
}

} // namespace

int main() {
  TestEveryLivePhaseCanCancel();
  TestResumeSkipsFinishedPhases();
  TestPersistedMapping();

  std::cout << "pef_unit_run_phase: pass\n";
  return 0;
}
