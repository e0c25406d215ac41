#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include "internal/model/processing_stats.hpp"
#include "internal/model/run_phase.hpp"
#include "internal/state/state_store.hpp"
#include "pef/state/v1/state.pb.h"

namespace pef::state {

/*
  Live bookkeeping of one process run.

  The skip-sets, the cumulative stats and the stats of the current
  invocation only change together, under one mutex, through
  RecordSidecar() and RecordMedia(). Copy workers call these concurrently.

  Persisted every `save_interval` recorded items, on every phase change,
  and on Save()/Complete().
*/
class RunState {
 public:
  // A fresh run.
  RunState(StateStore store, pef::state::v1::Fingerprint fingerprint, std::uint64_t total_sidecars,
           std::uint32_t save_interval);
  // Continues a loaded state.
  RunState(StateStore store, const pef::state::v1::ProcessingState& loaded, std::uint32_t save_interval);

  RunState(const RunState&)            = delete;
  RunState& operator=(const RunState&) = delete;

  bool IsSidecarDone(const std::string& path) const;
  bool IsMediaCopied(const std::string& path) const;

  // Marks the sidecar resolved and adds `delta` to both stat views.
  void RecordSidecar(const std::string& path, const model::ProcessingStats& delta);
  // Marks the media file copied and adds `delta` to both stat views.
  void RecordMedia(const std::string& path, const model::ProcessingStats& delta);
  // Stats without touching the skip-sets (failed copies, skips).
  void RecordStats(const model::ProcessingStats& delta);

  // Entering a phase marks the run IN_PROGRESS again.
  void            SetPhase(model::RunPhase phase);
  model::RunPhase Phase() const;
  bool            IsCompleted() const;

  // Persists the current state. Returns false (and logs) on failure.
  bool Save();
  // Marks the run COMPLETED/DONE and persists it.
  bool Complete();

  model::ProcessingStats SessionStats() const;
  model::ProcessingStats CumulativeStats() const;
  std::size_t            SidecarsDone() const;

 private:
  void AfterRecordLocked();
  bool SaveLocked();
  pef::state::v1::ProcessingState SnapshotLocked() const;

  mutable std::mutex mutex_;
  StateStore         store_;

  pef::state::v1::Fingerprint fingerprint_;
  pef::state::v1::RunStatus   status_ = pef::state::v1::RUN_STATUS_IN_PROGRESS;
  model::RunPhase             phase_  = model::RunPhase::kScanSource;
  std::uint64_t               total_sidecars_ = 0;
  google::protobuf::Timestamp started_at_;

  // Sets answer lookups; the vectors keep the persisted order stable.
  std::unordered_set<std::string> sidecars_;
  std::unordered_set<std::string> media_;
  std::vector<std::string>        sidecar_order_;
  std::vector<std::string>        media_order_;

  model::ProcessingStats cumulative_;
  model::ProcessingStats session_;

  std::uint32_t save_interval_;
  std::uint32_t unsaved_ = 0;
};

} // namespace pef::state
