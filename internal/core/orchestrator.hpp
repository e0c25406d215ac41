#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "internal/core/cancellation.hpp"
#include "internal/core/processor.hpp"
#include "internal/match/matcher.hpp"
#include "internal/model/progress.hpp"
#include "internal/model/run_phase.hpp"
#include "internal/model/run_report.hpp"
#include "internal/observability/run_log.hpp"
#include "internal/scan/scanner.hpp"
#include "internal/state/run_state.hpp"
#include "internal/tagging/tag_writer.hpp"

namespace pef::core {

struct RunOptions {
  std::filesystem::path    source;
  std::filesystem::path    dest;
  std::vector<std::string> suffixes = match::DefaultSuffixes();

  bool          write_tags    = true;
  bool          force         = false;
  bool          detailed_log  = true;
  std::uint32_t copy_workers  = 1;
  std::uint32_t save_interval = 100;
};

/*
  Drives a whole run through its phases:

      SCAN_SOURCE → SCAN_DEST | LOAD_STATE → MATCH_AND_COPY
                  → COPY_UNMATCHED → FINALIZE → DONE

  with CANCELLED reachable from every live phase. The cancellation token is
  polled once per loop iteration; on cancellation the state is persisted
  and the run returns early with `cancelled` set.

  Destination choice for Process(), looking at dest, dest(1), dest(2), ...
  in that order:
    - force:                           reuse dest in place, prior state dropped
    - a state of the same configuration: resume there. A completed run is
                                       resumed too, so only source files
                                       added since are handled
    - dest without (readable) state:   reuse in place, created if missing
    - otherwise:                       fresh run in the first free dest(n)

  ConfigurationError escapes before any destination is touched. Per-item
  failures are counted and reported, never thrown.
*/
class Orchestrator {
 public:
  Orchestrator(RunOptions options, tagging::TagWriterPtr tag_writer, std::shared_ptr<CancellationToken> cancel);

  // Scans and matches the source; nothing is written anywhere.
  model::DryRunReport DryRun(const model::ProgressCallback& on_progress = {});

  // Full pipeline: copy, stamp and tag matched media, copy leftovers.
  model::RunReport Process(const model::ProgressCallback& on_progress = {});

  // Writes tags onto files of an existing destination without copying.
  model::RunReport Extend(const model::ProgressCallback& on_progress = {});

  model::RunPhase phase() const {
    return phase_.load();
  }

  const RunOptions& options() const {
    return options_;
  }

 private:
  void Transition(model::RunPhase to);

  // Both return false when cancelled.
  bool MatchAndCopy(const scan::ScanResult& source, Processor& processor, state::RunState& state, model::RunReport& report,
                    const model::ProgressCallback& on_progress);
  bool CopyLeftovers(const scan::ScanResult& source, Processor& processor, state::RunState& state, model::RunReport& report,
                     const model::ProgressCallback& on_progress);
  void CopyLeftover(const model::MediaRecord& record, Processor& processor, state::RunState& state, model::RunReport& report);

  void Finish(model::RunReport& report, std::chrono::steady_clock::time_point started) const;

  RunOptions                         options_;
  tagging::TagWriterPtr              tag_writer_;
  std::shared_ptr<CancellationToken> cancel_;

  std::atomic<model::RunPhase> phase_{model::RunPhase::kUnspecified};

  // Guards report lists and progress callbacks while copy workers run.
  std::mutex report_mutex_;
};

} // namespace pef::core
