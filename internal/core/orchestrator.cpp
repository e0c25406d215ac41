#include "orchestrator.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <unordered_set>
#include <vector>

#include "internal/copy/copy_scheduler.hpp"
#include "internal/copy/copy_worker.hpp"
#include "internal/metadata/sidecar_reader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/summary_writer.hpp"
#include "internal/state/state_store.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/disk/media_store.hpp"
#include "internal/util/errors.hpp"

namespace pef::core {

namespace fs = std::filesystem;

using model::ProcessingStats;
using model::RunPhase;
using pef::observability::BoolField;
using pef::observability::IntField;
using pef::observability::StringField;

namespace {

constexpr char kLogFileName[] = "detailed_logs.txt";

// Leftovers waiting ahead of the copy workers.
constexpr std::size_t kQueuedCopiesPerWorker = 4;

fs::path Absolute(const fs::path& path) {
  std::error_code ec;
  auto            absolute = fs::absolute(path, ec);
  return ec ? path : absolute.lexically_normal();
}

std::int64_t AsInt(std::uint64_t value) {
  return static_cast<std::int64_t>(value);
}

struct Destination {
  fs::path                                       dir;
  std::optional<pef::state::v1::ProcessingState> state;
};

/*
  Walks dest, dest(1), dest(2), ... and stops at the first directory that
  either holds a state of `fingerprint` (resume) or does not exist yet
  (fresh run). `dest` itself is also taken when it holds no readable state.
*/
Destination FindDestination(const fs::path& dest, const pef::state::v1::Fingerprint& fingerprint,
                            std::vector<std::string>* warnings) {
  std::error_code ec;
  for (unsigned n = 0;; ++n) {
    const fs::path dir = n == 0 ? dest : fs::path(dest.string() + "(" + std::to_string(n) + ")");
    if (!fs::exists(dir, ec)) {
      return {storage::common::CheckoutDir(dir), std::nullopt};
    }

    std::optional<pef::state::v1::ProcessingState> state;
    try {
      state = state::StateStore(dir).Load();
    } catch (const util::StateError& e) {
      PEF_LOG_WARN("Ignoring unreadable processing state", {StringField("error", e.what())});
      warnings->push_back(e.what());
    }

    if (state && state::SameConfiguration(state->fingerprint(), fingerprint)) {
      return {dir, std::move(state)};
    }
    if (!state && n == 0) {
      return {storage::common::CheckoutDir(dir), std::nullopt};
    }
  }
}

} // namespace

Orchestrator::Orchestrator(RunOptions options, tagging::TagWriterPtr tag_writer, std::shared_ptr<CancellationToken> cancel)
    : options_(std::move(options)), tag_writer_(std::move(tag_writer)), cancel_(std::move(cancel)) {
  if (!cancel_) {
    cancel_ = std::make_shared<CancellationToken>();
  }
  if (!options_.write_tags) {
    tag_writer_.reset();
  }
}

void Orchestrator::Transition(RunPhase to) {
  const auto from = phase_.load();
  if (!model::CanTransition(from, to)) {
    throw std::logic_error(std::string("invalid run phase transition ") + model::PhaseName(from) + " -> " + model::PhaseName(to));
  }
  phase_.store(to);
  PEF_LOG_DEBUG("Run phase", {StringField("from", model::PhaseName(from)), StringField("to", model::PhaseName(to))});
}

// ------------------------------------------------------------
// dry run
// ------------------------------------------------------------

model::DryRunReport Orchestrator::DryRun(const model::ProgressCallback& on_progress) {
  phase_.store(RunPhase::kUnspecified);
  model::DryRunReport report;

  if (options_.source.empty()) {
    throw util::ConfigurationError("source path is required");
  }
  match::ValidateSuffixes(options_.suffixes);

  Transition(RunPhase::kScanSource);
  const auto source = scan::Scanner(options_.source).Scan(on_progress);

  report.sidecar_count     = source.sidecars.size();
  report.media_count       = source.media.size();
  report.album_count       = source.AlbumCount();
  report.warnings          = source.warnings;
  report.tagging_available = static_cast<bool>(tag_writer_);

  if (source.sidecars.empty()) {
    report.errors.push_back("no sidecar (" + std::string(scan::kSidecarExtension) + ") files found in " + options_.source.string());
  }

  Transition(RunPhase::kMatchAndCopy);
  const match::Matcher            matcher(source.index, options_.suffixes);
  std::unordered_set<std::string> matched_media;

  const auto total = static_cast<std::uint64_t>(source.sidecars.size());
  for (std::size_t i = 0; i < source.sidecars.size(); ++i) {
    if (cancel_->IsCancelled()) {
      report.cancelled = true;
      break;
    }
    const auto& sidecar = source.sidecars[i];
    model::Report(on_progress, i + 1, total, "Analyzing: " + sidecar.filename().string());

    model::SidecarMetadata metadata;
    try {
      metadata = metadata::ReadSidecar(sidecar);
    } catch (const util::SidecarParseError& e) {
      ++report.unmatched_sidecars;
      report.unmatched.push_back({sidecar, {}, e.what()});
      continue;
    }

    const auto match = matcher.Resolve(sidecar, metadata.title);
    if (!match.found) {
      ++report.unmatched_sidecars;
      report.unmatched.push_back({sidecar, {}, "no media file for title '" + metadata.title + "'"});
      continue;
    }

    ++report.matched_sidecars;
    for (const auto& record : match.records) {
      matched_media.insert(record.path.string());
    }
    if (metadata.HasLocation()) ++report.with_geo;
    if (metadata.HasPeople()) ++report.with_people;
  }

  report.matched_media   = matched_media.size();
  report.unmatched_media = report.media_count - report.matched_media;

  Transition(report.cancelled ? RunPhase::kCancelled : RunPhase::kDone);
  return report;
}

// ------------------------------------------------------------
// process
// ------------------------------------------------------------

model::RunReport Orchestrator::Process(const model::ProgressCallback& on_progress) {
  phase_.store(RunPhase::kUnspecified);
  const auto       started = std::chrono::steady_clock::now();
  model::RunReport report;
  report.started_at = util::Now();

  if (options_.source.empty()) {
    throw util::ConfigurationError("source path is required");
  }
  match::ValidateSuffixes(options_.suffixes);

  // ------------------------------------------------------------
  // Scan source
  // ------------------------------------------------------------
  Transition(RunPhase::kScanSource);
  const auto source = scan::Scanner(options_.source).Scan(on_progress);
  report.warnings   = source.warnings;

  if (cancel_->IsCancelled()) {
    report.cancelled = true;
    Transition(RunPhase::kCancelled);
    Finish(report, started);
    return report;
  }

  // ------------------------------------------------------------
  // Pick destination: fresh, reuse or resume
  // ------------------------------------------------------------
  const auto fingerprint = state::MakeFingerprint(Absolute(options_.source), Absolute(options_.dest), options_.suffixes);

  fs::path                                       output;
  std::optional<pef::state::v1::ProcessingState> loaded;

  if (options_.force) {
    output = storage::common::CheckoutDir(options_.dest);
    state::StateStore(output).Remove();
  } else {
    auto found = FindDestination(options_.dest, fingerprint, &report.warnings);
    output     = std::move(found.dir);
    loaded     = std::move(found.state);
    if (output != options_.dest) {
      PEF_LOG_WARN("Destination holds a run with another configuration",
                   {StringField("dest", options_.dest.string()), StringField("output", output.string())});
      report.warnings.push_back("configuration differs from the run in " + options_.dest.string() + ", output written to " +
                                output.string());
    }
  }

  if (loaded) {
    Transition(RunPhase::kLoadState);
    report.resumed = true;
  } else {
    Transition(RunPhase::kScanDest);
  }
  report.output_dir = output;

  const auto            state_dir = state::StateStore(output).Dir();
  observability::RunLog log(options_.detailed_log ? state_dir / kLogFileName : fs::path());
  report.log_file = log.file();

  std::unique_ptr<state::RunState> run_state;
  if (loaded) {
    run_state            = std::make_unique<state::RunState>(state::StateStore(output), *loaded, options_.save_interval);
    report.skipped_count = run_state->SidecarsDone();
  } else {
    run_state = std::make_unique<state::RunState>(state::StateStore(output), fingerprint, source.sidecars.size(),
                                                  options_.save_interval);
    run_state->Save();
  }
  auto& state = *run_state;

  log.Info("Run started", {StringField("source", options_.source.string()), StringField("output", output.string()),
                           BoolField("resumed", report.resumed), BoolField("tags", static_cast<bool>(tag_writer_)),
                           IntField("sidecars", AsInt(source.sidecars.size())), IntField("media", AsInt(source.media.size()))});

  auto      store = std::make_shared<storage::MediaStore>(output);
  Processor processor(store, tag_writer_, log);

  // A completed run goes through both loops again; its skip-sets leave only
  // files added to the source since.
  const auto resume_from = loaded && !state.IsCompleted() ? state.Phase() : RunPhase::kMatchAndCopy;
  bool       finished    = true;

  // ------------------------------------------------------------
  // Match sidecars, copy and tag their media
  // ------------------------------------------------------------
  if (resume_from <= RunPhase::kMatchAndCopy) {
    Transition(RunPhase::kMatchAndCopy);
    state.SetPhase(RunPhase::kMatchAndCopy);
    finished = MatchAndCopy(source, processor, state, report, on_progress);
  }

  // ------------------------------------------------------------
  // Copy media no sidecar claimed
  // ------------------------------------------------------------
  if (finished && resume_from <= RunPhase::kCopyUnmatched) {
    Transition(RunPhase::kCopyUnmatched);
    state.SetPhase(RunPhase::kCopyUnmatched);
    finished = CopyLeftovers(source, processor, state, report, on_progress);
  }

  if (finished) {
    Transition(RunPhase::kFinalize);
    state.Complete();
  } else {
    report.cancelled = true;
    Transition(RunPhase::kCancelled);
    state.Save();
    log.Warn("Run cancelled, progress saved", {StringField("state", state::StateStore(output).Path().string())});
  }

  report.stats            = state.SessionStats();
  report.cumulative_stats = state.CumulativeStats();
  Finish(report, started);

  report.summary_file = state_dir / report::kSummaryFileName;
  std::error_code ec;
  report::WriteSummary(report.summary_file, report, ec);
  if (ec) {
    log.Warn("Could not write summary", {StringField("path", report.summary_file.string()), StringField("error", ec.message())});
    report.summary_file.clear();
  }

  log.Info("Run finished", {BoolField("cancelled", report.cancelled), IntField("processed", AsInt(report.stats.processed)),
                            IntField("errors", AsInt(report.stats.errors)),
                            IntField("unmatched_sidecars", AsInt(report.stats.unmatched_sidecars)),
                            IntField("unmatched_media", AsInt(report.stats.unmatched_media))});

  if (!report.cancelled) {
    Transition(RunPhase::kDone);
  }
  return report;
}

bool Orchestrator::MatchAndCopy(const scan::ScanResult& source, Processor& processor, state::RunState& state,
                                model::RunReport& report, const model::ProgressCallback& on_progress) {
  const match::Matcher matcher(source.index, options_.suffixes);
  const auto           total = static_cast<std::uint64_t>(source.sidecars.size());

  for (std::size_t i = 0; i < source.sidecars.size(); ++i) {
    if (cancel_->IsCancelled()) {
      return false;
    }

    const auto& sidecar = source.sidecars[i];
    const auto  key     = sidecar.string();
    model::Report(on_progress, i + 1, total, "Processing: " + sidecar.filename().string());

    if (state.IsSidecarDone(key)) {
      continue;
    }

    model::SidecarMetadata metadata;
    try {
      metadata = metadata::ReadSidecar(sidecar);
    } catch (const util::SidecarParseError& e) {
      report.unmatched_sidecars.push_back({sidecar, {}, e.what()});
      ProcessingStats delta;
      delta.unmatched_sidecars = 1;
      state.RecordSidecar(key, delta);
      continue;
    }

    const auto match = matcher.Resolve(sidecar, metadata.title);
    if (!match.found) {
      report.unmatched_sidecars.push_back({sidecar, {}, "no media file for title '" + metadata.title + "'"});
      ProcessingStats delta;
      delta.unmatched_sidecars = 1;
      state.RecordSidecar(key, delta);
      continue;
    }

    bool any_copied = false;
    for (const auto& record : match.records) {
      if (state.IsMediaCopied(record.path.string())) {
        any_copied = true;
        continue;
      }

      const auto outcome = processor.ApplyMatch(record, metadata);
      if (!outcome.ok) {
        ProcessingStats delta;
        delta.errors = 1;
        state.RecordStats(delta);
        report.errors.push_back(record.path.string() + ": " + outcome.error);
        continue;
      }

      ProcessingStats delta;
      delta.processed  = 1;
      delta.tag_errors = outcome.tag_failed ? 1 : 0;
      state.RecordMedia(record.path.string(), delta);
      report.processed.push_back(model::ToProcessedItem(outcome.record));
      if (outcome.tag_failed) {
        report.errors.push_back(outcome.record.dest_path.string() + ": tag write failed");
      }
      any_copied = true;
    }

    ProcessingStats delta;
    if (any_copied) {
      delta.with_geo    = metadata.HasLocation() ? 1 : 0;
      delta.with_people = metadata.HasPeople() ? 1 : 0;
    }
    state.RecordSidecar(key, delta);
  }
  return !cancel_->IsCancelled();
}

bool Orchestrator::CopyLeftovers(const scan::ScanResult& source, Processor& processor, state::RunState& state,
                                 model::RunReport& report, const model::ProgressCallback& on_progress) {
  std::vector<const model::MediaRecord*> leftovers;
  for (const auto& record : source.media) {
    if (!state.IsMediaCopied(record.path.string())) {
      leftovers.push_back(&record);
    }
  }
  const auto total = static_cast<std::uint64_t>(leftovers.size());

  if (options_.copy_workers <= 1) {
    for (std::size_t i = 0; i < leftovers.size(); ++i) {
      if (cancel_->IsCancelled()) {
        return false;
      }
      model::Report(on_progress, i + 1, total, "Copying unmatched: " + leftovers[i]->filename);
      CopyLeftover(*leftovers[i], processor, state, report);
    }
    return true;
  }

  auto scheduler = std::make_shared<copy::CopyScheduler>(options_.copy_workers * kQueuedCopiesPerWorker);
  std::uint64_t done = 0;

  auto handler = [&](const copy::CopyTask& task) {
    if (cancel_->IsCancelled()) {
      return;
    }
    CopyLeftover(task.record, processor, state, report);

    std::lock_guard lock(report_mutex_);
    model::Report(on_progress, ++done, total, "Copying unmatched: " + task.record.filename);
  };

  std::vector<std::unique_ptr<copy::CopyWorker>> workers;
  for (std::uint32_t i = 0; i < options_.copy_workers; ++i) {
    workers.push_back(std::make_unique<copy::CopyWorker>(scheduler, handler));
    workers.back()->Start();
  }

  for (const auto* record : leftovers) {
    if (cancel_->IsCancelled() || !scheduler->Enqueue(copy::CopyTask{*record})) {
      break;
    }
  }
  if (cancel_->IsCancelled()) {
    const auto dropped = scheduler->Abandon();
    PEF_LOG_INFO("Unmatched copies abandoned", {IntField("queued", AsInt(dropped))});
  } else {
    scheduler->Close();
  }
  for (auto& worker : workers) {
    worker->Join();
  }

  return !cancel_->IsCancelled();
}

void Orchestrator::CopyLeftover(const model::MediaRecord& record, Processor& processor, state::RunState& state,
                                model::RunReport& report) {
  const auto outcome = processor.CopyUnmatched(record);
  if (!outcome.ok) {
    ProcessingStats delta;
    delta.errors = 1;
    state.RecordStats(delta);

    std::lock_guard lock(report_mutex_);
    report.errors.push_back(record.path.string() + ": " + outcome.error);
    return;
  }

  ProcessingStats delta;
  delta.unmatched_media = 1;
  state.RecordMedia(record.path.string(), delta);

  std::lock_guard lock(report_mutex_);
  report.unmatched_media.push_back({record.path, outcome.record.dest_path, "no matching sidecar"});
}

// ------------------------------------------------------------
// extend
// ------------------------------------------------------------

model::RunReport Orchestrator::Extend(const model::ProgressCallback& on_progress) {
  phase_.store(RunPhase::kUnspecified);
  const auto       started = std::chrono::steady_clock::now();
  model::RunReport report;
  report.started_at = util::Now();
  report.output_dir = options_.dest;

  if (options_.source.empty()) {
    throw util::ConfigurationError("source path is required");
  }
  match::ValidateSuffixes(options_.suffixes);

  std::error_code ec;
  if (!fs::is_directory(options_.dest, ec)) {
    throw util::ConfigurationError("destination does not exist: " + options_.dest.string());
  }
  if (!tag_writer_) {
    throw util::ConfigurationError("extend needs a working tag writer and tag writing enabled");
  }

  Transition(RunPhase::kScanSource);
  const auto source = scan::Scanner(options_.source).Scan(on_progress);
  report.warnings   = source.warnings;

  Transition(RunPhase::kScanDest);
  scan::Scanner dest_scanner(options_.dest);
  dest_scanner.Exclude(state::kStateDirName);
  dest_scanner.Exclude(storage::kUnprocessedDirName);
  const auto dest = dest_scanner.Scan(on_progress);
  report.warnings.insert(report.warnings.end(), dest.warnings.begin(), dest.warnings.end());

  observability::RunLog log(options_.detailed_log ? state::StateStore(options_.dest).Dir() / kLogFileName : fs::path());
  report.log_file = log.file();
  log.Info("Extend started", {StringField("source", options_.source.string()), StringField("dest", options_.dest.string()),
                              IntField("sidecars", AsInt(source.sidecars.size())), IntField("files", AsInt(dest.media.size()))});

  Processor processor(std::make_shared<storage::MediaStore>(options_.dest), tag_writer_, log);

  Transition(RunPhase::kMatchAndCopy);
  const match::Matcher matcher(dest.index, options_.suffixes);
  const auto           total = static_cast<std::uint64_t>(source.sidecars.size());

  ProcessingStats stats;
  for (std::size_t i = 0; i < source.sidecars.size(); ++i) {
    if (cancel_->IsCancelled()) {
      report.cancelled = true;
      break;
    }

    const auto& sidecar = source.sidecars[i];
    model::Report(on_progress, i + 1, total, "Tagging: " + sidecar.filename().string());

    model::SidecarMetadata metadata;
    try {
      metadata = metadata::ReadSidecar(sidecar);
    } catch (const util::SidecarParseError& e) {
      ++stats.skipped;
      log.Detail("Skipping sidecar", {StringField("sidecar", sidecar.string()), StringField("error", e.what())});
      continue;
    }

    if (!metadata.HasLocation() && !metadata.HasPeople() && !metadata.HasDescription()) {
      ++stats.skipped;
      continue;
    }

    const auto match = matcher.Resolve(sidecar, metadata.title);
    if (!match.found) {
      ++stats.unmatched_sidecars;
      report.unmatched_sidecars.push_back({sidecar, {}, "no file in destination for title '" + metadata.title + "'"});
      continue;
    }

    bool any_tagged = false;
    for (const auto& record : match.records) {
      const auto outcome = processor.ExtendTags(record, metadata);
      if (!outcome.ok) {
        ++stats.errors;
        ++stats.tag_errors;
        report.errors.push_back(record.path.string() + ": " + outcome.error);
        continue;
      }
      ++stats.processed;
      report.processed.push_back(model::ToProcessedItem(outcome.record));
      any_tagged = true;
    }
    if (any_tagged) {
      stats.with_geo += metadata.HasLocation() ? 1 : 0;
      stats.with_people += metadata.HasPeople() ? 1 : 0;
    }
  }

  report.stats            = stats;
  report.cumulative_stats = stats;
  Finish(report, started);

  log.Info("Extend finished", {BoolField("cancelled", report.cancelled), IntField("tagged", AsInt(stats.processed)),
                               IntField("skipped", AsInt(stats.skipped)), IntField("errors", AsInt(stats.errors))});

  if (report.cancelled) {
    Transition(RunPhase::kCancelled);
  } else {
    Transition(RunPhase::kFinalize);
    Transition(RunPhase::kDone);
  }
  return report;
}

void Orchestrator::Finish(model::RunReport& report, std::chrono::steady_clock::time_point started) const {
  report.finished_at     = util::Now();
  report.elapsed_seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();
}

} // namespace pef::core
