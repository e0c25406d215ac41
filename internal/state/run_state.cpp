#include "run_state.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace pef::state {

using pef::observability::IntField;
using pef::observability::StringField;
using pef::state::v1::Fingerprint;
using pef::state::v1::ProcessingState;

RunState::RunState(StateStore store, Fingerprint fingerprint, std::uint64_t total_sidecars, std::uint32_t save_interval)
    : store_(std::move(store)),
      fingerprint_(std::move(fingerprint)),
      total_sidecars_(total_sidecars),
      started_at_(util::ToProto(util::Now())),
      save_interval_(save_interval == 0 ? 1 : save_interval) {
}

RunState::RunState(StateStore store, const ProcessingState& loaded, std::uint32_t save_interval)
    : store_(std::move(store)),
      fingerprint_(loaded.fingerprint()),
      status_(loaded.status()),
      phase_(model::FromPersisted(loaded.phase())),
      total_sidecars_(loaded.total_sidecars()),
      started_at_(loaded.started_at()),
      cumulative_(model::FromProto(loaded.stats())),
      save_interval_(save_interval == 0 ? 1 : save_interval) {
  for (const auto& path : loaded.processed_sidecars()) {
    if (sidecars_.insert(path).second) {
      sidecar_order_.push_back(path);
    }
  }
  for (const auto& path : loaded.copied_media()) {
    if (media_.insert(path).second) {
      media_order_.push_back(path);
    }
  }
}

bool RunState::IsSidecarDone(const std::string& path) const {
  std::lock_guard lock(mutex_);
  return sidecars_.count(path) > 0;
}

bool RunState::IsMediaCopied(const std::string& path) const {
  std::lock_guard lock(mutex_);
  return media_.count(path) > 0;
}

void RunState::RecordSidecar(const std::string& path, const model::ProcessingStats& delta) {
  std::lock_guard lock(mutex_);
  if (sidecars_.insert(path).second) {
    sidecar_order_.push_back(path);
  }
  cumulative_ += delta;
  session_ += delta;
  AfterRecordLocked();
}

void RunState::RecordMedia(const std::string& path, const model::ProcessingStats& delta) {
  std::lock_guard lock(mutex_);
  if (media_.insert(path).second) {
    media_order_.push_back(path);
  }
  cumulative_ += delta;
  session_ += delta;
  AfterRecordLocked();
}

void RunState::RecordStats(const model::ProcessingStats& delta) {
  std::lock_guard lock(mutex_);
  cumulative_ += delta;
  session_ += delta;
}

void RunState::SetPhase(model::RunPhase phase) {
  std::lock_guard lock(mutex_);
  if (phase == phase_) {
    return;
  }
  phase_  = phase;
  status_ = pef::state::v1::RUN_STATUS_IN_PROGRESS;
  SaveLocked();
}

model::RunPhase RunState::Phase() const {
  std::lock_guard lock(mutex_);
  return phase_;
}

bool RunState::IsCompleted() const {
  std::lock_guard lock(mutex_);
  return status_ == pef::state::v1::RUN_STATUS_COMPLETED;
}

bool RunState::Save() {
  std::lock_guard lock(mutex_);
  return SaveLocked();
}

bool RunState::Complete() {
  std::lock_guard lock(mutex_);
  status_ = pef::state::v1::RUN_STATUS_COMPLETED;
  phase_  = model::RunPhase::kDone;
  return SaveLocked();
}

model::ProcessingStats RunState::SessionStats() const {
  std::lock_guard lock(mutex_);
  return session_;
}

model::ProcessingStats RunState::CumulativeStats() const {
  std::lock_guard lock(mutex_);
  return cumulative_;
}

std::size_t RunState::SidecarsDone() const {
  std::lock_guard lock(mutex_);
  return sidecars_.size();
}

void RunState::AfterRecordLocked() {
  if (++unsaved_ >= save_interval_) {
    SaveLocked();
  }
}

bool RunState::SaveLocked() {
  try {
    store_.Save(SnapshotLocked());
    unsaved_ = 0;
    return true;
  } catch (const util::StateError& e) {
    PEF_LOG_WARN("Could not save processing state",
                 {StringField("path", store_.Path().string()), StringField("error", e.what()),
                  IntField("sidecars_done", static_cast<std::int64_t>(sidecars_.size()))});
    return false;
  }
}

ProcessingState RunState::SnapshotLocked() const {
  ProcessingState state;
  state.set_version(kStateVersion);
  state.set_phase(model::ToPersisted(phase_));
  state.set_status(status_);
  *state.mutable_fingerprint() = fingerprint_;
  for (const auto& path : sidecar_order_) {
    state.add_processed_sidecars(path);
  }
  for (const auto& path : media_order_) {
    state.add_copied_media(path);
  }
  *state.mutable_stats() = model::ToProto(cumulative_);
  state.set_total_sidecars(total_sidecars_);
  *state.mutable_started_at() = started_at_;
  *state.mutable_updated_at() = util::ToProto(util::Now());
  return state;
}

} // namespace pef::state
