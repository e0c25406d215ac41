#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/core/cancellation.hpp"
#include "internal/core/orchestrator.hpp"
#include "internal/tagging/tag_writer.hpp"

namespace pef::factory {

/*
  Application

  Everything one invocation of the tool needs. The cancellation token is
  shared with the orchestrator so a signal handler can stop the run.
*/
struct Application {
  std::shared_ptr<core::CancellationToken> cancel;
  tagging::TagWriterPtr                    tag_writer;
  std::shared_ptr<core::Orchestrator>      orchestrator;
};

// Finalized config -> orchestrator options.
core::RunOptions ToRunOptions(const pef::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root. Checks the external tagging tool when tags are
  requested; when it is missing the run goes on with timestamps only.
  `tag_writer` replaces the detected tool when set.
*/
Application Build(const pef::runtime::config::RuntimeConfig& config, tagging::TagWriterPtr tag_writer = nullptr);

} // namespace pef::factory
