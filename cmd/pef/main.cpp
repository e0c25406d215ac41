#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using pef::config::ConfigLoader;
using pef::config::Overrides;
using pef::observability::IntField;
using pef::observability::StringField;

namespace {

constexpr int kExitOk        = 0;
constexpr int kExitUsage     = 1;
constexpr int kExitFatal     = 2;
constexpr int kExitCancelled = 130;

// Set while a run is active; the token is a lock-free atomic flag.
pef::core::CancellationToken* g_cancel = nullptr;

void HandleSignal(int) {
  if (g_cancel != nullptr) g_cancel->Cancel();
}

void PrintUsage() {
  std::cerr << "Usage: pef <dry-run|process|extend> [--config file.yaml] [--source DIR] [--dest DIR]\n"
               "           [--suffix S]... [--force] [--no-tags]\n";
}

struct Args {
  std::string command;
  std::string config_path;
  Overrides   overrides;
};

bool ParseArgs(int argc, char** argv, Args* args) {
  if (argc < 2) return false;
  args->command = argv[1];
  if (args->command != "dry-run" && args->command != "process" && args->command != "extend") return false;

  for (int i = 2; i < argc; ++i) {
    const std::string_view arg = argv[i];
    const bool             has_value = i + 1 < argc;

    if (arg == "--config" && has_value) {
      args->config_path = argv[++i];
    } else if (arg == "--source" && has_value) {
      args->overrides.source_path = argv[++i];
    } else if (arg == "--dest" && has_value) {
      args->overrides.dest_path = argv[++i];
    } else if (arg == "--suffix" && has_value) {
      if (!args->overrides.suffixes) args->overrides.suffixes.emplace();
      args->overrides.suffixes->push_back(argv[++i]);
    } else if (arg == "--force") {
      args->overrides.force = true;
    } else if (arg == "--no-tags") {
      args->overrides.write_tags = false;
    } else {
      std::cerr << "Unknown or incomplete argument: " << arg << "\n";
      return false;
    }
  }
  return true;
}

// Redraws at most a few times per second; the final update always shows.
pef::model::ProgressCallback StderrProgress() {
  auto last = std::make_shared<std::chrono::steady_clock::time_point>();
  return [last](std::uint64_t current, std::uint64_t total, std::string_view message) {
    const auto now = std::chrono::steady_clock::now();
    if (current != total && now - *last < std::chrono::milliseconds(250)) return;
    *last = now;

    if (total == 0) {
      std::cerr << "\r[" << current << "] " << message << "\033[K" << std::flush;
    } else {
      std::cerr << "\r[" << current << "/" << total << "] " << message << "\033[K" << std::flush;
    }
  };
}

void PrintStats(const pef::model::ProcessingStats& stats) {
  std::cout << "  processed:          " << stats.processed << "\n"
            << "  skipped:            " << stats.skipped << "\n"
            << "  errors:             " << stats.errors << "\n"
            << "  tag errors:         " << stats.tag_errors << "\n"
            << "  with location:      " << stats.with_geo << "\n"
            << "  with people:        " << stats.with_people << "\n"
            << "  unmatched sidecars: " << stats.unmatched_sidecars << "\n"
            << "  unmatched media:    " << stats.unmatched_media << "\n";
}

int RunDry(pef::core::Orchestrator& orchestrator) {
  const auto report = orchestrator.DryRun(StderrProgress());
  std::cerr << "\n";

  std::cout << "Dry run of " << orchestrator.options().source.string() << "\n"
            << "  sidecars:           " << report.sidecar_count << "\n"
            << "  media files:        " << report.media_count << "\n"
            << "  albums:             " << report.album_count << "\n"
            << "  matched sidecars:   " << report.matched_sidecars << "\n"
            << "  unmatched sidecars: " << report.unmatched_sidecars << "\n"
            << "  matched media:      " << report.matched_media << "\n"
            << "  unmatched media:    " << report.unmatched_media << "\n"
            << "  with location:      " << report.with_geo << "\n"
            << "  with people:        " << report.with_people << "\n"
            << "  tagging available:  " << (report.tagging_available ? "yes" : "no") << "\n";
  for (const auto& error : report.errors) {
    std::cout << "error: " << error << "\n";
  }
  return report.cancelled ? kExitCancelled : kExitOk;
}

int RunProcess(pef::core::Orchestrator& orchestrator, bool extend) {
  const auto report = extend ? orchestrator.Extend(StderrProgress()) : orchestrator.Process(StderrProgress());
  std::cerr << "\n";

  std::cout << (report.cancelled ? "Cancelled" : "Finished") << (report.resumed ? " (resumed)" : "") << ": "
            << report.output_dir.string() << "\n";
  PrintStats(report.stats);
  if (report.skipped_count > 0) {
    std::cout << "  already done:       " << report.skipped_count << "\n";
  }
  if (!report.summary_file.empty()) {
    std::cout << "Summary: " << report.summary_file.string() << "\n";
  }
  return report.cancelled ? kExitCancelled : kExitOk;
}

} // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, &args)) {
    PrintUsage();
    return kExitUsage;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = args.config_path.empty() ? pef::runtime::config::RuntimeConfig() : ConfigLoader::LoadFromYaml(args.config_path);
    ConfigLoader::Finalize(&config, args.overrides);

    pef::observability::InitializeLogging(config.logging());

    ConfigLoader::Validate(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = pef::factory::Build(config);

    g_cancel = app.cancel.get();
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    PEF_LOG_INFO("Starting", {StringField("command", args.command), StringField("source", config.run().source_path()),
                              StringField("dest", config.run().dest_path()), IntField("suffixes", config.run().suffixes_size())});

    int code = kExitOk;
    if (args.command == "dry-run") {
      code = RunDry(*app.orchestrator);
    } else {
      code = RunProcess(*app.orchestrator, args.command == "extend");
    }

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_cancel = nullptr;

    pef::observability::ShutdownLogging();
    return code;
  } catch (const pef::util::ConfigurationError& e) {
    g_cancel = nullptr;
    PEF_LOG_ERROR("Configuration error", {StringField("error", e.what())});
    pef::observability::ShutdownLogging();
    return kExitFatal;
  } catch (const std::exception& e) {
    g_cancel = nullptr;
    PEF_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    pef::observability::ShutdownLogging();
    return kExitFatal;
  }
}
