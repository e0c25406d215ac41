#include "internal/observability/logging.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>

#include <spdlog/spdlog.h>

#include "config/config.pb.h"
#include "internal/observability/run_log.hpp"

namespace {

namespace fs = std::filesystem;

using pef::observability::BoolField;
using pef::observability::IntField;
using pef::observability::RunLog;
using pef::observability::SerializeFields;
using pef::observability::StringField;

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void TestFieldsSerializeAsKeyValue() {
  assert(SerializeFields({}).empty());
  assert(SerializeFields({StringField("path", "/a/b.jpg"), IntField("n", 3), BoolField("ok", true)}) ==
         "path=/a/b.jpg n=3 ok=true");
  assert(SerializeFields({StringField("album", "Photos from 2020")}) == "album=\"Photos from 2020\"");
}

void TestConsoleLoggerUsesConfiguredLevel() {
  pef::runtime::config::LoggingConfig config;
  config.set_level("debug");
  pef::observability::InitializeLogging(config);

  auto logger = spdlog::get("pef");
  assert(logger != nullptr);
  assert(spdlog::default_logger() == logger);
  assert(logger->level() == spdlog::level::debug);

  config.set_level("warn");
  pef::observability::InitializeLogging(config);
  assert(spdlog::get("pef") == logger);
  assert(logger->level() == spdlog::level::warn);

  PEF_LOG_WARN("Logging test", {StringField("stage", "console")});
}

void TestRunLogWritesDetailFile() {
  const auto dir = fs::temp_directory_path() / "pef_logging_tests";
  fs::remove_all(dir);
  const auto file = dir / "_pef" / "detailed_logs.txt";

  {
    RunLog log(file);
    assert(log.file() == file);
    log.Detail("Copied unmatched", {StringField("source", "/src/Trip/a.mov")});
    log.Info("Run finished", {IntField("processed", 2)});
  }

  const auto text = ReadAll(file);
  assert(text.find("Copied unmatched source=/src/Trip/a.mov") != std::string::npos);
  assert(text.find("Run finished processed=2") != std::string::npos);

  RunLog console(fs::path{});
  assert(console.file().empty());
  console.Detail("not written anywhere");
}

} // namespace

int main() {
  TestFieldsSerializeAsKeyValue();
  TestConsoleLoggerUsesConfiguredLevel();
  TestRunLogWritesDetailFile();
  pef::observability::ShutdownLogging();

  std::cout << "pef_unit_logging: pass\n";
  return 0;
}
