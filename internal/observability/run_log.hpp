#pragma once

#include <filesystem>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>

#include <spdlog/common.h>

#include "internal/observability/logging.hpp"

namespace spdlog {
class logger;
}

namespace pef::observability {

/*
  Logger scoped to one run.

  Writes every record to the process-wide console logger and, when a file
  is attached, to the run's detailed log under the destination directory.
  The file is flushed and released when the RunLog is destroyed.
*/
class RunLog {
 public:
  // Console only.
  RunLog();
  // Console plus a detailed log file at `file`; an empty path means console only.
  explicit RunLog(const std::filesystem::path& file);
  ~RunLog();

  RunLog(const RunLog&)            = delete;
  RunLog& operator=(const RunLog&) = delete;

  void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {});

  void Info(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::info, message, fields);
  }
  void Warn(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::warn, message, fields);
  }
  void Error(std::string_view message, std::initializer_list<LogField> fields = {}) {
    Log(spdlog::level::err, message, fields);
  }
  // File only; per-item chatter that would flood the console.
  void Detail(std::string_view message, std::initializer_list<LogField> fields = {});

  void Flush();

  const std::filesystem::path& file() const {
    return file_;
  }

 private:
  std::filesystem::path           file_;
  std::shared_ptr<spdlog::logger> file_logger_;
};

} // namespace pef::observability
