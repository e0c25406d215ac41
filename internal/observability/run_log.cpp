#include "internal/observability/run_log.hpp"

#include <atomic>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace pef::observability {
namespace {

std::string NextLoggerName() {
  static std::atomic<unsigned> counter{0};
  return "pef-run-" + std::to_string(counter.fetch_add(1));
}

} // namespace

RunLog::RunLog() = default;

RunLog::RunLog(const std::filesystem::path& file) : file_(file) {
  if (file_.empty()) {
    return;
  }

  std::error_code ec;
  std::filesystem::create_directories(file_.parent_path(), ec);

  try {
    auto sink    = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_.string(), false);
    file_logger_ = std::make_shared<spdlog::logger>(NextLoggerName(), std::move(sink));
    file_logger_->set_pattern("%Y-%m-%d %H:%M:%S - %v");
    file_logger_->set_level(spdlog::level::trace);
    file_logger_->flush_on(spdlog::level::warn);
  } catch (const spdlog::spdlog_ex& e) {
    PEF_LOG_WARN("Detailed log unavailable", {StringField("path", file_.string()), StringField("error", e.what())});
    file_logger_.reset();
  }
}

RunLog::~RunLog() {
  Flush();
}

void RunLog::Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  ::pef::observability::Log(level, message, fields);
  if (file_logger_) {
    auto serialized = SerializeFields(fields);
    if (serialized.empty()) {
      file_logger_->log(level, "{}", message);
    } else {
      file_logger_->log(level, "{} {}", message, serialized);
    }
  }
}

void RunLog::Detail(std::string_view message, std::initializer_list<LogField> fields) {
  if (!file_logger_) {
    ::pef::observability::Log(spdlog::level::debug, message, fields);
    return;
  }
  auto serialized = SerializeFields(fields);
  if (serialized.empty()) {
    file_logger_->info("{}", message);
  } else {
    file_logger_->info("{} {}", message, serialized);
  }
}

void RunLog::Flush() {
  if (file_logger_) {
    file_logger_->flush();
  }
}

} // namespace pef::observability
