#include "copy_worker.hpp"

#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace pef::copy {

using pef::observability::StringField;

CopyWorker::CopyWorker(std::shared_ptr<CopyScheduler> scheduler, Handler handler)
    : scheduler_(std::move(scheduler)), handler_(std::move(handler)) {
}

CopyWorker::~CopyWorker() {
  Join();
}

void CopyWorker::Start() {
  thread_ = std::thread(&CopyWorker::Run, this);
}

void CopyWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void CopyWorker::Run() {
  while (true) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    try {
      handler_(*task);
    } catch (const std::exception& e) {
      PEF_LOG_ERROR("copy task failed", {StringField("path", task->record.path.string()), StringField("error", e.what())});
    }
  }
}

} // namespace pef::copy
