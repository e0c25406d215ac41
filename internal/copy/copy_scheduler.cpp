#include "copy_scheduler.hpp"

#include <algorithm>
#include <utility>

namespace pef::copy {

CopyScheduler::CopyScheduler(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

bool CopyScheduler::Enqueue(CopyTask task) {
  std::unique_lock lock(mutex_);
  not_full_.wait(lock, [&] { return closed_ || tasks_.size() < capacity_; });
  if (closed_) {
    return false;
  }

  tasks_.push_back(std::move(task));
  lock.unlock();
  not_empty_.notify_one();
  return true;
}

std::optional<CopyTask> CopyScheduler::Dequeue() {
  std::unique_lock lock(mutex_);
  not_empty_.wait(lock, [&] { return closed_ || !tasks_.empty(); });
  if (tasks_.empty()) {
    return std::nullopt;
  }

  CopyTask task = std::move(tasks_.front());
  tasks_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return task;
}

void CopyScheduler::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t CopyScheduler::Abandon() {
  std::size_t dropped = 0;
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
    dropped = tasks_.size();
    tasks_.clear();
  }
  not_empty_.notify_all();
  not_full_.notify_all();
  return dropped;
}

} // namespace pef::copy
