#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

#include "copy_task.hpp"

namespace pef::copy {

/*
  Bounded hand-off between the thread listing leftover media and the copy
  workers.

  At most `capacity` tasks wait at once; the producer blocks in Enqueue
  until a worker takes one. Close() lets workers finish what is queued,
  Abandon() drops it.
*/
class CopyScheduler {
 public:
  explicit CopyScheduler(std::size_t capacity);

  // false once closed or abandoned; the task is not queued
  bool Enqueue(CopyTask task);

  // blocking wait; nullopt once closed and drained
  std::optional<CopyTask> Dequeue();

  void Close();

  // Closes and discards queued tasks. Returns how many were dropped.
  std::size_t Abandon();

 private:
  const std::size_t       capacity_;
  std::mutex              mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<CopyTask>    tasks_;
  bool                    closed_ = false;
};

} // namespace pef::copy
