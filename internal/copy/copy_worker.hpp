#pragma once

#include <functional>
#include <memory>
#include <thread>

#include "copy_scheduler.hpp"

namespace pef::copy {

/*
  Background worker draining a CopyScheduler.

  Executes:
      handler(task) for every dequeued task, until the scheduler is
      closed and empty
*/
class CopyWorker {
 public:
  using Handler = std::function<void(const CopyTask&)>;

  CopyWorker(std::shared_ptr<CopyScheduler> scheduler, Handler handler);
  ~CopyWorker();

  CopyWorker(const CopyWorker&)            = delete;
  CopyWorker& operator=(const CopyWorker&) = delete;

  void Start();
  // Waits for the thread; call after CopyScheduler::Close() or Abandon().
  void Join();

 private:
  void Run();

  std::shared_ptr<CopyScheduler> scheduler_;
  Handler                        handler_;

  std::thread thread_;
};

} // namespace pef::copy
