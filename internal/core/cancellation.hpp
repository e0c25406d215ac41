#pragma once

#include <atomic>

namespace pef::core {

/*
  Cooperative cancellation flag.

  Set from any thread (or a signal handler); the orchestrator polls it
  once per loop iteration.
*/
class CancellationToken {
 public:
  void Cancel() {
    cancelled_.store(true, std::memory_order_relaxed);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_relaxed);
  }

  void Reset() {
    cancelled_.store(false, std::memory_order_relaxed);
  }

 private:
  std::atomic<bool> cancelled_{false};
};

} // namespace pef::core
