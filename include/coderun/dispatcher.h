#ifndef INCLUDE_CODERUN_DISPATCHER_H_
#define INCLUDE_CODERUN_DISPATCHER_H_

#include <mutex>
#include <atomic>
#include <condition_variable>

#include "execution.h"
#include "process.h"

// Bounds the number of simultaneous executions
class ExecutionLimiter {
  const int max_parallel_;
  const size_t max_queue_;
  int running_;
  size_t waiting_;
  mutable std::mutex mtx_;
  std::condition_variable cv_;
 public:
  // max_queue = 0 for no limit on waiting requests
  ExecutionLimiter(int max_parallel, size_t max_queue = 0);

  // block until a slot is free; return false only if the wait queue is full
  bool Acquire();
  void Release();

  int Running() const;
  size_t Waiting() const;
};

class ExecutionSlot {
  ExecutionLimiter* limiter_;
  bool acquired_;
 public:
  explicit ExecutionSlot(ExecutionLimiter* limiter) :
      limiter_(limiter), acquired_(!limiter || limiter->Acquire()) {}
  ExecutionSlot(const ExecutionSlot&) = delete;
  ExecutionSlot& operator=(const ExecutionSlot&) = delete;
  ~ExecutionSlot() {
    if (limiter_ && acquired_) limiter_->Release();
  }
  explicit operator bool() const { return acquired_; }
};

class Dispatcher {
  ProcessRunner& runner_;
  ExecutionLimiter* limiter_;
 public:
  // limiter may be nullptr for no concurrency bound
  Dispatcher(ProcessRunner& runner, ExecutionLimiter* limiter) :
      runner_(runner), limiter_(limiter) {}

  // Never throws; every failure is converted into the result
  ExecutionResult Dispatch(const ExecutionRequest&, const std::atomic_bool* cancel = nullptr) const;
};

#endif  // INCLUDE_CODERUN_DISPATCHER_H_
