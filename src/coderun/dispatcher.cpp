#include <coderun/dispatcher.h>

#include <exception>

#include <spdlog/spdlog.h>
#include <coderun/utils.h>
#include "registry.h"

ExecutionLimiter::ExecutionLimiter(int max_parallel, size_t max_queue) :
    max_parallel_(max_parallel > 0 ? max_parallel : 1), max_queue_(max_queue), running_(0), waiting_(0) {}

bool ExecutionLimiter::Acquire() {
  std::unique_lock<std::mutex> lck(mtx_);
  if (running_ < max_parallel_) {
    running_++;
    return true;
  }
  if (max_queue_ && waiting_ >= max_queue_) return false;
  waiting_++;
  cv_.wait(lck, [&]{ return running_ < max_parallel_; });
  waiting_--;
  running_++;
  return true;
}

void ExecutionLimiter::Release() {
  {
    std::lock_guard<std::mutex> lck(mtx_);
    running_--;
  }
  cv_.notify_one();
}

int ExecutionLimiter::Running() const {
  std::lock_guard<std::mutex> lck(mtx_);
  return running_;
}

size_t ExecutionLimiter::Waiting() const {
  std::lock_guard<std::mutex> lck(mtx_);
  return waiting_;
}

ExecutionResult Dispatcher::Dispatch(const ExecutionRequest& req, const std::atomic_bool* cancel) const {
  if (Trim(req.source).empty()) return ExecutionResult::Error(ResultKind::INPUT_ERROR, "No code provided");
  bool found;
  Language lang = GetLanguage(req.language, &found);
  if (!found) {
    spdlog::info("Unknown language '{}', falling back to {}", req.language, LanguageName(lang));
  }

  ExecutionSlot slot(limiter_);
  if (!slot) {
    spdlog::warn("Execution queue full, rejecting request");
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Too many executions queued");
  }
  try {
    spdlog::debug("Dispatching {} snippet of {} bytes", LanguageName(lang), req.source.size());
    ExecutionResult res = GetPipeline(lang).Run(req.source, RunContext{runner_, cancel});
    spdlog::info("Execution finished: language={} kind={} time={:.3f}s",
                 LanguageName(lang), ResultKindName(res.kind), res.execution_time);
    return res;
  } catch (const std::exception& e) {
    spdlog::error("Execution of {} snippet failed: {}", LanguageName(lang), e.what());
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, e.what());
  }
}
