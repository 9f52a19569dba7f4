#include "pipeline.h"

#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

long kCompileTimeLimit = 10'000'000;
long kRunTimeLimit = 5'000'000;
long kBuildTimeLimit = 15'000'000;
long kMaxOutput = 1024;

std::string WithTruncation(std::string text, bool truncated, long limit) {
  if (!truncated) return text;
  AppendLine(text, fmt::format("[Output truncated after {} bytes]", limit));
  return text;
}

void AppendLine(std::string& text, const std::string& line) {
  if (!text.empty() && text.back() != '\n') text += '\n';
  text += line;
}

ProcessOptions MakeProcessOptions(const Workspace& ws, std::vector<std::string> command, long wall_time,
                                  const RunContext& ctx) {
  ProcessOptions opt;
  opt.command = std::move(command);
  opt.workdir = ws.Root().string();
  opt.wall_time = wall_time;
  opt.output_limit = kMaxOutput * 1024;
  opt.cancel = ctx.cancel;
  return opt;
}

std::string TimeLimitText(long wall_time) {
  return fmt::format("{:g} s", wall_time / 1e6);
}

ExecutionResult FailureResult(const ProcessOutcome& res, const ProcessOptions& opt, const std::string& what,
                              double elapsed) {
  switch (res.status) {
    case ProcessStatus::TIMED_OUT:
      return ExecutionResult::Error(ResultKind::TIMED_OUT,
          fmt::format("{} timed out ({} limit)", what, TimeLimitText(opt.wall_time)), elapsed);
    case ProcessStatus::CANCELLED:
      return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, what + " cancelled", elapsed);
    case ProcessStatus::SPAWN_FAILED:
      return ExecutionResult::Error(ResultKind::SYSTEM_ERROR,
          fmt::format("Failed to start {}: {}", opt.command.empty() ? "" : opt.command[0],
                      strerror(res.error)), elapsed);
    case ProcessStatus::EXITED: [[fallthrough]];
    case ProcessStatus::SIGNALED:
      break;
  }
  spdlog::error("FailureResult called for a finished process");
  return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Internal error", elapsed);
}

ExecutionResult ClassifyRun(const ProcessOutcome& res, const ProcessOptions& opt, double elapsed) {
  switch (res.status) {
    case ProcessStatus::TIMED_OUT: [[fallthrough]];
    case ProcessStatus::CANCELLED: [[fallthrough]];
    case ProcessStatus::SPAWN_FAILED:
      return FailureResult(res, opt, "Execution", elapsed);
    case ProcessStatus::SIGNALED: {
      std::string text = WithTruncation(res.err, res.err_truncated, opt.output_limit);
      AppendLine(text, SignalDescription(res.signal));
      return ExecutionResult::Error(ResultKind::RUNTIME_ERROR, std::move(text), elapsed);
    }
    case ProcessStatus::EXITED:
      break;
  }
  if (!res.err.empty()) {
    return ExecutionResult::Error(ResultKind::RUNTIME_ERROR,
        WithTruncation(res.err, res.err_truncated, opt.output_limit), elapsed);
  }
  if (res.exit_code != 0) {
    std::string text = WithTruncation(res.out, res.out_truncated, opt.output_limit);
    AppendLine(text, fmt::format("[Process exited with status {}]", res.exit_code));
    return ExecutionResult::Error(ResultKind::RUNTIME_ERROR, std::move(text), elapsed);
  }
  return ExecutionResult::Output(WithTruncation(res.out, res.out_truncated, opt.output_limit), elapsed);
}

ExecutionResult InterpretedPipeline::Run(const std::string& source, const RunContext& ctx) const {
  auto start = ProcessOutcome::Clock::now();
  auto ws = Workspace::Acquire(WorkspaceKind::SINGLE_FILE, LanguageExtension(lang_));
  if (!ws || !ws->WriteSource(source)) {
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Failed to prepare the workspace");
  }
  auto command = interpreter_;
  command.push_back(SourceName(lang_));
  auto opt = MakeProcessOptions(*ws, std::move(command), kRunTimeLimit, ctx);
  auto res = ctx.runner.Run(opt);
  double elapsed = std::chrono::duration<double>(res.end - start).count();
  return ClassifyRun(res, opt, elapsed);
}

ExecutionResult TextPipeline::Run(const std::string& source, const RunContext&) const {
  auto start = ProcessOutcome::Clock::now();
  std::string text = Trim(source).empty() ? "(Empty text document)" : source;
  double elapsed = std::chrono::duration<double>(ProcessOutcome::Clock::now() - start).count();
  return ExecutionResult::Output(std::move(text), elapsed);
}
