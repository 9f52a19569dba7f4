#include "pipeline.h"

#include <cctype>
#include <algorithm>
#include <sstream>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

std::vector<std::string> SplitSqlStatements(const std::string& source) {
  // quote state carries over lines so that "--" inside a multi-line string is kept
  char quote = 0;
  std::string joined;
  std::istringstream in(source);
  for (std::string line; std::getline(in, line);) {
    size_t end = line.size();
    for (size_t i = 0; i < line.size(); i++) {
      char c = line[i];
      if (quote) {
        if (c == quote) quote = 0;
      } else if (c == '\'' || c == '"') {
        quote = c;
      } else if (c == '-' && i + 1 < line.size() && line[i + 1] == '-') {
        end = i;
        break;
      }
    }
    line = Trim(line.substr(0, end));
    if (line.empty()) continue;
    joined += line;
    joined += ' ';
  }
  std::vector<std::string> ret;
  std::string current;
  quote = 0;
  for (char c : joined) {
    current += c;
    if (quote) {
      if (c == quote) quote = 0;
    } else if (c == '\'' || c == '"') {
      quote = c;
    } else if (c == ';') {
      current = Trim(current);
      // a lone ';' is not a statement
      if (current != ";") ret.push_back(std::move(current));
      current.clear();
    }
  }
  current = Trim(current);
  if (!current.empty()) ret.push_back(std::move(current));
  return ret;
}

namespace {

bool IsSelect(const std::string& stmt) {
  static const char kSelect[] = "SELECT";
  if (stmt.size() < sizeof(kSelect) - 1) return false;
  for (size_t i = 0; i < sizeof(kSelect) - 1; i++) {
    if (std::toupper((unsigned char)stmt[i]) != kSelect[i]) return false;
  }
  return true;
}

} // namespace

ExecutionResult SqlPipeline::Run(const std::string& source, const RunContext& ctx) const {
  using Clock = ProcessOutcome::Clock;
  auto start = Clock::now();
  auto ws = Workspace::Acquire(WorkspaceKind::SINGLE_FILE, LanguageExtension(Language::SQL));
  if (!ws || !ws->WriteSource(source)) {
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Failed to prepare the workspace");
  }
  auto elapsed = [&]() { return std::chrono::duration<double>(Clock::now() - start).count(); };
  // all statements share one run time budget
  auto deadline = start + std::chrono::microseconds(kRunTimeLimit);

  std::vector<std::string> log;
  bool failed = false;
  for (auto& stmt : SplitSqlStatements(source)) {
    long remain = std::chrono::duration_cast<std::chrono::microseconds>(deadline - Clock::now()).count();
    // through stdin: a statement is never taken for a sqlite3 option
    if (!ws->Write(kSqlStatementName, stmt + (stmt.back() == ';' ? "\n" : ";\n"))) {
      return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Failed to prepare the workspace", elapsed());
    }
    auto opt = MakeProcessOptions(*ws, {"sqlite3", kSqlDatabaseName}, std::max(remain, 1L), ctx);
    opt.input = ws->Artifact(kSqlStatementName).string();
    if (remain <= 0) {
      ProcessOutcome timeout;
      timeout.status = ProcessStatus::TIMED_OUT;
      opt.wall_time = kRunTimeLimit;
      return FailureResult(timeout, opt, "Execution", elapsed());
    }
    auto res = ctx.runner.Run(opt);
    switch (res.status) {
      case ProcessStatus::TIMED_OUT:
        opt.wall_time = kRunTimeLimit;
        [[fallthrough]];
      case ProcessStatus::CANCELLED: [[fallthrough]];
      case ProcessStatus::SPAWN_FAILED:
        return FailureResult(res, opt, "Execution", elapsed());
      case ProcessStatus::EXITED: [[fallthrough]];
      case ProcessStatus::SIGNALED:
        break;
    }
    if (!res.err.empty() || !res.Success()) {
      std::string err = res.err;
      if (err.empty()) {
        err = res.status == ProcessStatus::SIGNALED ? SignalDescription(res.signal) :
            "sqlite3 exited with status " + std::to_string(res.exit_code);
      }
      spdlog::debug("SQL statement failed: {}", stmt);
      log.push_back("SQL Error: " + WithTruncation(err, res.err_truncated, opt.output_limit));
      failed = true;
      break;
    }
    std::string out = WithTruncation(res.out, res.out_truncated, opt.output_limit);
    if (IsSelect(stmt) && !Trim(out).empty()) {
      log.push_back("Query: " + stmt);
      log.push_back("Results:");
      log.push_back(out);
    } else if (!Trim(out).empty()) {
      log.push_back("Statement: " + stmt);
      log.push_back(out);
    } else {
      log.push_back("Statement: " + stmt);
      log.push_back("Statement executed successfully.");
    }
    log.push_back("");
  }

  std::string text;
  for (size_t i = 0; i < log.size(); i++) {
    if (i) text += '\n';
    text += log[i];
  }
  // the log up to the failing statement stays on the output channel
  return ExecutionResult::Output(std::move(text), elapsed(),
                                 failed ? ResultKind::RUNTIME_ERROR : ResultKind::OK);
}
