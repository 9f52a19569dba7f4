#include <cerrno>
#include <csignal>
#include <deque>

#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <coderun/paths.h>

#include "paths.h"
#include "pipeline.h"
#include "registry.h"
#include "utils.h"

using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

// replays canned outcomes instead of spawning processes
class FakeRunner : public ProcessRunner {
  std::deque<ProcessOutcome> outcomes_;
 public:
  std::vector<ProcessOptions> calls;
  std::vector<bool> workdir_existed;

  void Push(ProcessOutcome res) { outcomes_.push_back(std::move(res)); }

  ProcessOutcome Run(const ProcessOptions& opt) override {
    calls.push_back(opt);
    workdir_existed.push_back(fs::is_directory(opt.workdir));
    ProcessOutcome ret;
    if (!outcomes_.empty()) {
      ret = std::move(outcomes_.front());
      outcomes_.pop_front();
    }
    ret.start = ret.end = ProcessOutcome::Clock::now();
    return ret;
  }
};

ProcessOutcome Exited(int code, std::string out = "", std::string err = "") {
  ProcessOutcome ret;
  ret.status = ProcessStatus::EXITED;
  ret.exit_code = code;
  ret.out = std::move(out);
  ret.err = std::move(err);
  return ret;
}

ProcessOutcome WithStatus(ProcessStatus status) {
  ProcessOutcome ret;
  ret.status = status;
  return ret;
}

ProcessOptions RunOptions() {
  ProcessOptions opt;
  opt.command = {"python3", "prog.py"};
  opt.wall_time = 5'000'000;
  opt.output_limit = 1024;
  return opt;
}

} // namespace

TEST(Classify, Output) {
  auto res = ClassifyRun(Exited(0, "hello\n"), RunOptions(), 0.5);
  EXPECT_EQ(res.kind, ResultKind::OK);
  EXPECT_FALSE(res.is_error);
  EXPECT_EQ(res.text, "hello\n");
  EXPECT_DOUBLE_EQ(res.execution_time, 0.5);
}

TEST(Classify, StderrIsRuntimeError) {
  auto res = ClassifyRun(Exited(0, "partial", "Traceback\n"), RunOptions(), 0.1);
  EXPECT_EQ(res.kind, ResultKind::RUNTIME_ERROR);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.text, "Traceback\n");
}

TEST(Classify, SilentNonZeroExit) {
  auto res = ClassifyRun(Exited(2, "partial"), RunOptions(), 0.1);
  EXPECT_EQ(res.kind, ResultKind::RUNTIME_ERROR);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.text, "partial\n[Process exited with status 2]");
}

TEST(Classify, Signal) {
  ProcessOutcome outcome = WithStatus(ProcessStatus::SIGNALED);
  outcome.signal = SIGSEGV;
  outcome.err = "boom";
  auto res = ClassifyRun(outcome, RunOptions(), 0.1);
  EXPECT_EQ(res.kind, ResultKind::RUNTIME_ERROR);
  EXPECT_THAT(res.text, StartsWith("boom\nKilled by signal 11"));
}

TEST(Classify, TimedOut) {
  auto res = ClassifyRun(WithStatus(ProcessStatus::TIMED_OUT), RunOptions(), 5.01);
  EXPECT_EQ(res.kind, ResultKind::TIMED_OUT);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.text, "Execution timed out (5 s limit)");
}

TEST(Classify, SystemFailures) {
  ProcessOutcome outcome = WithStatus(ProcessStatus::SPAWN_FAILED);
  outcome.error = ENOENT;
  auto res = ClassifyRun(outcome, RunOptions(), 0);
  EXPECT_EQ(res.kind, ResultKind::SYSTEM_ERROR);
  EXPECT_THAT(res.text, HasSubstr("Failed to start python3"));

  res = ClassifyRun(WithStatus(ProcessStatus::CANCELLED), RunOptions(), 0);
  EXPECT_EQ(res.kind, ResultKind::SYSTEM_ERROR);
  EXPECT_EQ(res.text, "Execution cancelled");
}

TEST(Classify, Truncated) {
  ProcessOutcome outcome = Exited(0, std::string(1024, 'x'));
  outcome.out_truncated = true;
  auto res = ClassifyRun(outcome, RunOptions(), 0.1);
  EXPECT_EQ(res.kind, ResultKind::OK);
  EXPECT_EQ(res.text, std::string(1024, 'x') + "\n[Output truncated after 1024 bytes]");
}

TEST(Interpreted, RunsInWorkspace) {
  FakeRunner runner;
  runner.Push(Exited(0, "3\n"));
  auto res = GetPipeline(Language::PYTHON).Run("print(1 + 2)\n", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::OK);
  EXPECT_EQ(res.text, "3\n");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].command, (std::vector<std::string>{"python3", "prog.py"}));
  EXPECT_EQ(runner.calls[0].wall_time, kRunTimeLimit);
  EXPECT_EQ(runner.calls[0].output_limit, kMaxOutput * 1024);
  EXPECT_TRUE(runner.workdir_existed[0]);
  EXPECT_EQ(fs::path(runner.calls[0].workdir).parent_path(), kWorkspaceRoot);
  // released before the result is returned
  EXPECT_FALSE(fs::exists(runner.calls[0].workdir));
}

TEST(Compiled, CompileErrorSkipsExecution) {
  FakeRunner runner;
  runner.Push(Exited(1, "", "prog.c:1: error: expected ';'\n"));
  auto res = GetPipeline(Language::C).Run("int main() { return 0 }", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::COMPILE_ERROR);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.text, "Compilation Error:\nprog.c:1: error: expected ';'\n");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].command, (std::vector<std::string>{"gcc", "prog.c", "-o", "prog", "-lm"}));
  EXPECT_EQ(runner.calls[0].wall_time, kCompileTimeLimit);
}

TEST(Compiled, CompileThenRunShareWorkspace) {
  FakeRunner runner;
  runner.Push(Exited(0, "", "warning: unused variable\n"));
  runner.Push(Exited(0, "ok\n"));
  auto res = GetPipeline(Language::CPP).Run("int main() {}", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::OK);
  EXPECT_EQ(res.text, "ok\n");
  ASSERT_EQ(runner.calls.size(), 2u);
  EXPECT_EQ(runner.calls[0].command[0], "g++");
  EXPECT_EQ(runner.calls[1].command, (std::vector<std::string>{"./prog"}));
  EXPECT_EQ(runner.calls[0].workdir, runner.calls[1].workdir);
  EXPECT_EQ(runner.calls[1].wall_time, kRunTimeLimit);
}

TEST(Compiled, CompileTimeout) {
  FakeRunner runner;
  runner.Push(WithStatus(ProcessStatus::TIMED_OUT));
  auto res = GetPipeline(Language::CPP).Run("int main() {}", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::TIMED_OUT);
  EXPECT_EQ(res.text, "Compilation timed out (10 s limit)");
  EXPECT_EQ(runner.calls.size(), 1u);
}

TEST(Compiled, MissingCompiler) {
  FakeRunner runner;
  ProcessOutcome outcome = WithStatus(ProcessStatus::SPAWN_FAILED);
  outcome.error = ENOENT;
  runner.Push(outcome);
  auto res = GetPipeline(Language::KOTLIN).Run("fun main() {}", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::SYSTEM_ERROR);
  EXPECT_THAT(res.text, HasSubstr("kotlinc"));
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].wall_time, kBuildTimeLimit);
}

TEST(Compiled, JavaFileNamedAfterClass) {
  FakeRunner runner;
  runner.Push(Exited(0));
  runner.Push(Exited(0, "hi\n"));
  auto res = GetPipeline(Language::JAVA).Run(
      "public class Greeter { public static void main(String[] a) { System.out.println(\"hi\"); } }",
      RunContext{runner, nullptr});
  EXPECT_EQ(res.text, "hi\n");
  ASSERT_EQ(runner.calls.size(), 2u);
  EXPECT_EQ(runner.calls[0].command.back(), "Greeter.java");
  EXPECT_EQ(runner.calls[1].command, (std::vector<std::string>{"java", "-cp", ".", "Greeter"}));
}

TEST(Cargo, FailureIsCombinedError) {
  FakeRunner runner;
  runner.Push(Exited(101, "", "error[E0425]: cannot find value `x`\n"));
  auto res = GetPipeline(Language::RUST).Run("fn main() { x }", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::COMPILE_ERROR);
  EXPECT_EQ(res.text, "Compilation/Runtime Error:\nerror[E0425]: cannot find value `x`\n");
  ASSERT_EQ(runner.calls.size(), 1u);
  EXPECT_EQ(runner.calls[0].command, (std::vector<std::string>{"cargo", "run", "--quiet"}));
  EXPECT_EQ(runner.calls[0].wall_time, kBuildTimeLimit);
}

TEST(Cargo, StderrOfSuccessfulRun) {
  FakeRunner runner;
  runner.Push(Exited(0, "hi\n", "oops\n"));
  auto res = GetPipeline(Language::RUST).Run("fn main() {}", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::RUNTIME_ERROR);
  EXPECT_TRUE(res.is_error);
  EXPECT_EQ(res.text, "oops\n");
}

TEST(Cargo, TruncatedBuildLog) {
  FakeRunner runner;
  ProcessOutcome failed = Exited(101, "", "error: long log");
  failed.err_truncated = true;
  runner.Push(std::move(failed));
  auto res = GetPipeline(Language::RUST).Run("fn main() {}", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::COMPILE_ERROR);
  EXPECT_THAT(res.text, StartsWith("Compilation/Runtime Error:\nerror: long log\n"));
  EXPECT_THAT(res.text, HasSubstr("[Output truncated after"));
}

TEST(Sql, StatementsThroughStdin) {
  FakeRunner runner;
  runner.Push(Exited(0, "1\n"));
  runner.Push(Exited(0, "2\n"));
  auto res = GetPipeline(Language::SQL).Run("SELECT 1; -- first\nSELECT 2;", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::OK);
  ASSERT_EQ(runner.calls.size(), 2u);
  for (auto& opt : runner.calls) {
    EXPECT_EQ(opt.command, (std::vector<std::string>{"sqlite3", kSqlDatabaseName}));
    EXPECT_EQ(fs::path(opt.input).filename().string(), kSqlStatementName);
    EXPECT_EQ(fs::path(opt.input).parent_path().string(), opt.workdir);
  }
}

TEST(Text, Passthrough) {
  FakeRunner runner;
  auto res = GetPipeline(Language::TEXT).Run("  some notes\n", RunContext{runner, nullptr});
  EXPECT_EQ(res.kind, ResultKind::OK);
  EXPECT_EQ(res.text, "  some notes\n");
  res = GetPipeline(Language::TEXT).Run(" \n\t", RunContext{runner, nullptr});
  EXPECT_EQ(res.text, "(Empty text document)");
  EXPECT_TRUE(runner.calls.empty());
}
