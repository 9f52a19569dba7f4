#include "pipeline.h"

#include <regex>

#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

double Elapsed(ProcessOutcome::Clock::time_point start, const ProcessOutcome& res) {
  return std::chrono::duration<double>(res.end - start).count();
}

const std::string& Diagnostics(const ProcessOutcome& res) {
  return res.err.empty() ? res.out : res.err;
}

} // namespace

std::string CompiledPipeline::SourceFile(const std::string&) const {
  return SourceName(lang_);
}

ExecutionResult CompiledPipeline::Run(const std::string& source, const RunContext& ctx) const {
  auto start = ProcessOutcome::Clock::now();
  auto ws = Workspace::Acquire(WorkspaceKind::SINGLE_FILE, LanguageExtension(lang_));
  std::string source_file = SourceFile(source);
  if (!ws || !ws->Write(source_file, source)) {
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Failed to prepare the workspace");
  }

  auto compile_opt = MakeProcessOptions(*ws, CompileCommand(source_file), CompileTimeLimit(), ctx);
  auto compile_res = ctx.runner.Run(compile_opt);
  switch (compile_res.status) {
    case ProcessStatus::TIMED_OUT: [[fallthrough]];
    case ProcessStatus::CANCELLED: [[fallthrough]];
    case ProcessStatus::SPAWN_FAILED:
      return FailureResult(compile_res, compile_opt, "Compilation", Elapsed(start, compile_res));
    case ProcessStatus::EXITED: [[fallthrough]];
    case ProcessStatus::SIGNALED:
      break;
  }
  if (!compile_res.Success()) {
    spdlog::debug("Compilation of {} failed", ws->Root().c_str());
    std::string text = "Compilation Error:\n" + Diagnostics(compile_res);
    if (compile_res.status == ProcessStatus::SIGNALED) AppendLine(text, SignalDescription(compile_res.signal));
    return ExecutionResult::Error(ResultKind::COMPILE_ERROR, std::move(text), Elapsed(start, compile_res));
  }

  auto run_opt = MakeProcessOptions(*ws, ExecuteCommand(source_file), kRunTimeLimit, ctx);
  auto run_res = ctx.runner.Run(run_opt);
  return ClassifyRun(run_res, run_opt, Elapsed(start, run_res));
}

std::vector<std::string> GccPipeline::CompileCommand(const std::string& source_file) const {
  std::vector<std::string> ret = {compiler_, source_file, "-o", ProgramName(lang_)};
  ret.insert(ret.end(), flags_.begin(), flags_.end());
  return ret;
}

std::vector<std::string> GccPipeline::ExecuteCommand(const std::string&) const {
  return {"./" + ProgramName(lang_)};
}

std::string JavaClassName(const std::string& source) {
  // modifiers may sit between public and class
  static const std::regex kPublicClass(R"(\bpublic\s+(?:(?:final|abstract|static|sealed|strictfp)\s+)*class\s+([A-Za-z_$][A-Za-z0-9_$]*))");
  std::smatch match;
  if (std::regex_search(source, match, kPublicClass)) return match[1];
  return "Main";
}

std::string JavaPipeline::SourceFile(const std::string& source) const {
  return JavaClassName(source) + LanguageExtension(lang_);
}

std::vector<std::string> JavaPipeline::CompileCommand(const std::string& source_file) const {
  return {"javac", "-encoding", "UTF-8", source_file};
}

std::vector<std::string> JavaPipeline::ExecuteCommand(const std::string& source_file) const {
  std::string class_name = fs::path(source_file).stem().string();
  return {"java", "-cp", ".", class_name};
}

std::vector<std::string> KotlinPipeline::CompileCommand(const std::string& source_file) const {
  return {"kotlinc", source_file, "-include-runtime", "-d", ProgramName(lang_)};
}

std::vector<std::string> KotlinPipeline::ExecuteCommand(const std::string&) const {
  return {"java", "-jar", ProgramName(lang_)};
}

ExecutionResult CargoPipeline::Run(const std::string& source, const RunContext& ctx) const {
  static const char kManifest[] =
      "[package]\n"
      "name = \"rust_project\"\n"
      "version = \"0.1.0\"\n"
      "edition = \"2021\"\n"
      "\n"
      "[[bin]]\n"
      "name = \"main\"\n"
      "path = \"src/main.rs\"\n";
  auto start = ProcessOutcome::Clock::now();
  auto ws = Workspace::Acquire(WorkspaceKind::DIRECTORY);
  if (!ws || !ws->Write(kCargoManifestName, kManifest) || !ws->Write(kCargoSourceName, source)) {
    return ExecutionResult::Error(ResultKind::SYSTEM_ERROR, "Failed to prepare the workspace");
  }
  auto opt = MakeProcessOptions(*ws, {"cargo", "run", "--quiet"}, kBuildTimeLimit, ctx);
  auto res = ctx.runner.Run(opt);
  double elapsed = Elapsed(start, res);
  switch (res.status) {
    case ProcessStatus::TIMED_OUT: [[fallthrough]];
    case ProcessStatus::CANCELLED: [[fallthrough]];
    case ProcessStatus::SPAWN_FAILED:
      return FailureResult(res, opt, "Execution", elapsed);
    case ProcessStatus::EXITED: [[fallthrough]];
    case ProcessStatus::SIGNALED:
      break;
  }
  // cargo does not tell a build failure from a failing program
  if (!res.Success()) {
    std::string text = "Compilation/Runtime Error:\n" + WithTruncation(res.err, res.err_truncated, opt.output_limit);
    if (res.status == ProcessStatus::SIGNALED) AppendLine(text, SignalDescription(res.signal));
    return ExecutionResult::Error(ResultKind::COMPILE_ERROR, std::move(text), elapsed);
  }
  // stderr of a successful run (the program's or rustc warnings) surfaces like any other language
  return ClassifyRun(res, opt, elapsed);
}
