#ifndef CODERUN_PIPELINE_H_
#define CODERUN_PIPELINE_H_

#include <atomic>
#include <string>
#include <vector>
#include <utility>

#include <coderun/execution.h>
#include <coderun/process.h>
#include <coderun/workspace.h>

struct RunContext {
  ProcessRunner& runner;
  const std::atomic_bool* cancel;
};

// source text to result for one language
class Pipeline {
 public:
  virtual ~Pipeline() = default;
  // source is non-empty after trimming when called from the dispatcher
  virtual ExecutionResult Run(const std::string& source, const RunContext&) const = 0;
};

// shared by all pipelines
ProcessOptions MakeProcessOptions(const Workspace&, std::vector<std::string> command, long wall_time,
                                  const RunContext&);
// start line on a new line
void AppendLine(std::string& text, const std::string& line);
// notice appended if truncated
std::string WithTruncation(std::string text, bool truncated, long limit);
// "5 s"
std::string TimeLimitText(long wall_time);
// timed out, cancelled or never started; what names the step ("Execution")
ExecutionResult FailureResult(const ProcessOutcome&, const ProcessOptions&, const std::string& what,
                              double elapsed);
// classify the run step of interpreted and compiled languages
ExecutionResult ClassifyRun(const ProcessOutcome&, const ProcessOptions&, double elapsed);

class InterpretedPipeline : public Pipeline {
  Language lang_;
  std::vector<std::string> interpreter_;
 public:
  InterpretedPipeline(Language lang, std::vector<std::string> interpreter) :
      lang_(lang), interpreter_(std::move(interpreter)) {}
  ExecutionResult Run(const std::string& source, const RunContext&) const override;
};

class TextPipeline : public Pipeline {
 public:
  ExecutionResult Run(const std::string& source, const RunContext&) const override;
};

// write source, compile, run the produced program
class CompiledPipeline : public Pipeline {
 protected:
  Language lang_;

  explicit CompiledPipeline(Language lang) : lang_(lang) {}
  // relative to the box
  virtual std::string SourceFile(const std::string& source) const;
  virtual std::vector<std::string> CompileCommand(const std::string& source_file) const = 0;
  virtual std::vector<std::string> ExecuteCommand(const std::string& source_file) const = 0;
  virtual long CompileTimeLimit() const { return kCompileTimeLimit; }
 public:
  ExecutionResult Run(const std::string& source, const RunContext&) const override;
};

// gcc / g++
class GccPipeline : public CompiledPipeline {
  std::string compiler_;
  std::vector<std::string> flags_;
 protected:
  std::vector<std::string> CompileCommand(const std::string& source_file) const override;
  std::vector<std::string> ExecuteCommand(const std::string& source_file) const override;
 public:
  GccPipeline(Language lang, std::string compiler, std::vector<std::string> flags) :
      CompiledPipeline(lang), compiler_(std::move(compiler)), flags_(std::move(flags)) {}
};

// first "public class Name" of the source, Main if there is none
std::string JavaClassName(const std::string& source);

class JavaPipeline : public CompiledPipeline {
 protected:
  std::string SourceFile(const std::string& source) const override;
  std::vector<std::string> CompileCommand(const std::string& source_file) const override;
  std::vector<std::string> ExecuteCommand(const std::string& source_file) const override;
 public:
  JavaPipeline() : CompiledPipeline(Language::JAVA) {}
};

class KotlinPipeline : public CompiledPipeline {
 protected:
  std::vector<std::string> CompileCommand(const std::string& source_file) const override;
  std::vector<std::string> ExecuteCommand(const std::string& source_file) const override;
  long CompileTimeLimit() const override { return kBuildTimeLimit; }
 public:
  KotlinPipeline() : CompiledPipeline(Language::KOTLIN) {}
};

// cargo project in a directory workspace; build and run are one step
class CargoPipeline : public Pipeline {
 public:
  ExecutionResult Run(const std::string& source, const RunContext&) const override;
};

// statements terminated by ';' outside quotes; comment-only and blank lines dropped
std::vector<std::string> SplitSqlStatements(const std::string& source);

class SqlPipeline : public Pipeline {
 public:
  ExecutionResult Run(const std::string& source, const RunContext&) const override;
};

#endif  // CODERUN_PIPELINE_H_
