#ifndef INCLUDE_CODERUN_EXECUTION_H_
#define INCLUDE_CODERUN_EXECUTION_H_

#include <string>
#include <utility>

// us
extern long kCompileTimeLimit;
extern long kRunTimeLimit;
extern long kBuildTimeLimit;
// KiB, per captured stream
extern long kMaxOutput;

// id, display name, source extension
// the first one is the fallback for unknown identifiers
#define ENUM_LANGUAGE_ \
  X(PYTHON, "python", "Python", ".py") \
  X(C, "c", "C", ".c") \
  X(CPP, "cpp", "C++", ".cpp") \
  X(JAVA, "java", "Java", ".java") \
  X(KOTLIN, "kotlin", "Kotlin", ".kt") \
  X(JAVASCRIPT, "javascript", "JavaScript", ".js") \
  X(RUST, "rust", "Rust", ".rs") \
  X(SQL, "sql", "SQL", ".sql") \
  X(TEXT, "text", "Plain Text", ".txt")
enum class Language {
#define X(name, id, desc, ext) name,
  ENUM_LANGUAGE_
#undef X
};

#define ENUM_RESULT_KIND_ \
  X(OK) \
  X(INPUT_ERROR) \
  X(COMPILE_ERROR) \
  X(RUNTIME_ERROR) \
  X(TIMED_OUT) \
  X(SYSTEM_ERROR)
enum class ResultKind {
#define X(name) name,
  ENUM_RESULT_KIND_
#undef X
};

struct ExecutionRequest {
  std::string source;
  std::string language;
};

class ExecutionResult {
 public:
  ResultKind kind;
  // exactly one channel carries text: output if !is_error, error otherwise
  bool is_error;
  std::string text;
  double execution_time; // seconds

  ExecutionResult() : kind(ResultKind::OK), is_error(false), execution_time(0) {}

  static ExecutionResult Output(std::string text, double time, ResultKind kind = ResultKind::OK) {
    ExecutionResult ret;
    ret.kind = kind;
    ret.text = std::move(text);
    ret.execution_time = time;
    return ret;
  }
  static ExecutionResult Error(ResultKind kind, std::string text, double time = 0) {
    ExecutionResult ret;
    ret.kind = kind;
    ret.is_error = true;
    ret.text = std::move(text);
    ret.execution_time = time;
    return ret;
  }
};

#endif  // INCLUDE_CODERUN_EXECUTION_H_
