#ifndef INCLUDE_CODERUN_PROCESS_H_
#define INCLUDE_CODERUN_PROCESS_H_

#include <atomic>
#include <chrono>
#include <string>
#include <vector>

#define ENUM_PROCESS_STATUS_ \
  X(EXITED) \
  X(SIGNALED) \
  X(TIMED_OUT) \
  X(CANCELLED) \
  X(SPAWN_FAILED)
enum class ProcessStatus {
#define X(name) name,
  ENUM_PROCESS_STATUS_
#undef X
};

const char* ProcessStatusName(ProcessStatus);

class ProcessOptions {
 public:
  std::vector<std::string> command; // command[0] is searched in PATH
  std::string workdir;
  std::string input; // file fed to stdin; empty for /dev/null
  bool preserve_env; // override envs
  std::vector<std::string> envs;
  long wall_time; // us; 0 for no limit
  long output_limit; // bytes kept per stream; 0 for no limit
  // polled while waiting; the process tree is killed once it becomes true
  const std::atomic_bool* cancel;

  ProcessOptions() :
      preserve_env(true),
      wall_time(0),
      output_limit(0),
      cancel(nullptr) {}
};

struct ProcessOutcome {
  using Clock = std::chrono::steady_clock;

  ProcessStatus status;
  int exit_code; // EXITED
  int signal; // SIGNALED
  int error; // errno for SPAWN_FAILED
  std::string out, err; // best-effort UTF-8
  bool out_truncated, err_truncated;
  Clock::time_point start, end;

  ProcessOutcome() :
      status(ProcessStatus::SPAWN_FAILED), exit_code(0), signal(0), error(0),
      out_truncated(false), err_truncated(false) {}

  bool Success() const { return status == ProcessStatus::EXITED && exit_code == 0; }
  double Seconds() const { return std::chrono::duration<double>(end - start).count(); }
};

class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;
  // A non-zero exit status is reported in the outcome, never as a failure of Run
  virtual ProcessOutcome Run(const ProcessOptions&) = 0;
};

// fork & exec on the host; the child leads a new session so that the whole
//   process tree can be killed through its process group
class LocalProcessRunner : public ProcessRunner {
 public:
  ProcessOutcome Run(const ProcessOptions&) override;
};

#endif  // INCLUDE_CODERUN_PROCESS_H_
