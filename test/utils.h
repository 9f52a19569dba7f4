#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <sys/types.h>
#include <mutex>
#include <string>
#include <vector>
#include <filesystem>

#include <gtest/gtest.h>
#include <coderun/process.h>

namespace fs = std::filesystem;

// whether an executable of this name is on PATH
bool ToolAvailable(const std::string& name);

#define SKIP_WITHOUT_TOOL(name) \
  if (!ToolAvailable(name)) GTEST_SKIP() << name << " not found in PATH"

// false for exited and zombie processes
bool ProcessAlive(pid_t pid);
// poll ProcessAlive for up to two seconds
bool WaitProcessGone(pid_t pid);

// number of entries directly inside dir; 0 if it does not exist
size_t CountEntries(const fs::path& dir);

// set a configuration value for the lifetime of the object
class ScopedValue {
  long& target_;
  long old_;
 public:
  ScopedValue(long& target, long value) : target_(target), old_(target) { target_ = value; }
  ~ScopedValue() { target_ = old_; }
};

// runs locally and remembers what it was asked to run
class RecordingRunner : public ProcessRunner {
  LocalProcessRunner runner_;
  mutable std::mutex mtx_;
  std::vector<ProcessOptions> calls_;
  std::vector<bool> workdir_existed_;
 public:
  ProcessOutcome Run(const ProcessOptions& opt) override;

  std::vector<ProcessOptions> Calls() const;
  // whether the working directory existed when each call started
  std::vector<bool> WorkdirExisted() const;
};

#endif // TEST_UTILS_H_
