#ifndef INCLUDE_CODERUN_SANDBOX_H_
#define INCLUDE_CODERUN_SANDBOX_H_

#include "process.h"

// Runs every process inside a cjail jail: dropped uid/gid, own pid namespace,
//   cgroup memory limit and resource limits.
// Cancellation is not supported; the wall time limit still applies.
class JailProcessRunner : public ProcessRunner {
  int uid_, gid_;
  long rss_; // KiB
  int proc_num_;
  long fsize_; // KiB
 public:
  JailProcessRunner(int uid = 65534, int gid = 65534,
                    long rss = 512 * 1024, int proc_num = 256, long fsize = 64 * 1024) :
      uid_(uid), gid_(gid), rss_(rss), proc_num_(proc_num), fsize_(fsize) {}
  ProcessOutcome Run(const ProcessOptions&) override;
};

#endif  // INCLUDE_CODERUN_SANDBOX_H_
