#include <coderun/process.h>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = ProcessOutcome::Clock;

constexpr int kPollIntervalMs = 20;
constexpr int kWaitIntervalMs = 5;
constexpr size_t kReadBufferSize = 65536;

// fd 3 inside the child; closed on successful exec
constexpr int kReportFd = 3;

struct Capture {
  int fd;
  std::string buf;
  bool truncated;
};

void CloseFd(int& fd) {
  if (fd >= 0) close(fd);
  fd = -1;
}

// read what is available; return false on EOF or error
bool ReadAvailable(Capture& cap, long limit) {
  char buf[kReadBufferSize];
  while (true) {
    ssize_t n = read(cap.fd, buf, sizeof(buf));
    if (n > 0) {
      size_t keep = n;
      if (limit > 0 && cap.buf.size() + keep > (size_t)limit) {
        keep = (size_t)limit - cap.buf.size();
        cap.truncated = true;
      }
      cap.buf.append(buf, keep);
      continue;
    }
    if (n < 0 && errno == EINTR) continue;
    if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return true;
    return false;
  }
}

void KillTree(pid_t pid) {
  // the child leads its own process group (setsid)
  kill(-pid, SIGKILL);
  kill(pid, SIGKILL);
}

bool ChildExited(pid_t pid) {
  siginfo_t info = {};
  // WNOWAIT keeps the process group id reserved until the child is reaped
  return waitid(P_PID, pid, &info, WEXITED | WNOHANG | WNOWAIT) == 0 && info.si_pid == pid;
}

// only async-signal-safe calls from here on
[[noreturn]] void ExecChild(const ProcessOptions& opt, char* const* argv, char* const* envp,
                            int in_fd, int out_fd, int err_fd, int report_fd) {
  setsid();
  // every pipe end is above 2, so stdio can be replaced first
  if (dup2(in_fd, 0) < 0 || dup2(out_fd, 1) < 0 || dup2(err_fd, 2) < 0) _exit(127);
  if (report_fd != kReportFd && dup2(report_fd, kReportFd) < 0) _exit(127);
  auto report = [](int err) {
    IGNORE_RETURN(write(kReportFd, &err, sizeof(err)));
    _exit(127);
  };
  if (fcntl(kReportFd, F_SETFD, FD_CLOEXEC) < 0) report(errno);
  CloseFrom(kReportFd + 1);
  signal(SIGPIPE, SIG_DFL);
  // the server blocks its shutdown signals; programs start with a clean mask
  sigset_t empty;
  sigemptyset(&empty);
  sigprocmask(SIG_SETMASK, &empty, nullptr);
  if (!opt.workdir.empty() && chdir(opt.workdir.c_str()) < 0) report(errno);
  if (opt.preserve_env) {
    execvp(argv[0], argv);
  } else {
    execvpe(argv[0], argv, envp);
  }
  report(errno);
  __builtin_unreachable();
}

} // namespace

ProcessOutcome LocalProcessRunner::Run(const ProcessOptions& opt) {
  ProcessOutcome ret;
  ret.start = ret.end = Clock::now();
  if (opt.command.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  spdlog::debug("Run command={} workdir={} wall_time={}us",
                fmt::format("{}", opt.command), opt.workdir, opt.wall_time);

  // everything the child needs is allocated before fork
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);

  int in_fd = -1, out_pipe[2] = {-1, -1}, err_pipe[2] = {-1, -1}, report_pipe[2] = {-1, -1};
  Capture caps[2] = {{-1, {}, false}, {-1, {}, false}};
  bool limit_hit = false;
  int status = 0;
  pid_t pid;

  in_fd = open(opt.input.empty() ? "/dev/null" : opt.input.c_str(), O_RDONLY | O_CLOEXEC);
  if (in_fd < 0 || pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0 ||
      pipe2(report_pipe, O_CLOEXEC) < 0) {
    goto err;
  }
  pid = fork();
  if (pid < 0) goto err;
  if (pid == 0) ExecChild(opt, argv.data(), envp.data(), in_fd, out_pipe[1], err_pipe[1], report_pipe[1]);

  CloseFd(in_fd);
  CloseFd(out_pipe[1]);
  CloseFd(err_pipe[1]);
  CloseFd(report_pipe[1]);
  {
    int child_errno = 0;
    ssize_t n;
    while ((n = read(report_pipe[0], &child_errno, sizeof(child_errno))) < 0 && errno == EINTR);
    CloseFd(report_pipe[0]);
    if (n == sizeof(child_errno)) {
      while (waitpid(pid, nullptr, 0) < 0 && errno == EINTR);
      CloseFd(out_pipe[0]);
      CloseFd(err_pipe[0]);
      ret.end = Clock::now();
      ret.error = child_errno;
      spdlog::warn("Failed to execute {}: {}", opt.command[0], strerror(child_errno));
      return ret;
    }
  }

  caps[0].fd = out_pipe[0];
  caps[1].fd = err_pipe[0];
  for (auto& cap : caps) fcntl(cap.fd, F_SETFL, fcntl(cap.fd, F_GETFL) | O_NONBLOCK);
  {
    auto deadline = opt.wall_time > 0 ?
        ret.start + std::chrono::microseconds(opt.wall_time) : Clock::time_point::max();
    auto check_limits = [&]() {
      if (opt.cancel && opt.cancel->load()) {
        ret.status = ProcessStatus::CANCELLED;
      } else if (Clock::now() >= deadline) {
        ret.status = ProcessStatus::TIMED_OUT;
      } else {
        return false;
      }
      spdlog::info("Killing process group {}: {}", pid, ProcessStatusName(ret.status));
      KillTree(pid);
      limit_hit = true;
      return true;
    };
    while (!check_limits()) {
      struct pollfd fds[2];
      int nfds = 0;
      for (auto& cap : caps) {
        if (cap.fd >= 0) fds[nfds++] = {cap.fd, POLLIN, 0};
      }
      int timeout = nfds ? kPollIntervalMs : kWaitIntervalMs;
      if (deadline != Clock::time_point::max()) {
        auto remain = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()).count();
        timeout = std::max(0, (int)std::min<long>(timeout, remain + 1));
      }
      if (poll(fds, nfds, timeout) < 0 && errno != EINTR) {
        spdlog::warn("poll failed: {}", strerror(errno));
        KillTree(pid);
        break;
      }
      for (int i = 0; i < nfds; i++) {
        if (!fds[i].revents) continue;
        for (auto& cap : caps) {
          if (cap.fd == fds[i].fd && !ReadAvailable(cap, opt.output_limit)) CloseFd(cap.fd);
        }
      }
      // descendants left behind by the child do not keep the call waiting
      if (ChildExited(pid)) break;
    }
  }
  // nothing of the tree may outlive the call
  kill(-pid, SIGKILL);
  while (waitpid(pid, &status, 0) < 0 && errno == EINTR);
  ret.end = Clock::now();
  // whatever is still buffered in the pipes; every writer in the group is gone by now
  for (auto& cap : caps) {
    if (cap.fd >= 0) ReadAvailable(cap, opt.output_limit);
    CloseFd(cap.fd);
  }
  if (!limit_hit) {
    if (WIFEXITED(status)) {
      ret.status = ProcessStatus::EXITED;
      ret.exit_code = WEXITSTATUS(status);
    } else {
      ret.status = ProcessStatus::SIGNALED;
      ret.signal = WTERMSIG(status);
    }
  }
  ret.out = SanitizeUtf8(caps[0].buf);
  ret.err = SanitizeUtf8(caps[1].buf);
  ret.out_truncated = caps[0].truncated;
  ret.err_truncated = caps[1].truncated;
  spdlog::debug("Process {} finished: status={} exit_code={} signal={} time={:.3f}s",
                pid, ProcessStatusName(ret.status), ret.exit_code, ret.signal, ret.Seconds());
  return ret;

err:
  ret.error = errno;
  spdlog::warn("Failed to spawn {}: {}", opt.command[0], strerror(ret.error));
  for (int* fd : {&in_fd, &out_pipe[0], &out_pipe[1], &err_pipe[0], &err_pipe[1],
                  &report_pipe[0], &report_pipe[1]}) {
    CloseFd(*fd);
  }
  ret.end = Clock::now();
  return ret;
}
