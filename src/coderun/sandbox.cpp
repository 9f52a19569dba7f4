#include "sandbox.h"

#include <fcntl.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <thread>
#include <filesystem>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include <coderun/sandbox.h>
#include "utils.h"

void SandboxOptions::FillCJailCtx(CJailCtxClass& ret) const {
  struct cjail_ctx& ctx = ret.ctx_;
  cjail_ctx_init(&ctx);
  // default: preservefd, sharenet
  if (fd_output != -1) ctx.fd_output = fd_output;
  if (fd_error != -1) ctx.fd_error = fd_error;
  ctx.redir_input = input.empty() ? "/dev/null" : input.data();
  for (auto& i : command) ret.argv_buf_.push_back(i.data());
  ret.argv_buf_.push_back(nullptr);
  ctx.argv = const_cast<char* const*>(ret.argv_buf_.data());
  if (preserve_env) {
    ctx.environ = environ;
  } else {
    for (auto& i : envs) ret.env_buf_.emplace_back(i.data());
    ret.env_buf_.push_back(nullptr);
    ctx.environ = const_cast<char* const*>(ret.env_buf_.data());
  }
  // no chroot: toolchains are used from the host
  ctx.chroot = nullptr;
  if (!workdir.empty()) ctx.working_dir = workdir.data();
  ctx.cpuset = nullptr;
  ctx.uid = uid;
  ctx.gid = gid;
  ctx.rlim_core = 0; // no core dump
  ctx.rlim_fsize = fsize;
  ctx.rlim_proc = proc_num;
  ctx.cg_rss = rss;
  ctx.lim_time.tv_sec = wall_time / 1'000'000;
  ctx.lim_time.tv_usec = wall_time % 1'000'000;
  ctx.mount_cfg = ret.mnt_list_;
}

namespace {

using Clock = ProcessOutcome::Clock;

// the jailed user must be able to write its outputs into the box
bool GrantBox(const std::string& dir, int uid, int gid) {
  if (dir.empty()) return true;
  std::error_code ec;
  if (lchown(dir.c_str(), uid, gid) < 0) goto err;
  for (auto it = fs::recursive_directory_iterator(dir, ec); !ec && it != fs::recursive_directory_iterator();
       it.increment(ec)) {
    if (lchown(it->path().c_str(), uid, gid) < 0) goto err;
  }
  if (ec) {
    spdlog::warn("Failed listing {}: {}", dir, ec.message());
    return false;
  }
  return true;
err:
  spdlog::warn("Failed changing owner of {}: {}", dir, strerror(errno));
  return false;
}

void Drain(int fd, std::string& buf, bool& truncated, long limit) {
  char tmp[65536];
  ssize_t n;
  while ((n = read(fd, tmp, sizeof(tmp))) != 0) {
    if (n < 0) {
      if (errno == EINTR) continue;
      break;
    }
    size_t keep = n;
    if (limit > 0 && buf.size() + keep > (size_t)limit) {
      keep = (size_t)limit - buf.size();
      truncated = true;
    }
    buf.append(tmp, keep);
  }
  close(fd);
}

} // namespace

ProcessOutcome JailProcessRunner::Run(const ProcessOptions& opt) {
  ProcessOutcome ret;
  ret.start = ret.end = Clock::now();
  if (opt.command.empty()) {
    ret.error = EINVAL;
    return ret;
  }
  if (opt.cancel) spdlog::debug("Cancellation is ignored by the jail runner");
  if (!GrantBox(opt.workdir, uid_, gid_)) {
    ret.error = EPERM;
    return ret;
  }

  SandboxOptions sopt;
  sopt.command = opt.command;
  sopt.preserve_env = opt.preserve_env;
  sopt.envs = opt.envs;
  sopt.workdir = opt.workdir;
  sopt.input = opt.input;
  sopt.uid = uid_;
  sopt.gid = gid_;
  sopt.wall_time = opt.wall_time;
  sopt.rss = rss_;
  sopt.proc_num = proc_num_;
  sopt.fsize = fsize_;

  int out_pipe[2], err_pipe[2];
  if (pipe2(out_pipe, O_CLOEXEC) < 0) {
    ret.error = errno;
    return ret;
  }
  if (pipe2(err_pipe, O_CLOEXEC) < 0) {
    ret.error = errno;
    close(out_pipe[0]);
    close(out_pipe[1]);
    return ret;
  }
  sopt.fd_output = out_pipe[1];
  sopt.fd_error = err_pipe[1];

  std::string out_buf, err_buf;
  std::thread out_reader(Drain, out_pipe[0], std::ref(out_buf), std::ref(ret.out_truncated), opt.output_limit);
  std::thread err_reader(Drain, err_pipe[0], std::ref(err_buf), std::ref(ret.err_truncated), opt.output_limit);

  struct cjail_result res = {};
  int exec_ret;
  {
    CJailCtxClass ctx;
    sopt.FillCJailCtx(ctx);
    spdlog::debug("cjail_exec command={} workdir={} uid={}", fmt::format("{}", opt.command), opt.workdir, uid_);
    exec_ret = cjail_exec(&ctx.GetCtx(), &res);
    if (exec_ret < 0) ret.error = errno;
  }
  // the jail is gone together with its pid namespace; the readers see EOF
  close(out_pipe[1]);
  close(err_pipe[1]);
  out_reader.join();
  err_reader.join();
  ret.end = Clock::now();

  if (exec_ret < 0) {
    spdlog::warn("cjail_exec error: errno={} {}", ret.error, strerror(ret.error));
    ret.status = ProcessStatus::SPAWN_FAILED;
  } else if (res.timekill) {
    ret.status = ProcessStatus::TIMED_OUT;
  } else if (res.info.si_code == CLD_EXITED) {
    ret.status = ProcessStatus::EXITED;
    ret.exit_code = res.info.si_status;
  } else {
    ret.status = ProcessStatus::SIGNALED;
    ret.signal = res.info.si_status;
    if (res.oomkill) spdlog::info("Jailed process killed by the memory limit");
  }
  ret.out = SanitizeUtf8(out_buf);
  ret.err = SanitizeUtf8(err_buf);
  spdlog::debug("Jailed process finished: status={} exit_code={} signal={} time={:.3f}s",
                ProcessStatusName(ret.status), ret.exit_code, ret.signal, ret.Seconds());
  return ret;
}
