#ifndef CODERUN_SANDBOX_H_
#define CODERUN_SANDBOX_H_

#include <string>
#include <vector>

#include <cjail/cjail.h>

class SandboxOptions;
class CJailCtxClass {
 private:
  std::vector<const char*> argv_buf_;
  std::vector<const char*> env_buf_;
  struct jail_mount_list* mnt_list_;
  struct cjail_ctx ctx_;
 public:
  CJailCtxClass() : mnt_list_(mnt_list_new()) {}
  CJailCtxClass(const CJailCtxClass&) = delete;
  CJailCtxClass& operator=(const CJailCtxClass&) = delete;
  ~CJailCtxClass() {
    mnt_list_free(mnt_list_);
  }
  struct cjail_ctx& GetCtx() { return ctx_; }
  const struct cjail_ctx& GetCtx() const { return ctx_; }

  friend class SandboxOptions;
};

class SandboxOptions {
 public:
  std::vector<std::string> command;
  bool preserve_env; // override envs
  std::vector<std::string> envs;
  std::string workdir, input;
  int fd_output, fd_error; // -1 for not dup
  int uid, gid;
  long wall_time; // us
  long rss; // KiB
  int proc_num;
  long fsize; // KiB

  SandboxOptions() :
      preserve_env(true),
      fd_output(-1), fd_error(-1),
      uid(65534), gid(65534),
      wall_time(0),
      rss(0),
      proc_num(0),
      fsize(0) {}

  // the context keeps pointers into this object; it must not outlive it
  void FillCJailCtx(CJailCtxClass&) const;
};

#endif  // CODERUN_SANDBOX_H_
