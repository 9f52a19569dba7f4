#include "utils.h"

#include <unistd.h>
#include <cstdlib>
#include <sstream>
#include <fstream>

bool ToolAvailable(const std::string& name) {
  const char* path = getenv("PATH");
  if (!path) return false;
  std::istringstream in(path);
  for (std::string dir; std::getline(in, dir, ':');) {
    if (dir.empty()) continue;
    fs::path file = fs::path(dir) / name;
    if (access(file.c_str(), X_OK) == 0) return true;
  }
  return false;
}

bool ProcessAlive(pid_t pid) {
  std::ifstream fin("/proc/" + std::to_string(pid) + "/stat");
  std::string stat;
  if (!std::getline(fin, stat)) return false;
  // pid (comm) state ...
  size_t pos = stat.rfind(')');
  if (pos == std::string::npos || pos + 2 >= stat.size()) return false;
  return stat[pos + 2] != 'Z' && stat[pos + 2] != 'X';
}

bool WaitProcessGone(pid_t pid) {
  for (int i = 0; i < 100; i++) {
    if (!ProcessAlive(pid)) return true;
    usleep(20'000);
  }
  return false;
}

size_t CountEntries(const fs::path& dir) {
  std::error_code ec;
  size_t ret = 0;
  for (auto it = fs::directory_iterator(dir, ec); !ec && it != fs::directory_iterator(); it.increment(ec)) ret++;
  return ret;
}

ProcessOutcome RecordingRunner::Run(const ProcessOptions& opt) {
  {
    std::lock_guard<std::mutex> lck(mtx_);
    calls_.push_back(opt);
    workdir_existed_.push_back(fs::is_directory(opt.workdir));
  }
  return runner_.Run(opt);
}

std::vector<ProcessOptions> RecordingRunner::Calls() const {
  std::lock_guard<std::mutex> lck(mtx_);
  return calls_;
}

std::vector<bool> RecordingRunner::WorkdirExisted() const {
  std::lock_guard<std::mutex> lck(mtx_);
  return workdir_existed_;
}
