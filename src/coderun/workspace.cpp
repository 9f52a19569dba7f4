#include <coderun/workspace.h>

#include <unistd.h>
#include <random>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include "paths.h"
#include "utils.h"

namespace {

constexpr int kAcquireRetries = 5;

std::string GenerateToken() {
  thread_local std::mt19937_64 rng(std::random_device{}());
  return fmt::format("{}-{:06d}-{:016x}", getpid(), GetUniqueSequence(), rng());
}

} // namespace

std::unique_ptr<Workspace> Workspace::Acquire(WorkspaceKind kind, const std::string& extension) {
  if (!CreateDirs(kWorkspaceRoot)) return nullptr;
  for (int i = 0; i < kAcquireRetries; i++) {
    fs::path box = WorkspaceBox(GenerateToken());
    std::error_code ec;
    // create_directory returns false without error if the box already exists
    if (!fs::create_directory(box, ec)) {
      if (ec) {
        spdlog::warn("Failed creating workspace {}: {}", box.c_str(), ec.message());
        return nullptr;
      }
      spdlog::debug("Workspace {} collided, retrying", box.c_str());
      continue;
    }
    fs::permissions(box, fs::perms::owner_all, ec);
    if (ec) {
      spdlog::warn("Failed setting permission of workspace {}: {}", box.c_str(), ec.message());
      RemoveAll(box);
      return nullptr;
    }
    fs::path path = kind == WorkspaceKind::SINGLE_FILE ? box / ("prog" + extension) : box;
    spdlog::debug("Acquired workspace {}", path.c_str());
    return std::unique_ptr<Workspace>(new Workspace(std::move(box), std::move(path), kind));
  }
  spdlog::warn("Failed allocating a unique workspace after {} attempts", kAcquireRetries);
  return nullptr;
}

bool Workspace::Write(const fs::path& relative, const std::string& content) const {
  fs::path path = Artifact(relative);
  if (path.has_parent_path() && path.parent_path() != root_ && !CreateDirs(path.parent_path())) {
    return false;
  }
  return WriteFile(path, content);
}

bool Workspace::WriteSource(const std::string& content) const {
  if (kind_ != WorkspaceKind::SINGLE_FILE) {
    spdlog::warn("Workspace {} has no single source file", root_.c_str());
    return false;
  }
  return WriteFile(path_, content);
}

bool Workspace::Release() {
  if (released_) return true;
  released_ = true;
  spdlog::debug("Releasing workspace {}", root_.c_str());
  return RemoveAll(root_);
}
