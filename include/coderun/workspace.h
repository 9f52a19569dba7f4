#ifndef INCLUDE_CODERUN_WORKSPACE_H_
#define INCLUDE_CODERUN_WORKSPACE_H_

#include <memory>
#include <string>
#include <utility>
#include <filesystem>

namespace fs = std::filesystem;

enum class WorkspaceKind {
  SINGLE_FILE, // one source file prog<ext> inside the box
  DIRECTORY, // the box itself is the root of a tree
};

// An execution-scoped box directory <kWorkspaceRoot>/<token>.
// The box is also the working directory of every process of the execution.
// Everything inside is removed when the handle is released or destroyed.
class Workspace {
  fs::path root_;
  fs::path path_;
  WorkspaceKind kind_;
  bool released_;

  Workspace(fs::path root, fs::path path, WorkspaceKind kind) :
      root_(std::move(root)), path_(std::move(path)), kind_(kind), released_(false) {}
 public:
  // nullptr if the box cannot be created
  static std::unique_ptr<Workspace> Acquire(WorkspaceKind kind, const std::string& extension = "");

  Workspace(const Workspace&) = delete;
  Workspace& operator=(const Workspace&) = delete;
  ~Workspace() { Release(); }

  const fs::path& Root() const { return root_; }
  // the source file for SINGLE_FILE, the box for DIRECTORY
  const fs::path& Path() const { return path_; }
  WorkspaceKind Kind() const { return kind_; }
  fs::path Artifact(const fs::path& relative) const { return root_ / relative; }

  // create parent directories inside the box if needed
  bool Write(const fs::path& relative, const std::string& content) const;
  bool WriteSource(const std::string& content) const;

  // best effort; failures are logged and the handle still counts as released
  bool Release();
};

#endif  // INCLUDE_CODERUN_WORKSPACE_H_
