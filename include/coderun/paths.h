#ifndef INCLUDE_CODERUN_PATHS_H_
#define INCLUDE_CODERUN_PATHS_H_

#include <filesystem>

namespace fs = std::filesystem;

// every workspace box lives directly under this directory
extern fs::path kWorkspaceRoot;

#endif  // INCLUDE_CODERUN_PATHS_H_
