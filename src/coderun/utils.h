#ifndef CODERUN_UTILS_H_
#define CODERUN_UTILS_H_

#include <string>
#include <filesystem>

#include <coderun/utils.h>
#include <coderun/process.h>

namespace fs = std::filesystem;

#define IGNORE_RETURN(x) { auto _ __attribute__((unused)) = x; }

long GetUniqueSequence();

// close every fd >= minfd; async-signal-safe apart from the /proc fallback
int CloseFrom(int minfd);

bool CreateDirs(const fs::path&, fs::perms = fs::perms::unknown);
bool RemoveAll(const fs::path&);
bool WriteFile(const fs::path&, const std::string& content);

// "Killed by signal 11 (Segmentation fault)"
std::string SignalDescription(int sig);

#endif  // CODERUN_UTILS_H_
