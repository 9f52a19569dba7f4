#include "utils.h"

#include <fcntl.h>
#include <unistd.h>
#include <cstring>
#include <csignal>
#include <atomic>
#include <cstdint>
#include <fstream>

#include <spdlog/spdlog.h>

namespace {

std::atomic_long sequence = 0;

} // namespace

#if __has_include(<linux/close_range.h>)
#include <linux/close_range.h>
int CloseFrom(int minfd) {
  return close_range(minfd, ~0U, 0);
}
#else
#include <dirent.h>
int CloseFrom(int minfd) {
  DIR *fddir = opendir("/proc/self/fd");
  if (!fddir) goto error;
  {
    int dfd = dirfd(fddir);
    for (struct dirent *dent; (dent = readdir(fddir));) {
      if (!strcmp(dent->d_name, ".") || !strcmp(dent->d_name, "..")) continue;
      int fd = strtol(dent->d_name, NULL, 10);
      if (fd >= minfd && fd != dfd) {
        if (close(fd) && errno != EBADF) goto error_dir;
      }
    }
  }
  closedir(fddir);
  return 0;

error_dir:
  closedir(fddir);
error:
  return -1;
}
#endif // has_include(<linux/close_range.h>)

long GetUniqueSequence() {
  return ++sequence;
}

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;
#define X_RETURN_ARG3(cls, x, y, z, ...) case cls::x: return z;
#define X_RETURN_ARG4(cls, x, y, z, w, ...) case cls::x: return w;

#define X(...) X_RETURN_ARG3(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageDisplayName, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG4(Language, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* LanguageExtension, Language, ENUM_LANGUAGE_)
#undef X

#define X(...) X_RETURN_ARG1(ResultKind, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ResultKindName, ResultKind, ENUM_RESULT_KIND_)
#undef X

#define X(...) X_RETURN_ARG1(ProcessStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ProcessStatusName, ProcessStatus, ENUM_PROCESS_STATUS_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2
#undef X_RETURN_ARG3
#undef X_RETURN_ARG4

static const char* kLanguageNameTable[] = {
#define X(name, id, desc, ext) id,
  ENUM_LANGUAGE_
#undef X
};

const char* LanguageName(Language lang) {
  return kLanguageNameTable[(int)lang];
}

Language GetLanguage(const std::string& str, bool* found) {
  for (int i = 0; i < kLanguageCount; i++) {
    if (str == kLanguageNameTable[i]) {
      if (found) *found = true;
      return (Language)i;
    }
  }
  if (found) *found = false;
  return (Language)0;
}

std::string SanitizeUtf8(const std::string& str) {
  static const char kReplacement[] = "\xEF\xBF\xBD";
  std::string ret;
  ret.reserve(str.size());
  const auto* s = reinterpret_cast<const unsigned char*>(str.data());
  size_t n = str.size();
  for (size_t i = 0; i < n;) {
    unsigned char c = s[i];
    size_t len = 0;
    uint32_t min = 0, cp = 0;
    if (c < 0x80) {
      ret.push_back(c);
      i++;
      continue;
    } else if ((c & 0xE0) == 0xC0) {
      len = 2, min = 0x80, cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      len = 3, min = 0x800, cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      len = 4, min = 0x10000, cp = c & 0x07;
    }
    bool valid = len && i + len <= n;
    for (size_t j = 1; valid && j < len; j++) {
      if ((s[i + j] & 0xC0) != 0x80) {
        valid = false;
      } else {
        cp = cp << 6 | (s[i + j] & 0x3F);
      }
    }
    // reject overlong forms, surrogates and out-of-range code points
    if (valid && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) valid = false;
    if (valid) {
      ret.append(str, i, len);
      i += len;
    } else {
      ret += kReplacement;
      i++;
    }
  }
  return ret;
}

std::string Trim(const std::string& str) {
  static const char kSpaces[] = " \t\n\r\f\v";
  size_t first = str.find_first_not_of(kSpaces);
  if (first == std::string::npos) return "";
  size_t last = str.find_last_not_of(kSpaces);
  return str.substr(first, last - first + 1);
}

bool CreateDirs(const fs::path& path, fs::perms perms) {
  spdlog::debug("Create directories {}", path.c_str());
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) goto err;
  if (perms == fs::perms::unknown) return true;
  fs::permissions(path, perms, ec);
  if (ec) goto err;
  return true;
err:
  spdlog::warn("Failed creating directory {}: {}", path.c_str(), ec.message());
  return false;
}

bool RemoveAll(const fs::path& path) {
  spdlog::debug("Delete {}", path.c_str());
  std::error_code ec;
  fs::remove_all(path, ec);
  if (ec) {
    spdlog::warn("Failed deleting {}: {}", path.c_str(), ec.message());
    return false;
  }
  return true;
}

bool WriteFile(const fs::path& path, const std::string& content) {
  std::ofstream fout(path, std::ios::binary | std::ios::trunc);
  if (!fout || !fout.write(content.data(), content.size()) || !fout.flush()) {
    spdlog::warn("Failed writing {}: {}", path.c_str(), strerror(errno));
    return false;
  }
  return true;
}

std::string SignalDescription(int sig) {
  const char* desc = strsignal(sig);
  return "Killed by signal " + std::to_string(sig) + (desc ? std::string(" (") + desc + ")" : "");
}
