#ifndef INCLUDE_CODERUN_UTILS_H_
#define INCLUDE_CODERUN_UTILS_H_

#include <string>
#include "execution.h"

const char* LanguageName(Language);
const char* LanguageDisplayName(Language);
const char* LanguageExtension(Language);
// unknown identifiers map to the first language; found reports whether it matched
Language GetLanguage(const std::string&, bool* found = nullptr);
constexpr int kLanguageCount = 0
#define X(name, ...) + 1
  ENUM_LANGUAGE_
#undef X
  ;

// logging
const char* ResultKindName(ResultKind);

// replace invalid UTF-8 sequences by U+FFFD
std::string SanitizeUtf8(const std::string&);
std::string Trim(const std::string&);

#endif  // INCLUDE_CODERUN_UTILS_H_
