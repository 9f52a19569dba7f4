#include "paths.h"

#include <coderun/utils.h>

fs::path kWorkspaceRoot = "/tmp/coderun_box";

const char kSqlDatabaseName[] = "prog.db";
const char kSqlStatementName[] = "stmt.sql";
const char kCargoManifestName[] = "Cargo.toml";
const char kCargoSourceName[] = "src/main.rs";

fs::path WorkspaceBox(const std::string& token) {
  return kWorkspaceRoot / token;
}

std::string SourceName(Language lang) {
  return std::string("prog") + LanguageExtension(lang);
}

std::string ProgramName(Language lang) {
  switch (lang) {
    case Language::C: [[fallthrough]];
    case Language::CPP: return "prog";
    case Language::KOTLIN: return "prog.jar";
    // run from source, or named after something found in the source (java)
    case Language::PYTHON: [[fallthrough]];
    case Language::JAVA: [[fallthrough]];
    case Language::RUST: [[fallthrough]];
    case Language::JAVASCRIPT: [[fallthrough]];
    case Language::SQL: [[fallthrough]];
    case Language::TEXT: return SourceName(lang);
  }
  __builtin_unreachable();
}
