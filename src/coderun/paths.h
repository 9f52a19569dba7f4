#ifndef CODERUN_PATHS_H_
#define CODERUN_PATHS_H_

#include <string>
#include <coderun/paths.h>
#include <coderun/execution.h>

fs::path WorkspaceBox(const std::string& token);

// names relative to the workspace box
std::string SourceName(Language lang);
std::string ProgramName(Language lang);
extern const char kSqlDatabaseName[];
// the statement being run, fed to stdin
extern const char kSqlStatementName[];
extern const char kCargoManifestName[];
extern const char kCargoSourceName[];

#endif  // CODERUN_PATHS_H_
