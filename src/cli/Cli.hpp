#pragma once
#include <ostream>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace syncmeta {

// SYNCMETA_LOG_LEVEL as a spdlog level; unset or unknown names give info.
spdlog::level::level_enum logLevelFromEnv();

// Schema file used by the CLI: SYNCMETA_SCHEMA_PATH, else schema.sql in the
// working directory, else the source tree copy. Throws std::runtime_error
// when none exists.
std::string findSchemaPath();

// Runs one CLI command. args[0] is the program name. Records and JSON go to
// out. Returns the process exit status: 0 success, 1 usage error or missing
// id, 2 on any failure (logged).
int runCli(const std::vector<std::string>& args, std::ostream& out);

} // namespace syncmeta
