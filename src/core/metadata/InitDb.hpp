#pragma once
#include <string>

namespace syncmeta {

// Version written to PRAGMA user_version once schema.sql has been applied.
inline constexpr int kSchemaVersion = 1;

// Creates the database (and its parent directory) if needed and brings it up
// to kSchemaVersion by applying the schema file inside one transaction.
// Returns true when the schema was applied, false when the database was
// already current. Throws std::runtime_error on SQLite or file errors, when
// the database was written by a newer schema, or when the schema file does
// not produce the model_metadata table.
bool initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace syncmeta
