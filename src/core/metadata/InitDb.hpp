#pragma once
#include <string>

namespace skya {

// Schema generation written to PRAGMA user_version by this build.
constexpr int kSchemaVersion = 1;

// Creates the archive database if needed and brings it to kSchemaVersion.
// Every statement in schema.sql is idempotent, so this runs on each start.
// Refuses a database stamped by a newer build. Throws std::runtime_error.
// Returns the version the database was at before the call (0 for a new file).
int initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace skya
