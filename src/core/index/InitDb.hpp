#pragma once
#include <string>

namespace filemeta {

// Layout version written to PRAGMA user_version.
constexpr int kIndexSchemaVersion = 1;

// Creates the sidecar database if needed and applies schemaPath (idempotent).
// Returns the schema version now in effect. Throws StorageError when the file
// cannot be opened, the schema fails, or the index was written by a newer
// layout.
int initDatabase(const std::string& dbPath, const std::string& schemaPath);

} // namespace filemeta
