#pragma once
#include <string>

namespace filemeta {

struct Config {
  std::string indexDbPath;
  std::string schemaPath;     // empty = search default locations
  std::string xattrPrefix;
  std::string osascriptPath;
  bool        tzAware = false;
  std::string logLevel;
};

std::string get_env_or(const char* key, const std::string& defval);

// Reads FILEMETA_* variables, falling back to defaults.
Config loadConfigFromEnv();

// Look for schema.sql in CWD first, then the source tree.
std::string findSchemaPath(const Config& cfg);

// Applies cfg.logLevel to the default spdlog logger.
void applyLogLevel(const Config& cfg);

} // namespace filemeta
