#include "Config.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>

namespace filemeta {

std::string get_env_or(const char* key, const std::string& defval) {
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
}

static bool parse_flag(const std::string& s) {
  std::string v = s;
  std::transform(v.begin(), v.end(), v.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return v == "1" || v == "true" || v == "yes" || v == "on";
}

Config loadConfigFromEnv() {
  Config cfg;
  cfg.indexDbPath   = get_env_or("FILEMETA_INDEX_DB", "data/filemeta-index.db");
  cfg.schemaPath    = get_env_or("FILEMETA_SCHEMA", "");
  cfg.xattrPrefix   = get_env_or("FILEMETA_XATTR_PREFIX", "user.");
  cfg.osascriptPath = get_env_or("FILEMETA_OSASCRIPT", "osascript");
  cfg.tzAware       = parse_flag(get_env_or("FILEMETA_TZ_AWARE", "0"));
  cfg.logLevel      = get_env_or("FILEMETA_LOG_LEVEL", "info");
  return cfg;
}

std::string findSchemaPath(const Config& cfg) {
  namespace fs = std::filesystem;
  if (!cfg.schemaPath.empty()) {
    if (fs::exists(cfg.schemaPath)) return cfg.schemaPath;
    throw std::runtime_error("FILEMETA_SCHEMA points to a missing file: " + cfg.schemaPath);
  }
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/index/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (looked in CWD and src/core/index)");
}

void applyLogLevel(const Config& cfg) {
  auto level = spdlog::level::from_str(cfg.logLevel);
  // from_str maps unknown names to "off"
  if (level == spdlog::level::off && cfg.logLevel != "off") {
    spdlog::warn("unknown FILEMETA_LOG_LEVEL '{}', using info", cfg.logLevel);
    level = spdlog::level::info;
  }
  spdlog::set_level(level);
}

} // namespace filemeta
