#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace filemeta {

using Bytes = std::vector<std::uint8_t>;

// What a backend hands back: byte payloads for extended attributes and the
// FinderInfo record, JSON-shaped native values for the structured stores.
using RawValue = std::variant<Bytes, nlohmann::json>;

// Raw byte access to a file's extended attributes.
class XattrPrimitive {
public:
  virtual ~XattrPrimitive() = default;
  // std::nullopt when the attribute is absent.
  virtual std::optional<Bytes> read(const std::string& path, const std::string& key) = 0;
  virtual void write(const std::string& path, const std::string& key, const Bytes& value) = 0;
  // Removing an absent attribute is not an error.
  virtual void remove(const std::string& path, const std::string& key) = 0;
  virtual std::vector<std::string> list(const std::string& path) = 0;
};

// Structured, read-only per-file metadata (Spotlight-style item values).
class ItemValueSource {
public:
  virtual ~ItemValueSource() = default;
  virtual std::optional<nlohmann::json> copyItemValue(const std::string& path,
                                                      const std::string& key) = 0;
};

// Per-file resource values keyed by resource key.
class ResourceValueStore {
public:
  virtual ~ResourceValueStore() = default;
  virtual std::optional<nlohmann::json> getResourceValue(const std::string& path,
                                                         const std::string& key) = 0;
  // A null json value removes the key.
  virtual void setResourceValue(const std::string& path,
                                const std::string& key,
                                const nlohmann::json& value) = 0;
};

// Automation side channel. Throws AutomationUnavailable when the script
// cannot be delivered or the target refuses it.
class ScriptRunner {
public:
  virtual ~ScriptRunner() = default;
  virtual std::string runScript(const std::string& scriptText) = 0;
};

} // namespace filemeta
