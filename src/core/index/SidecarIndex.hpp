#pragma once
#include <optional>
#include <string>

#include "core/storage/Primitives.hpp"

namespace filemeta {

// SQLite-backed stand-in for the metadata-item and resource-key stores.
// The database must have been initialized with initDatabase().
class SidecarIndex : public ItemValueSource, public ResourceValueStore {
public:
  explicit SidecarIndex(const std::string& dbPath);
  ~SidecarIndex() override;

  SidecarIndex(const SidecarIndex&) = delete;
  SidecarIndex& operator=(const SidecarIndex&) = delete;

  std::optional<nlohmann::json> copyItemValue(const std::string& path,
                                              const std::string& key) override;

  std::optional<nlohmann::json> getResourceValue(const std::string& path,
                                                 const std::string& key) override;
  void setResourceValue(const std::string& path,
                        const std::string& key,
                        const nlohmann::json& value) override;

  // Importer side of the item store; not reachable through the item adapter.
  void putItemValue(const std::string& path, const std::string& key,
                    const nlohmann::json& value);

private:
  std::optional<nlohmann::json> select(const char* table, const std::string& path,
                                       const std::string& key);
  void upsert(const char* table, const std::string& path, const std::string& key,
              const nlohmann::json& value);
  void erase(const char* table, const std::string& path, const std::string& key);

  void* db_; // sqlite3*
};

} // namespace filemeta
