#pragma once
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/metadata/MetadataObject.hpp"

namespace filemeta {

// One file's attributes as serialized by MetadataObject::asDict().
struct BackupRecord {
  std::string fileName;
  std::string filePath;
  std::string version;
  nlohmann::json values = nlohmann::json::object();  // canonical name -> value

  // Flat object: _version, _filename, _filepath plus one key per attribute.
  nlohmann::json toJson() const;
  // Throws TypeMismatch when _filename is missing.
  static BackupRecord fromJson(const nlohmann::json& j);
};

struct RestoreReport {
  std::vector<std::string> restored;
  std::vector<std::pair<std::string, std::string>> failed;  // attribute, reason
};

// With all=true the record also carries unregistered extended attributes as
// base64 text under their raw key.
BackupRecord snapshot(MetadataObject& md, bool all = false);

// Sets every writable attribute present in the record, in registry order.
// Attributes absent from the record are left alone; failures are logged and
// reported, not thrown. Unknown keys are reported as failed unless all=true,
// in which case they are base64 decoded and written back as raw extended
// attributes.
RestoreReport restore(MetadataObject& md, const BackupRecord& record,
                      const AttributeRegistry& registry = AttributeRegistry::instance(),
                      bool all = false);

// Newline-delimited JSON backup file, one record per file name. Records are
// only ever added or replaced, never pruned.
class BackupFile {
public:
  explicit BackupFile(std::string path) : path_(std::move(path)) {}

  // Reads the file if it exists. Accepts one JSON object per line or an older
  // single JSON array of objects.
  void load();
  void save() const;

  const BackupRecord* find(const std::string& fileName) const;
  void put(BackupRecord record);

  const std::vector<BackupRecord>& records() const { return records_; }
  const std::string& path() const { return path_; }

private:
  std::string path_;
  std::vector<BackupRecord> records_;
  std::unordered_map<std::string, size_t> byName_;
};

} // namespace filemeta
