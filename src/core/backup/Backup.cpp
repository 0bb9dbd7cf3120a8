#include "Backup.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"
#include "core/util/Base64.hpp"
#include "core/value/Coercion.hpp"

using nlohmann::json;

namespace filemeta {

// ---------- BackupRecord ----------

json BackupRecord::toJson() const {
  json j = values;
  j["_version"] = version;
  j["_filename"] = fileName;
  j["_filepath"] = filePath;
  return j;
}

BackupRecord BackupRecord::fromJson(const json& j) {
  if (!j.is_object() || !j.contains("_filename") || !j["_filename"].is_string()) {
    throw TypeMismatch("backup record without _filename: " + j.dump());
  }
  BackupRecord r;
  r.fileName = j["_filename"].get<std::string>();
  if (j.contains("_filepath") && j["_filepath"].is_string()) r.filePath = j["_filepath"].get<std::string>();
  if (j.contains("_version") && j["_version"].is_string()) r.version = j["_version"].get<std::string>();
  for (auto it = j.begin(); it != j.end(); ++it) {
    if (!it.key().empty() && it.key()[0] == '_') continue;
    r.values[it.key()] = it.value();
  }
  return r;
}

// ---------- snapshot / restore ----------

BackupRecord snapshot(MetadataObject& md, bool all) {
  json dict = md.asDict(all);
  BackupRecord r = BackupRecord::fromJson(dict);
  spdlog::debug("snapshot of {}: {} attributes", md.path(), r.values.size());
  return r;
}

RestoreReport restore(MetadataObject& md, const BackupRecord& record,
                      const AttributeRegistry& registry, bool all) {
  RestoreReport report;

  for (auto it = record.values.begin(); it != record.values.end(); ++it) {
    if (registry.find(it.key())) continue;
    if (!all) {
      spdlog::warn("Unable to restore attribute {} for {}: unknown attribute", it.key(), md.path());
      report.failed.emplace_back(it.key(), "unknown attribute");
      continue;
    }
    try {
      std::optional<Bytes> raw;
      if (it->is_string()) raw = decodeBase64(it->get<std::string>());
      if (!raw) throw TypeMismatch("not base64 text: " + it->dump());
      md.writeRawAttribute(it.key(), *raw);
      report.restored.push_back(it.key());
    } catch (const std::exception& e) {
      spdlog::warn("Unable to restore extended attribute {} for {}: {}", it.key(), md.path(), e.what());
      report.failed.emplace_back(it.key(), e.what());
    }
  }

  // registry order: tags before findercolor, so an explicit color wins over
  // the tag projection just as it did when the backup was taken
  for (const auto& d : registry.all()) {
    auto it = record.values.find(d.canonicalName);
    if (it == record.values.end()) continue;
    if (!d.isWritable()) {
      spdlog::debug("skipping read-only attribute {} for {}", d.canonicalName, md.path());
      continue;
    }
    try {
      md.set(d.canonicalName, fromJson(*it, d.kind));
      report.restored.push_back(d.canonicalName);
    } catch (const std::exception& e) {
      spdlog::warn("Unable to restore attribute {} for {}: {}", d.canonicalName, md.path(), e.what());
      report.failed.emplace_back(d.canonicalName, e.what());
    }
  }
  return report;
}

// ---------- BackupFile ----------

void BackupFile::load() {
  records_.clear();
  byName_.clear();
  if (!std::filesystem::exists(path_)) return;

  std::ifstream in(path_);
  if (!in) throw StorageError("Cannot open backup file: " + path_);
  std::ostringstream buf; buf << in.rdbuf();
  const std::string text = buf.str();

  auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return;

  std::vector<json> items;
  try {
    if (text[first] == '[') {
      json arr = json::parse(text);
      for (auto& e : arr) items.push_back(std::move(e));
    } else if (text[first] == '{') {
      std::istringstream lines(text);
      std::string line;
      while (std::getline(lines, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        items.push_back(json::parse(line));
      }
    } else {
      throw StorageError("Unknown backup file type: " + path_);
    }
  } catch (const json::parse_error& e) {
    throw StorageError("Malformed backup file " + path_ + ": " + e.what());
  }

  for (const auto& j : items) {
    BackupRecord r = BackupRecord::fromJson(j);
    if (byName_.count(r.fileName)) {
      spdlog::warn("duplicate filename {} found in {}", r.fileName, path_);
    }
    put(std::move(r));
  }
}

void BackupFile::save() const {
  std::ofstream out(path_, std::ios::trunc);
  if (!out) throw StorageError("Cannot write backup file: " + path_);
  for (const auto& r : records_) out << r.toJson().dump() << "\n";
  out.flush();
  if (!out) throw StorageError("Write failed for backup file: " + path_);
}

const BackupRecord* BackupFile::find(const std::string& fileName) const {
  auto it = byName_.find(fileName);
  return it == byName_.end() ? nullptr : &records_[it->second];
}

void BackupFile::put(BackupRecord record) {
  auto it = byName_.find(record.fileName);
  if (it != byName_.end()) {
    records_[it->second] = std::move(record);
    return;
  }
  byName_[record.fileName] = records_.size();
  records_.push_back(std::move(record));
}

} // namespace filemeta
