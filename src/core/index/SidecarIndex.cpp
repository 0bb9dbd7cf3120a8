#include "SidecarIndex.hpp"

#include <sqlite3.h>
#include <ctime>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

// Finalizes the statement on every exit path.
struct Stmt {
  sqlite3_stmt* st = nullptr;
  ~Stmt() { if (st) sqlite3_finalize(st); }
};

void prepare(sqlite3* db, const std::string& sql, Stmt& s) {
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &s.st, nullptr) != SQLITE_OK) {
    throw StorageError("prepare failed: " + std::string(sqlite3_errmsg(db)));
  }
}

} // namespace

SidecarIndex::SidecarIndex(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE, nullptr) != SQLITE_OK) {
    std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StorageError("failed to open index db " + dbPath + ": " + msg);
  }
  sqlite3_busy_timeout(db, 5000);
  db_ = db;
}

SidecarIndex::~SidecarIndex() {
  sqlite3_close(static_cast<sqlite3*>(db_));
}

std::optional<nlohmann::json> SidecarIndex::select(const char* table,
                                                   const std::string& path,
                                                   const std::string& key) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, std::string("SELECT value FROM ") + table + " WHERE path = ? AND key = ?", s);
  sqlite3_bind_text(s.st, 1, path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, key.c_str(), -1, SQLITE_TRANSIENT);

  int rc = sqlite3_step(s.st);
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw StorageError(std::string("select from ") + table + " failed: " + sqlite3_errmsg(db));
  }
  const auto* text = reinterpret_cast<const char*>(sqlite3_column_text(s.st, 0));
  try {
    return nlohmann::json::parse(text ? text : "null");
  } catch (const nlohmann::json::parse_error& e) {
    throw StorageError(std::string("corrupt value in ") + table + " for " + path +
                       " [" + key + "]: " + e.what());
  }
}

void SidecarIndex::upsert(const char* table, const std::string& path,
                          const std::string& key, const nlohmann::json& value) {
  auto* db = static_cast<sqlite3*>(db_);
  const std::string sql = std::string("INSERT INTO ") + table + R"SQL(
      (path, key, value, updated_at) VALUES (?,?,?,?)
    ON CONFLICT(path, key) DO UPDATE SET value = excluded.value,
                                         updated_at = excluded.updated_at
  )SQL";
  Stmt s;
  prepare(db, sql, s);
  const std::string text = value.dump();
  int i = 1;
  sqlite3_bind_text(s.st, i++, path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, i++, text.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(s.st, i++, static_cast<sqlite3_int64>(std::time(nullptr)));

  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StorageError(std::string("upsert into ") + table + " failed: " + sqlite3_errmsg(db));
  }
}

void SidecarIndex::erase(const char* table, const std::string& path, const std::string& key) {
  auto* db = static_cast<sqlite3*>(db_);
  Stmt s;
  prepare(db, std::string("DELETE FROM ") + table + " WHERE path = ? AND key = ?", s);
  sqlite3_bind_text(s.st, 1, path.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(s.st, 2, key.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(s.st) != SQLITE_DONE) {
    throw StorageError(std::string("delete from ") + table + " failed: " + sqlite3_errmsg(db));
  }
}

std::optional<nlohmann::json> SidecarIndex::copyItemValue(const std::string& path,
                                                          const std::string& key) {
  return select("item_values", path, key);
}

std::optional<nlohmann::json> SidecarIndex::getResourceValue(const std::string& path,
                                                             const std::string& key) {
  return select("resource_values", path, key);
}

void SidecarIndex::setResourceValue(const std::string& path, const std::string& key,
                                    const nlohmann::json& value) {
  if (value.is_null()) {
    erase("resource_values", path, key);
    spdlog::debug("resource remove {} [{}]", path, key);
    return;
  }
  upsert("resource_values", path, key, value);
  spdlog::debug("resource set {} [{}] = {}", path, key, value.dump());
}

void SidecarIndex::putItemValue(const std::string& path, const std::string& key,
                                const nlohmann::json& value) {
  if (value.is_null()) {
    erase("item_values", path, key);
    return;
  }
  upsert("item_values", path, key, value);
}

} // namespace filemeta
