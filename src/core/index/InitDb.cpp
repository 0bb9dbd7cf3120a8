// src/core/index/InitDb.cpp
#include "InitDb.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>

#include <spdlog/spdlog.h>

#include "core/errors/Errors.hpp"

namespace filemeta {

namespace {

struct DbCloser {
    void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void execAll(sqlite3* db, const std::string& sql, const char* what) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw StorageError(std::string(what) + " failed: " + msg);
    }
}

int userVersion(sqlite3* db) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "PRAGMA user_version;", -1, &st, nullptr) != SQLITE_OK) {
        throw StorageError("cannot read index version: " + std::string(sqlite3_errmsg(db)));
    }
    int version = 0;
    if (sqlite3_step(st) == SQLITE_ROW) version = sqlite3_column_int(st, 0);
    sqlite3_finalize(st);
    return version;
}

std::string readSchema(const std::string& schemaPath) {
    std::ifstream in(schemaPath);
    if (!in) throw StorageError("Cannot open schema file: " + schemaPath);
    std::ostringstream buf; buf << in.rdbuf();
    return buf.str();
}

} // namespace

int initDatabase(const std::string& dbPath, const std::string& schemaPath) {
    auto parent = std::filesystem::path(dbPath).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);

    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    DbHandle db(raw);
    if (rc != SQLITE_OK) {
        throw StorageError("Failed to open index DB " + dbPath + ": " +
                           (raw ? sqlite3_errmsg(raw) : "out of memory"));
    }

    const int found = userVersion(db.get());
    if (found > kIndexSchemaVersion) {
        throw StorageError("index " + dbPath + " has layout " + std::to_string(found) +
                           ", this build understands up to " +
                           std::to_string(kIndexSchemaVersion));
    }

    execAll(db.get(), "PRAGMA journal_mode=WAL;", "journal_mode");
    execAll(db.get(), "PRAGMA synchronous=NORMAL;", "synchronous");
    execAll(db.get(), "PRAGMA busy_timeout=5000;", "busy_timeout");

    // CREATE ... IF NOT EXISTS, safe to re-run
    execAll(db.get(), readSchema(schemaPath), "schema");
    execAll(db.get(), "PRAGMA user_version=" + std::to_string(kIndexSchemaVersion) + ";",
            "user_version");

    if (found != kIndexSchemaVersion) {
        spdlog::info("index {} initialized (layout {} -> {})", dbPath, found, kIndexSchemaVersion);
    }
    return kIndexSchemaVersion;
}

} // namespace filemeta
