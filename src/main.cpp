// src/main.cpp
#include <cstdlib>
#include <string>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "core/backup/Backup.hpp"
#include "core/config/Config.hpp"
#include "core/index/InitDb.hpp"
#include "core/index/SidecarIndex.hpp"
#include "core/metadata/MetadataObject.hpp"
#include "core/registry/AttributeRegistry.hpp"
#include "core/storage/LinuxXattr.hpp"
#include "core/storage/OsascriptRunner.hpp"

using namespace filemeta;

// ---------- helpers ----------

static void print_usage(const char* argv0) {
  std::cout << "Usage:\n"
            << "  " << argv0 << " --init                   # create/upgrade the sidecar index\n"
            << "  " << argv0 << " --attributes             # list known attributes\n"
            << "  " << argv0 << " --dump FILE              # print FILE's metadata as JSON\n"
            << "  " << argv0 << " --backup FILE BACKUP     # add FILE's metadata to BACKUP\n"
            << "  " << argv0 << " --restore FILE BACKUP    # restore FILE's metadata from BACKUP\n"
            << "\n"
            << "  --all after --dump, --backup or --restore also covers extended\n"
            << "  attributes no known attribute owns (stored base64 encoded).\n";
}

static Collaborators open_collaborators(const Config& cfg) {
  // Self-heal the index on startup (idempotent)
  initDatabase(cfg.indexDbPath, findSchemaPath(cfg));
  auto index = std::make_shared<SidecarIndex>(cfg.indexDbPath);

  Collaborators c;
  c.xattr     = std::make_shared<LinuxXattr>(cfg.xattrPrefix);
  c.items     = index;
  c.resources = index;
  c.scripts   = std::make_shared<OsascriptRunner>(cfg.osascriptPath);
  return c;
}

static std::string absolute_path(const std::string& file) {
  namespace fs = std::filesystem;
  if (!fs::exists(file)) throw std::runtime_error("file does not exist: " + file);
  return fs::canonical(file).string();
}

static void list_attributes() {
  for (const auto& d : AttributeRegistry::instance().all()) {
    std::cout << std::left << std::setw(22) << d.canonicalName
              << std::setw(30) << d.shortName
              << to_string(d.kind)
              << (d.isWritable() ? "" : " (read-only)") << "\n"
              << "    " << d.help << "\n";
  }
}

// ---------- main ----------

int main(int argc, char** argv) {
  try {
    const Config cfg = loadConfigFromEnv();
    applyLogLevel(cfg);
    // --all may appear anywhere after the command
    std::vector<std::string> args;
    bool all = false;
    for (int i = 1; i < argc; ++i) {
      if (i > 1 && std::string(argv[i]) == "--all") { all = true; continue; }
      args.emplace_back(argv[i]);
    }
    const std::string cmd = args.empty() ? "" : args[0];
    const size_t nargs = args.size();

    if (cmd == "--init") {
      const int version = initDatabase(cfg.indexDbPath, findSchemaPath(cfg));
      std::cout << "Index initialized at: " << cfg.indexDbPath
                << " (layout " << version << ")\n";
      return 0;
    }

    if (cmd == "--attributes") {
      list_attributes();
      return 0;
    }

    if (cmd == "--dump" && nargs == 2) {
      MetadataObject md(absolute_path(args[1]), open_collaborators(cfg));
      md.setTzAware(cfg.tzAware);
      std::cout << md.asDict(all).dump(2) << "\n";
      return 0;
    }

    if (cmd == "--backup" && nargs == 3) {
      MetadataObject md(absolute_path(args[1]), open_collaborators(cfg));
      md.setTzAware(cfg.tzAware);
      BackupFile backup(args[2]);
      backup.load();
      backup.put(snapshot(md, all));
      backup.save();
      spdlog::info("backed up {} to {}", md.path(), backup.path());
      return 0;
    }

    if (cmd == "--restore" && nargs == 3) {
      MetadataObject md(absolute_path(args[1]), open_collaborators(cfg));
      BackupFile backup(args[2]);
      backup.load();
      const std::string name = std::filesystem::path(md.path()).filename().string();
      const BackupRecord* rec = backup.find(name);
      if (!rec) {
        std::cerr << "No backup record for " << name << " in " << backup.path() << "\n";
        return 1;
      }
      RestoreReport report = restore(md, *rec, AttributeRegistry::instance(), all);
      spdlog::info("restored {} attributes on {}", report.restored.size(), md.path());
      return report.failed.empty() ? 0 : 1;
    }

    print_usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return 2;
  }
}
