#include "Cli.hpp"

#include <cstdlib>
#include <filesystem>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "core/metadata/InitDb.hpp"
#include "core/metadata/MetadataJson.hpp"
#include "core/metadata/MetadataStore.hpp"

namespace syncmeta {

// ---------- helpers ----------

static std::string get_env_or(const char* key, const std::string& defval) {
#ifdef _WIN32
  size_t len = 0;
  char* buf = nullptr;
  if (_dupenv_s(&buf, &len, key) == 0 && buf) {
    std::string v(buf);
    free(buf);
    return v;
  }
  return defval;
#else
  if (const char* v = std::getenv(key)) return std::string(v);
  return defval;
#endif
}

static std::string dbPath() {
  return get_env_or("SYNCMETA_DB_PATH", "data/sync-metadata.db");
}

// Applies the schema if the database is behind, then opens it.
static MetadataStore openStore() {
  const std::string path = dbPath();
  initDatabase(path, findSchemaPath());
  return MetadataStore(path);
}

static void print_usage(std::ostream& out, const std::string& argv0) {
  out << "Usage:\n"
      << "  " << argv0 << " --init               # create/upgrade SQLite schema\n"
      << "  " << argv0 << " --put '<json>'       # save a metadata record\n"
      << "  " << argv0 << " --get <id>           # print a record as JSON\n"
      << "  " << argv0 << " --delete <id>        # remove a record\n"
      << "  " << argv0 << " --list [typename]    # list records, optionally by type\n";
}

// ---------- public ----------

spdlog::level::level_enum logLevelFromEnv() {
  const std::string name = get_env_or("SYNCMETA_LOG_LEVEL", "info");
  const auto level = spdlog::level::from_str(name);
  // from_str maps unknown names to off
  if (level == spdlog::level::off && name != "off") {
    spdlog::warn("unknown SYNCMETA_LOG_LEVEL '{}', using info", name);
    return spdlog::level::info;
  }
  return level;
}

std::string findSchemaPath() {
  namespace fs = std::filesystem;
  const std::string fromEnv = get_env_or("SYNCMETA_SCHEMA_PATH", "");
  if (!fromEnv.empty()) return fromEnv;
  const fs::path candidates[] = {
    fs::current_path() / "schema.sql",
    fs::path("src/core/metadata/schema.sql")
  };
  for (const auto& p : candidates) {
    if (fs::exists(p)) return p.string();
  }
  throw std::runtime_error("schema.sql not found (set SYNCMETA_SCHEMA_PATH, or run from build/)");
}

int runCli(const std::vector<std::string>& args, std::ostream& out) {
  const std::string argv0 = args.empty() ? "syncmeta" : args[0];
  const size_t argc = args.size();
  try {
    const std::string cmd = argc > 1 ? args[1] : "";

    if (cmd == "--init" && argc == 2) {
      const std::string path = dbPath();
      if (initDatabase(path, findSchemaPath()))
        spdlog::info("DB initialized at: {}", path);
      else
        spdlog::info("DB at {} already current", path);
      return 0;
    }

    if (cmd == "--put" && argc == 3) {
      const auto rec = fromJson(args[2]);
      openStore().save(rec);
      spdlog::info("saved {}", rec.toString());
      return 0;
    }

    if (cmd == "--get" && argc == 3) {
      const auto rec = openStore().find(args[2]);
      if (!rec) {
        spdlog::warn("no metadata for id '{}'", args[2]);
        return 1;
      }
      out << toJson(*rec) << "\n";
      return 0;
    }

    if (cmd == "--delete" && argc == 3) {
      if (!openStore().remove(args[2])) {
        spdlog::warn("no metadata for id '{}'", args[2]);
        return 1;
      }
      return 0;
    }

    if (cmd == "--list" && (argc == 2 || argc == 3)) {
      auto store = openStore();
      const auto recs = argc == 3 ? store.listByType(args[2]) : store.list();
      for (const auto& r : recs) out << r << "\n";
      return 0;
    }

    print_usage(out, argv0);
    return 1;
  } catch (const std::exception& e) {
    spdlog::error("Fatal: {}", e.what());
    return 2;
  }
}

} // namespace syncmeta
