#include "InitDb.hpp"
#include <sqlite3.h>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>

namespace syncmeta {

namespace {

struct DbCloser {
  void operator()(sqlite3* db) const { sqlite3_close(db); }
};
using DbHandle = std::unique_ptr<sqlite3, DbCloser>;

void exec(sqlite3* db, const std::string& sql, const char* what) {
  char* err = nullptr;
  if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : sqlite3_errmsg(db);
    sqlite3_free(err);
    throw std::runtime_error(std::string(what) + " failed: " + msg);
  }
}

// First column of the first row, as an integer.
int64_t queryInt(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error(std::string("query failed: ") + err);
  }
  const int rc = sqlite3_step(st);
  const int64_t v = rc == SQLITE_ROW ? sqlite3_column_int64(st, 0) : 0;
  sqlite3_finalize(st);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE)
    throw std::runtime_error(std::string("query failed: ") + sqlite3_errmsg(db));
  return v;
}

std::string readSchema(const std::string& schemaPath) {
  std::ifstream in(schemaPath);
  if (!in) throw std::runtime_error("Cannot open schema file: " + schemaPath);
  std::ostringstream buf;
  buf << in.rdbuf();
  return buf.str();
}

DbHandle openOrCreate(const std::string& dbPath) {
  sqlite3* raw = nullptr;
  const int rc = sqlite3_open_v2(dbPath.c_str(), &raw,
                                 SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
  DbHandle db(raw);
  if (rc != SQLITE_OK)
    throw std::runtime_error("Failed to open DB " + dbPath + ": " +
                             (raw ? sqlite3_errmsg(raw) : "out of memory"));
  sqlite3_busy_timeout(raw, 5000);
  return db;
}

} // namespace

bool initDatabase(const std::string& dbPath, const std::string& schemaPath) {
  const auto parent = std::filesystem::path(dbPath).parent_path();
  if (!parent.empty()) std::filesystem::create_directories(parent);

  DbHandle db = openOrCreate(dbPath);

  const int64_t current = queryInt(db.get(), "PRAGMA user_version;");
  if (current > kSchemaVersion) {
    throw std::runtime_error("database " + dbPath + " has schema version " +
                             std::to_string(current) + ", newer than supported " +
                             std::to_string(kSchemaVersion));
  }
  if (current == kSchemaVersion) {
    spdlog::debug("{} already at schema version {}", dbPath, current);
    return false;
  }

  const std::string schema = readSchema(schemaPath);
  exec(db.get(), "PRAGMA journal_mode=WAL;", "journal_mode");

  exec(db.get(), "BEGIN IMMEDIATE;", "begin");
  try {
    exec(db.get(), schema, "apply schema");
    const int64_t tables = queryInt(db.get(),
        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table' AND name = 'model_metadata';");
    if (tables != 1)
      throw std::runtime_error("schema " + schemaPath + " does not define model_metadata");
    exec(db.get(), "PRAGMA user_version=" + std::to_string(kSchemaVersion) + ";", "user_version");
    exec(db.get(), "COMMIT;", "commit");
  } catch (const std::exception& e) {
    if (sqlite3_exec(db.get(), "ROLLBACK;", nullptr, nullptr, nullptr) != SQLITE_OK)
      spdlog::warn("rollback of {} failed: {}", dbPath, sqlite3_errmsg(db.get()));
    spdlog::error("schema upgrade of {} rolled back: {}", dbPath, e.what());
    throw;
  }

  spdlog::info("{} upgraded from schema version {} to {}", dbPath, current, kSchemaVersion);
  return true;
}

} // namespace syncmeta
