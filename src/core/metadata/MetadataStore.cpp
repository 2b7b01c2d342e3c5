#include "MetadataStore.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <sqlite3.h>
#include <spdlog/spdlog.h>

namespace syncmeta {

// -------- helpers --------

static constexpr int kBusyTimeoutMs = 5000;

static sqlite3* handle(void* db) { return static_cast<sqlite3*>(db); }

static sqlite3_stmt* prepare(sqlite3* db, const char* sql, const char* what) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error(std::string(what) + " prepare failed: " + err);
  }
  return st;
}

static void bindOptText(sqlite3_stmt* st, int i, const std::optional<std::string>& v) {
  if (v) sqlite3_bind_text(st, i, v->c_str(), -1, SQLITE_TRANSIENT);
  else   sqlite3_bind_null(st, i);
}

static void bindOptInt64(sqlite3_stmt* st, int i, const std::optional<int64_t>& v) {
  if (v) sqlite3_bind_int64(st, i, *v);
  else   sqlite3_bind_null(st, i);
}

static std::optional<std::string> columnOptText(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st, i)));
}

static std::optional<int64_t> columnOptInt64(sqlite3_stmt* st, int i) {
  if (sqlite3_column_type(st, i) == SQLITE_NULL) return std::nullopt;
  return sqlite3_column_int64(st, i);
}

// Column order matches the SELECT lists below.
static MetadataRecord readRow(sqlite3_stmt* st) {
  std::string id = reinterpret_cast<const char*>(sqlite3_column_text(st, 0));
  std::optional<bool> deleted;
  if (auto v = columnOptInt64(st, 1)) deleted = (*v != 0);
  std::optional<int> version;
  if (auto v = columnOptInt64(st, 2)) {
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
      throw std::runtime_error("model_metadata.version out of range for id '" + id + "': " +
                               std::to_string(*v));
    version = static_cast<int>(*v);
  }
  std::optional<Timestamp> lastChangedAt;
  if (auto v = columnOptInt64(st, 3)) lastChangedAt = Timestamp(*v);
  return MetadataRecord(std::move(id), deleted, version, lastChangedAt, columnOptText(st, 4));
}

static std::vector<MetadataRecord> readAll(sqlite3* db, sqlite3_stmt* st, const char* what) {
  std::vector<MetadataRecord> out;
  int rc = SQLITE_OK;
  try {
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) out.push_back(readRow(st));
  } catch (...) {
    sqlite3_finalize(st);
    throw;
  }
  if (rc != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error(std::string(what) + " failed: " + err);
  }
  sqlite3_finalize(st);
  return out;
}

// -------- MetadataStore --------

MetadataStore::MetadataStore(const std::string& dbPath) : db_(nullptr) {
  sqlite3* db = nullptr;
  if (sqlite3_open_v2(dbPath.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    std::string err = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw std::runtime_error("failed to open db " + dbPath + ": " + err);
  }
  // waits out a concurrent WAL writer instead of failing with SQLITE_BUSY
  sqlite3_busy_timeout(db, kBusyTimeoutMs);
  db_ = db;
}

MetadataStore::~MetadataStore() {
  if (db_) sqlite3_close(handle(db_));
}

MetadataStore::MetadataStore(MetadataStore&& o) noexcept : db_(std::exchange(o.db_, nullptr)) {}

MetadataStore& MetadataStore::operator=(MetadataStore&& o) noexcept {
  if (this != &o) {
    if (db_) sqlite3_close(handle(db_));
    db_ = std::exchange(o.db_, nullptr);
  }
  return *this;
}

void MetadataStore::save(const MetadataRecord& r) {
  auto* db = handle(db_);
  const char* sql = R"SQL(
    INSERT OR REPLACE INTO model_metadata
      (id, deleted, version, last_changed_at, type_name)
    VALUES (?,?,?,?,?)
  )SQL";
  sqlite3_stmt* st = prepare(db, sql, "save");

  std::optional<int64_t> deleted, version, lastChangedAt;
  if (r.isDeleted())     deleted = *r.isDeleted() ? 1 : 0;
  if (r.version())       version = *r.version();
  if (r.lastChangedAt()) lastChangedAt = r.lastChangedAt()->secondsSinceEpoch();

  sqlite3_bind_text(st, 1, r.identifier().c_str(), -1, SQLITE_TRANSIENT);
  bindOptInt64(st, 2, deleted);
  bindOptInt64(st, 3, version);
  bindOptInt64(st, 4, lastChangedAt);
  bindOptText(st, 5, r.typeName());

  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("save failed: " + err);
  }
  sqlite3_finalize(st);
  spdlog::debug("saved {}", r.toString());
}

std::optional<MetadataRecord> MetadataStore::find(const std::string& id) const {
  auto* db = handle(db_);
  const char* sql = R"SQL(
    SELECT id, deleted, version, last_changed_at, type_name
    FROM model_metadata WHERE id = ?
  )SQL";
  sqlite3_stmt* st = prepare(db, sql, "find");
  sqlite3_bind_text(st, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  auto rows = readAll(db, st, "find");
  if (rows.empty()) return std::nullopt;
  return rows.front();
}

bool MetadataStore::remove(const std::string& id) {
  auto* db = handle(db_);
  sqlite3_stmt* st = prepare(db, "DELETE FROM model_metadata WHERE id = ?", "remove");
  sqlite3_bind_text(st, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  if (sqlite3_step(st) != SQLITE_DONE) {
    std::string err = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("remove failed: " + err);
  }
  sqlite3_finalize(st);
  const bool removed = sqlite3_changes(db) > 0;
  spdlog::debug("remove {}: {}", id, removed ? "removed" : "not found");
  return removed;
}

std::vector<MetadataRecord> MetadataStore::list() const {
  auto* db = handle(db_);
  const char* sql = R"SQL(
    SELECT id, deleted, version, last_changed_at, type_name
    FROM model_metadata ORDER BY id
  )SQL";
  return readAll(db, prepare(db, sql, "list"), "list");
}

std::vector<MetadataRecord> MetadataStore::listByType(const std::string& typeName) const {
  auto* db = handle(db_);
  const char* sql = R"SQL(
    SELECT id, deleted, version, last_changed_at, type_name
    FROM model_metadata WHERE type_name = ? ORDER BY id
  )SQL";
  sqlite3_stmt* st = prepare(db, sql, "listByType");
  sqlite3_bind_text(st, 1, typeName.c_str(), -1, SQLITE_TRANSIENT);
  return readAll(db, st, "listByType");
}

} // namespace syncmeta
