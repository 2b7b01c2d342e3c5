#pragma once
#include <optional>
#include <string>
#include <vector>

#include "MetadataRecord.hpp"

namespace syncmeta {

// SQLite-backed home for metadata records, keyed by entity id. Lives in its
// own table next to (not inside) the entity tables. Expects a database
// prepared by initDatabase().
class MetadataStore {
public:
  explicit MetadataStore(const std::string& dbPath);
  ~MetadataStore();

  MetadataStore(const MetadataStore&) = delete;
  MetadataStore& operator=(const MetadataStore&) = delete;
  MetadataStore(MetadataStore&& o) noexcept;
  MetadataStore& operator=(MetadataStore&& o) noexcept;

  // Insert, or replace the record already stored under the same id.
  void save(const MetadataRecord& r);
  std::optional<MetadataRecord> find(const std::string& id) const;
  // Returns false when nothing was stored under id.
  bool remove(const std::string& id);
  std::vector<MetadataRecord> list() const;
  std::vector<MetadataRecord> listByType(const std::string& typeName) const;

private:
  void* db_; // sqlite3*
};

} // namespace syncmeta
