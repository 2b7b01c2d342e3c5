#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

#include "Timestamp.hpp"

namespace syncmeta {

// Business models are owned by the application; system models are
// bookkeeping the sync client keeps for itself.
enum class ModelKind { User, System };

// Replication bookkeeping for one locally stored entity. The metadata shares
// the identifier of the entity it describes.
//
// Immutable: the with*() helpers return a new record. Every optional field is
// three-state; an absent value means "unknown" and is never the same thing as
// false or zero.
//
// Equality and hashing cover id, deleted, version and lastChangedAt only.
// typeName shows up in toString() but two records that differ only in
// typeName compare equal.
class MetadataRecord {
public:
  // Throws std::invalid_argument when id is empty.
  explicit MetadataRecord(std::string id,
                          std::optional<bool> deleted = std::nullopt,
                          std::optional<int> version = std::nullopt,
                          std::optional<Timestamp> lastChangedAt = std::nullopt,
                          std::optional<std::string> typeName = std::nullopt);

  // Throws std::invalid_argument when id is null or empty.
  explicit MetadataRecord(const char* id,
                          std::optional<bool> deleted = std::nullopt,
                          std::optional<int> version = std::nullopt,
                          std::optional<Timestamp> lastChangedAt = std::nullopt,
                          std::optional<std::string> typeName = std::nullopt);

  const std::string& identifier() const { return id_; }
  const std::string& resolveIdentifier() const { return id_; }
  ModelKind modelKind() const { return ModelKind::System; }

  // true = tombstoned.
  const std::optional<bool>& isDeleted() const { return deleted_; }
  // Last server-confirmed revision; absent until the entity has synced.
  const std::optional<int>& version() const { return version_; }
  // When the remote write was accepted.
  const std::optional<Timestamp>& lastChangedAt() const { return lastChangedAt_; }
  // Concrete entity type, for decoding heterogeneous collections.
  const std::optional<std::string>& typeName() const { return typeName_; }

  MetadataRecord withDeleted(std::optional<bool> deleted) const;
  MetadataRecord withVersion(std::optional<int> version) const;
  MetadataRecord withLastChangedAt(std::optional<Timestamp> lastChangedAt) const;
  MetadataRecord withTypeName(std::optional<std::string> typeName) const;

  bool operator==(const MetadataRecord& o) const;
  bool operator!=(const MetadataRecord& o) const { return !(*this == o); }

  size_t hash() const;
  std::string toString() const;

private:
  std::string id_;
  std::optional<bool> deleted_;
  std::optional<int> version_;
  std::optional<Timestamp> lastChangedAt_;
  std::optional<std::string> typeName_;
};

std::ostream& operator<<(std::ostream& os, const MetadataRecord& r);

} // namespace syncmeta

namespace std {
template <>
struct hash<syncmeta::MetadataRecord> {
  size_t operator()(const syncmeta::MetadataRecord& r) const noexcept { return r.hash(); }
};
} // namespace std
