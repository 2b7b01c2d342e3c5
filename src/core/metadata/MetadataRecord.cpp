#include "MetadataRecord.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

namespace syncmeta {

// -------- helpers --------

static std::string requireId(std::string id) {
  if (id.empty()) throw std::invalid_argument("MetadataRecord: id must not be empty");
  return id;
}

static std::string requireId(const char* id) {
  if (!id) throw std::invalid_argument("MetadataRecord: id must not be null");
  return requireId(std::string(id));
}

template <typename T>
static void writeOpt(std::ostream& os, const std::optional<T>& v) {
  if (v) os << *v;
  else   os << "null";
}

static void writeOpt(std::ostream& os, const std::optional<bool>& v) {
  if (v) os << (*v ? "true" : "false");
  else   os << "null";
}

// Java-style 31 * h + x accumulation; absent fields contribute 0.
template <typename T>
static size_t mix(size_t h, const std::optional<T>& v) {
  return 31 * h + (v ? std::hash<T>{}(*v) : 0);
}

// -------- MetadataRecord --------

MetadataRecord::MetadataRecord(std::string id,
                               std::optional<bool> deleted,
                               std::optional<int> version,
                               std::optional<Timestamp> lastChangedAt,
                               std::optional<std::string> typeName)
  : id_(requireId(std::move(id))),
    deleted_(deleted),
    version_(version),
    lastChangedAt_(lastChangedAt),
    typeName_(std::move(typeName)) {}

MetadataRecord::MetadataRecord(const char* id,
                               std::optional<bool> deleted,
                               std::optional<int> version,
                               std::optional<Timestamp> lastChangedAt,
                               std::optional<std::string> typeName)
  : MetadataRecord(requireId(id), deleted, version, lastChangedAt, std::move(typeName)) {}

MetadataRecord MetadataRecord::withDeleted(std::optional<bool> deleted) const {
  return MetadataRecord(id_, deleted, version_, lastChangedAt_, typeName_);
}

MetadataRecord MetadataRecord::withVersion(std::optional<int> version) const {
  return MetadataRecord(id_, deleted_, version, lastChangedAt_, typeName_);
}

MetadataRecord MetadataRecord::withLastChangedAt(std::optional<Timestamp> lastChangedAt) const {
  return MetadataRecord(id_, deleted_, version_, lastChangedAt, typeName_);
}

MetadataRecord MetadataRecord::withTypeName(std::optional<std::string> typeName) const {
  return MetadataRecord(id_, deleted_, version_, lastChangedAt_, std::move(typeName));
}

bool MetadataRecord::operator==(const MetadataRecord& o) const {
  return id_ == o.id_ &&
         deleted_ == o.deleted_ &&
         version_ == o.version_ &&
         lastChangedAt_ == o.lastChangedAt_;
}

size_t MetadataRecord::hash() const {
  size_t h = std::hash<std::string>{}(id_);
  h = mix(h, deleted_);
  h = mix(h, version_);
  h = mix(h, lastChangedAt_);
  return h;
}

std::string MetadataRecord::toString() const {
  std::ostringstream oss;
  oss << "MetadataRecord{id='" << id_ << "'";
  oss << ", deleted=";       writeOpt(oss, deleted_);
  oss << ", version=";       writeOpt(oss, version_);
  oss << ", lastChangedAt="; writeOpt(oss, lastChangedAt_);
  oss << ", typeName=";      writeOpt(oss, typeName_);
  oss << "}";
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const MetadataRecord& r) {
  return os << r.toString();
}

} // namespace syncmeta
