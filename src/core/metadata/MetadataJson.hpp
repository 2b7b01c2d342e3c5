#pragma once
#include <string>
#include <nlohmann/json.hpp>

#include "MetadataRecord.hpp"

namespace syncmeta {

// Field names as they appear in AppSync responses.
namespace fields {
  inline constexpr const char* kId            = "id";
  inline constexpr const char* kDeleted       = "_deleted";
  inline constexpr const char* kVersion       = "_version";
  inline constexpr const char* kLastChangedAt = "_lastChangedAt";
  inline constexpr const char* kTypeName      = "__typename";
}

// Always writes all five keys; absent fields become null.
std::string toJson(const MetadataRecord& r);

// Missing keys and null values decode to absent. Throws std::invalid_argument
// on malformed JSON, a missing/empty id, or a field of the wrong JSON type.
MetadataRecord fromJson(const std::string& text);

} // namespace syncmeta

namespace nlohmann {
template <>
struct adl_serializer<syncmeta::MetadataRecord> {
  static void to_json(json& j, const syncmeta::MetadataRecord& r);
  static syncmeta::MetadataRecord from_json(const json& j);
};
} // namespace nlohmann
