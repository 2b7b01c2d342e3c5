#include "MetadataJson.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>

using nlohmann::json;

namespace {

[[noreturn]] void badField(const char* k, const char* expected) {
  throw std::invalid_argument(std::string("metadata.") + k + " must be " + expected);
}

bool absent(const json& j, const char* k) {
  return !j.contains(k) || j[k].is_null();
}

std::optional<bool> get_bool(const json& j, const char* k) {
  if (absent(j, k)) return std::nullopt;
  if (!j[k].is_boolean()) badField(k, "a boolean or null");
  return j[k].get<bool>();
}

std::optional<int64_t> get_i64(const json& j, const char* k) {
  if (absent(j, k)) return std::nullopt;
  if (!j[k].is_number_integer()) badField(k, "an integer or null");
  // values past INT64_MAX parse as unsigned and would wrap
  if (j[k].is_number_unsigned() &&
      j[k].get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
    badField(k, "a 64-bit signed integer or null");
  return j[k].get<int64_t>();
}

std::optional<std::string> get_s(const json& j, const char* k) {
  if (absent(j, k)) return std::nullopt;
  if (!j[k].is_string()) badField(k, "a string or null");
  return j[k].get<std::string>();
}

template <typename T, typename F>
json or_null(const std::optional<T>& v, F&& f) {
  return v ? json(f(*v)) : json(nullptr);
}

} // namespace

namespace nlohmann {

void adl_serializer<syncmeta::MetadataRecord>::to_json(json& j, const syncmeta::MetadataRecord& r) {
  namespace f = syncmeta::fields;
  auto same = [](const auto& v) { return v; };
  j = json::object();
  j[f::kId]            = r.identifier();
  j[f::kDeleted]       = or_null(r.isDeleted(), same);
  j[f::kVersion]       = or_null(r.version(), same);
  j[f::kLastChangedAt] = or_null(r.lastChangedAt(),
                                 [](const syncmeta::Timestamp& t) { return t.secondsSinceEpoch(); });
  j[f::kTypeName]      = or_null(r.typeName(), same);
}

syncmeta::MetadataRecord adl_serializer<syncmeta::MetadataRecord>::from_json(const json& j) {
  namespace f = syncmeta::fields;
  if (!j.is_object()) throw std::invalid_argument("metadata must be a JSON object");

  auto id = get_s(j, f::kId);
  if (!id || id->empty()) throw std::invalid_argument("metadata.id required");

  std::optional<int> version;
  if (auto v = get_i64(j, f::kVersion)) {
    if (*v < std::numeric_limits<int>::min() || *v > std::numeric_limits<int>::max())
      badField(f::kVersion, "a 32-bit integer or null");
    version = static_cast<int>(*v);
  }

  std::optional<syncmeta::Timestamp> lastChangedAt;
  if (auto s = get_i64(j, f::kLastChangedAt)) lastChangedAt = syncmeta::Timestamp(*s);

  return syncmeta::MetadataRecord(*id, get_bool(j, f::kDeleted), version, lastChangedAt,
                                  get_s(j, f::kTypeName));
}

} // namespace nlohmann

namespace syncmeta {

std::string toJson(const MetadataRecord& r) {
  return json(r).dump();
}

MetadataRecord fromJson(const std::string& text) {
  json j;
  try { j = json::parse(text); }
  catch (const json::parse_error& e) {
    throw std::invalid_argument(std::string("invalid JSON in metadata: ") + e.what());
  }
  return j.get<MetadataRecord>();
}

} // namespace syncmeta
