// tests/test_metadata_record.cpp
#include "core/metadata/MetadataRecord.hpp"
#include "TestMacros.hpp"

#include <stdexcept>
#include <string>
#include <unordered_set>

using syncmeta::MetadataRecord;
using syncmeta::ModelKind;
using syncmeta::Timestamp;

static const Timestamp T(1700000000);

TEST(construct_with_only_id) {
  MetadataRecord r("id-1", std::nullopt, std::nullopt, std::nullopt, std::nullopt);
  ASSERT_EQ(r.identifier(), std::string("id-1"));
  ASSERT_EQ(r.resolveIdentifier(), std::string("id-1"));
  ASSERT_FALSE(r.isDeleted().has_value());
  ASSERT_FALSE(r.version().has_value());
  ASSERT_FALSE(r.lastChangedAt().has_value());
  ASSERT_FALSE(r.typeName().has_value());
  ASSERT_TRUE(r.modelKind() == ModelKind::System);
}

TEST(construct_with_all_fields) {
  MetadataRecord r("id-1", true, 3, T, "Post");
  ASSERT_TRUE(r.isDeleted() == true);
  ASSERT_TRUE(r.version() == 3);
  ASSERT_TRUE(r.lastChangedAt() == T);
  ASSERT_TRUE(r.typeName() == std::string("Post"));
}

TEST(known_false_differs_from_unknown) {
  MetadataRecord known("id-1", false, 0);
  MetadataRecord unknown("id-1");
  ASSERT_TRUE(known.isDeleted().has_value());
  ASSERT_FALSE(*known.isDeleted());
  ASSERT_TRUE(known.version() == 0);
  ASSERT_TRUE(known != unknown);
}

TEST(empty_or_null_id_rejected) {
  ASSERT_THROWS(MetadataRecord(""), std::invalid_argument);
  ASSERT_THROWS(MetadataRecord(std::string()), std::invalid_argument);
  ASSERT_THROWS(MetadataRecord(static_cast<const char*>(nullptr)), std::invalid_argument);
  ASSERT_THROWS(MetadataRecord(nullptr, true, 3, T, std::string("Post")), std::invalid_argument);
}

TEST(any_non_empty_id_accepted) {
  for (const char* id : {"a", " ", "id-1", "3f2c9a1e-7b0d-4c52-9d1e-0a6b5c4d3e2f", "ünïcødé"}) {
    MetadataRecord r(id);
    ASSERT_EQ(r.identifier(), std::string(id));
  }
}

TEST(malformed_values_not_validated) {
  MetadataRecord r("id-1", std::nullopt, -5, Timestamp(4102444800), std::nullopt);
  ASSERT_TRUE(r.version() == -5);
  ASSERT_EQ(r.lastChangedAt()->secondsSinceEpoch(), 4102444800);
}

TEST(equality_ignores_type_name) {
  MetadataRecord post("id-1", true, 3, T, "Post");
  MetadataRecord comment("id-1", true, 3, T, "Comment");
  MetadataRecord untyped("id-1", true, 3, T);
  ASSERT_EQ(post, comment);
  ASSERT_EQ(post, untyped);
  ASSERT_EQ(post.hash(), comment.hash());
  ASSERT_EQ(std::hash<MetadataRecord>{}(post), std::hash<MetadataRecord>{}(untyped));
}

TEST(equality_covers_other_fields) {
  MetadataRecord base("id-1", true, 3, T, "Post");
  ASSERT_TRUE(base != MetadataRecord("id-2", true, 3, T, "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", false, 3, T, "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", std::nullopt, 3, T, "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", true, 4, T, "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", true, std::nullopt, T, "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", true, 3, Timestamp(1700000001), "Post"));
  ASSERT_TRUE(base != MetadataRecord("id-1", true, 3, std::nullopt, "Post"));
}

TEST(equality_is_an_equivalence) {
  MetadataRecord a("id-1", false, 7, T, "Post");
  MetadataRecord b("id-1", false, 7, T, "Comment");
  MetadataRecord c("id-1", false, 7, T);
  ASSERT_TRUE(a == a);
  ASSERT_TRUE(a == b && b == a);
  ASSERT_TRUE(a == b && b == c && a == c);
}

TEST(equal_records_share_hash_bucket) {
  std::unordered_set<MetadataRecord> seen;
  seen.insert(MetadataRecord("id-1", true, 3, T, "Post"));
  ASSERT_TRUE(seen.count(MetadataRecord("id-1", true, 3, T, "Comment")) == 1);
  ASSERT_TRUE(seen.count(MetadataRecord("id-1", true, 4, T, "Post")) == 0);
  seen.insert(MetadataRecord("id-1", true, 3, T));
  ASSERT_EQ(seen.size(), 1u);
}

TEST(to_string_renders_all_fields) {
  MetadataRecord r("id-1", true, 3, T, "Post");
  ASSERT_EQ(r.toString(),
            std::string("MetadataRecord{id='id-1', deleted=true, version=3, "
                        "lastChangedAt=1700000000, typeName=Post}"));
  ASSERT_EQ(r.toString(), MetadataRecord("id-1", true, 3, T, "Post").toString());
}

TEST(to_string_renders_absent_as_null) {
  MetadataRecord r("id-1");
  ASSERT_EQ(r.toString(),
            std::string("MetadataRecord{id='id-1', deleted=null, version=null, "
                        "lastChangedAt=null, typeName=null}"));
  ASSERT_EQ(MetadataRecord("id-1", false).toString(),
            std::string("MetadataRecord{id='id-1', deleted=false, version=null, "
                        "lastChangedAt=null, typeName=null}"));
}

TEST(to_string_distinguishes_type_name) {
  MetadataRecord post("id-1", true, 3, T, "Post");
  MetadataRecord comment("id-1", true, 3, T, "Comment");
  ASSERT_TRUE(post == comment);
  ASSERT_TRUE(post.toString() != comment.toString());
}

TEST(with_helpers_return_new_records) {
  MetadataRecord v1("id-1", false, 1, T, "Post");
  MetadataRecord v2 = v1.withVersion(2).withLastChangedAt(Timestamp(1700000060));
  ASSERT_TRUE(v1.version() == 1);
  ASSERT_TRUE(v1.lastChangedAt() == T);
  ASSERT_TRUE(v2.version() == 2);
  ASSERT_EQ(v2.lastChangedAt()->secondsSinceEpoch(), 1700000060);
  ASSERT_EQ(v2.identifier(), v1.identifier());
  ASSERT_TRUE(v2.typeName() == std::string("Post"));

  MetadataRecord tomb = v2.withDeleted(true);
  ASSERT_TRUE(tomb.isDeleted() == true);
  ASSERT_TRUE(v2.isDeleted() == false);

  ASSERT_EQ(v1.withTypeName(std::string("Comment")), v1);
  ASSERT_FALSE(v1.withTypeName(std::nullopt).typeName().has_value());
}

TEST(timestamp_from_time_point_truncates) {
  using namespace std::chrono;
  auto tp = system_clock::time_point(seconds(1700000000)) + milliseconds(999);
  ASSERT_EQ(Timestamp(tp), T);
  ASSERT_TRUE(Timestamp(tp).toTimePoint() == system_clock::time_point(seconds(1700000000)));
  auto before = system_clock::time_point(seconds(-10)) + milliseconds(500);
  ASSERT_EQ(Timestamp(before).secondsSinceEpoch(), -10);
  ASSERT_TRUE(Timestamp(1) < Timestamp(2));
}

TEST(timestamp_now_is_current) {
  const auto a = std::chrono::duration_cast<std::chrono::seconds>(
      std::chrono::system_clock::now().time_since_epoch()).count();
  const auto n = Timestamp::now().secondsSinceEpoch();
  ASSERT_TRUE(n >= a && n <= a + 5);
}

int main() {
  std::cout << "Running MetadataRecord tests..." << std::endl << std::endl;

  RUN_TEST(construct_with_only_id);
  RUN_TEST(construct_with_all_fields);
  RUN_TEST(known_false_differs_from_unknown);
  RUN_TEST(empty_or_null_id_rejected);
  RUN_TEST(any_non_empty_id_accepted);
  RUN_TEST(malformed_values_not_validated);
  RUN_TEST(equality_ignores_type_name);
  RUN_TEST(equality_covers_other_fields);
  RUN_TEST(equality_is_an_equivalence);
  RUN_TEST(equal_records_share_hash_bucket);
  RUN_TEST(to_string_renders_all_fields);
  RUN_TEST(to_string_renders_absent_as_null);
  RUN_TEST(to_string_distinguishes_type_name);
  RUN_TEST(with_helpers_return_new_records);
  RUN_TEST(timestamp_from_time_point_truncates);
  RUN_TEST(timestamp_now_is_current);

  std::cout << std::endl << "All tests passed!" << std::endl;
  return 0;
}
