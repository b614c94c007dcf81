#include <gtest/gtest.h>
#include "errors/storage_error.hpp"
#include "gridfs/document.hpp"
#include "gridfs/predicate.hpp"

using namespace vstore::gridfs;

namespace {

FileDocument make_document(const std::string& filename, const std::string& container, int64_t upload_millis) {
  FileDocument document;
  document.id = ObjectId::generate(static_cast<uint32_t>(upload_millis / 1000));
  document.filename = filename;
  document.content_type = "text/plain";
  document.length = 42;
  document.chunk_size = 255 * 1024;
  document.upload_date = timestamp_from_millis(upload_millis);
  document.metadata["container"] = container;
  document.metadata["filename"] = filename;
  return document;
}

} // namespace

//==============================================
// TIMESTAMPS
//==============================================

TEST(TimestampTest, FormatsIsoWithMilliseconds) {
  EXPECT_EQ(format_timestamp(timestamp_from_millis(0)), "1970-01-01T00:00:00.000Z");
  EXPECT_EQ(format_timestamp(timestamp_from_millis(1714557600123)), "2024-05-01T10:00:00.123Z");
}

TEST(TimestampTest, ParsesIsoAndEpochMillis) {
  auto iso = parse_timestamp("2024-05-01T10:00:00.123Z");
  ASSERT_TRUE(iso.has_value());
  EXPECT_EQ(timestamp_to_millis(*iso), 1714557600123);

  auto no_zone = parse_timestamp("2024-05-01T10:00:00");
  ASSERT_TRUE(no_zone.has_value());
  EXPECT_EQ(timestamp_to_millis(*no_zone), 1714557600000);

  auto millis = parse_timestamp("1714557600123");
  ASSERT_TRUE(millis.has_value());
  EXPECT_EQ(timestamp_to_millis(*millis), 1714557600123);
}

TEST(TimestampTest, RejectsMalformedText) {
  EXPECT_FALSE(parse_timestamp("").has_value());
  EXPECT_FALSE(parse_timestamp("yesterday").has_value());
  EXPECT_FALSE(parse_timestamp("2024-05-01").has_value());
  EXPECT_FALSE(parse_timestamp("2024-13-45T99:00:00").has_value());
}

//==============================================
// VALUES
//==============================================

TEST(ValueTest, NumbersCompareAcrossKinds) {
  EXPECT_TRUE(values_equal(Value(int64_t{3}), Value(3.0)));
  EXPECT_EQ(compare_values(Value(int64_t{2}), Value(2.5)), -1);
  EXPECT_EQ(compare_values(Value(std::string("b")), Value(std::string("a"))), 1);
}

TEST(ValueTest, DifferentKindsHaveNoOrder) {
  EXPECT_FALSE(compare_values(Value(std::string("3")), Value(int64_t{3})).has_value());
  EXPECT_FALSE(values_equal(Value(std::string("3")), Value(int64_t{3})));
  EXPECT_TRUE(values_equal(Value{}, Value{}));
}

TEST(ValueTest, RendersAsText) {
  ObjectId id = ObjectId::parse("65a1b2c3d4e5f60718293a4b");
  EXPECT_EQ(value_to_string(Value(id)), "65a1b2c3d4e5f60718293a4b");
  EXPECT_EQ(value_to_string(Value(true)), "true");
  EXPECT_EQ(value_to_string(Value(int64_t{-7})), "-7");
  EXPECT_EQ(value_to_string(Value{}), "");
  EXPECT_EQ(value_to_string(Value(timestamp_from_millis(0))), "1970-01-01T00:00:00.000Z");
}

TEST(ValueTest, MergeOverwritesAndForcesContainer) {
  Metadata base = {{"container", std::string("docs")}, {"author", std::string("ann")}, {"rev", int64_t{1}}};
  Metadata overlay = {{"rev", int64_t{2}}, {"tag", std::string("x")}, {"container", std::string("evil")}};

  Metadata merged = merge_metadata(base, overlay, "docs");
  EXPECT_EQ(std::get<std::string>(merged["container"]), "docs");
  EXPECT_EQ(std::get<std::string>(merged["author"]), "ann");
  EXPECT_EQ(std::get<int64_t>(merged["rev"]), 2);
  EXPECT_EQ(std::get<std::string>(merged["tag"]), "x");
}

//==============================================
// FIELD PATHS
//==============================================

TEST(FieldPathTest, ResolvesPublicNames) {
  EXPECT_EQ(FieldPath::parse("id", false)->kind, FieldPath::Kind::ID);
  EXPECT_EQ(FieldPath::parse("_id", true)->kind, FieldPath::Kind::ID);
  EXPECT_EQ(FieldPath::parse("uploadedAt", true)->kind, FieldPath::Kind::UPLOAD_DATE);
  EXPECT_EQ(*FieldPath::parse("container", true), FieldPath::container());
  EXPECT_EQ(*FieldPath::parse("metadata.container", true), FieldPath::container());
  EXPECT_EQ(FieldPath::parse("metadata.author", true)->key, "author");
}

TEST(FieldPathTest, UnknownNamesFollowStrictness) {
  EXPECT_FALSE(FieldPath::parse("author", true).has_value());
  auto lenient = FieldPath::parse("author", false);
  ASSERT_TRUE(lenient.has_value());
  EXPECT_EQ(lenient->name(), "metadata.author");
  EXPECT_FALSE(FieldPath::parse("", false).has_value());
}

TEST(FieldPathTest, DocumentGetReturnsNulloptForMissingMetadata) {
  FileDocument document = make_document("a.txt", "docs", 1000);
  EXPECT_EQ(document.container(), "docs");
  EXPECT_FALSE(document.get(FieldPath::metadata("missing")).has_value());
  EXPECT_EQ(std::get<int64_t>(*document.get(FieldPath{FieldPath::Kind::LENGTH, ""})), 42);
}

//==============================================
// PREDICATES
//==============================================

TEST(PredicateTest, MatchAllAndEquality) {
  FileDocument document = make_document("a.txt", "docs", 1000);
  EXPECT_TRUE(Predicate::match_all().matches(document));
  EXPECT_TRUE(Predicate::eq(FieldPath::container(), std::string("docs")).matches(document));
  EXPECT_FALSE(Predicate::eq(FieldPath::container(), std::string("other")).matches(document));
  EXPECT_TRUE(Predicate::eq(FieldPath::id(), document.id).matches(document));
}

TEST(PredicateTest, OrderingOperators) {
  FileDocument document = make_document("a.txt", "docs", 5000);
  FieldPath length{FieldPath::Kind::LENGTH, ""};
  EXPECT_TRUE(Predicate::compare(length, CompareOp::GT, {int64_t{41}}).matches(document));
  EXPECT_FALSE(Predicate::compare(length, CompareOp::GT, {int64_t{42}}).matches(document));
  EXPECT_TRUE(Predicate::compare(length, CompareOp::LTE, {int64_t{42}}).matches(document));
  EXPECT_TRUE(Predicate::compare(FieldPath::upload_date(), CompareOp::GTE,
                                 {timestamp_from_millis(5000)}).matches(document));
  // A string never orders against a number
  EXPECT_FALSE(Predicate::compare(length, CompareOp::LT, {std::string("100")}).matches(document));
}

TEST(PredicateTest, MembershipAndAbsentFields) {
  FileDocument document = make_document("a.txt", "docs", 1000);
  ObjectId other = ObjectId::generate(1);
  EXPECT_TRUE(Predicate::compare(FieldPath::id(), CompareOp::IN, {other, document.id}).matches(document));
  EXPECT_FALSE(Predicate::compare(FieldPath::id(), CompareOp::NIN, {other, document.id}).matches(document));
  EXPECT_TRUE(Predicate::compare(FieldPath::id(), CompareOp::NIN, {other}).matches(document));

  // Absent metadata behaves like null
  EXPECT_FALSE(Predicate::eq(FieldPath::metadata("tag"), std::string("x")).matches(document));
  EXPECT_TRUE(Predicate::compare(FieldPath::metadata("tag"), CompareOp::NE, {std::string("x")}).matches(document));
  EXPECT_TRUE(Predicate::eq(FieldPath::metadata("tag"), Value{}).matches(document));
}

TEST(PredicateTest, LogicalCombinations) {
  FileDocument document = make_document("a.txt", "docs", 1000);
  Predicate in_docs = Predicate::eq(FieldPath::container(), std::string("docs"));
  Predicate is_b = Predicate::eq(FieldPath::filename(), std::string("b.txt"));

  EXPECT_FALSE(Predicate::all_of({in_docs, is_b}).matches(document));
  EXPECT_TRUE(Predicate::any_of({in_docs, is_b}).matches(document));
  EXPECT_TRUE(Predicate::all_of({}).matches(document));
  EXPECT_FALSE(Predicate::any_of({}).matches(document));
  EXPECT_EQ(in_docs.to_string(), "{metadata.container: {$eq: docs}}");
}

//==============================================
// ERRORS
//==============================================

TEST(StorageErrorTest, KindsMapToStatuses) {
  using namespace vstore::errors;
  EXPECT_EQ(error_kind_to_status(ErrorKind::NOT_FOUND), 404);
  EXPECT_EQ(error_kind_to_status(ErrorKind::INVALID_IDENTIFIER), 400);
  EXPECT_EQ(error_kind_to_status(ErrorKind::INVALID_FILTER), 400);
  EXPECT_EQ(error_kind_to_status(ErrorKind::EMPTY_BUNDLE), 404);
  EXPECT_EQ(error_kind_to_status(ErrorKind::STORAGE_UNAVAILABLE), 503);
  EXPECT_EQ(error_kind_to_status(ErrorKind::BUNDLE_ABORTED), 499);
  EXPECT_STREQ(error_kind_to_string(ErrorKind::EMPTY_BUNDLE), "Empty bundle");

  EmptyBundle empty("No files in container.");
  EXPECT_STREQ(empty.what(), "No files in container.");
  EXPECT_EQ(empty.status(), 404);
}
