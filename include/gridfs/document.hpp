#ifndef VSTORE_GRIDFS_DOCUMENT_HPP
#define VSTORE_GRIDFS_DOCUMENT_HPP

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include "gridfs/object_id.hpp"

namespace vstore::gridfs {

// Millisecond precision wall clock time used for upload dates
using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

Timestamp timestamp_from_millis(int64_t millis);
int64_t timestamp_to_millis(Timestamp ts);
// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T10:00:00.000Z
std::string format_timestamp(Timestamp ts);
// Accepts YYYY-MM-DDTHH:MM:SS[.mmm][Z]; returns nullopt when malformed
std::optional<Timestamp> parse_timestamp(const std::string& text);

using Value = std::variant<std::monostate, bool, int64_t, double, std::string, ObjectId, Timestamp>;

// Renders a value the way it appears in entry names and shell output
std::string value_to_string(const Value& value);
// Numeric kinds compare across int64/double, other kinds only with themselves
bool values_equal(const Value& lhs, const Value& rhs);
// Returns -1/0/1, or nullopt when the values have no order
std::optional<int> compare_values(const Value& lhs, const Value& rhs);

// Ordered free-form metadata
using Metadata = std::map<std::string, Value>;

// Overlay keys overwrite base keys; container is forced afterwards
Metadata merge_metadata(const Metadata& base, const Metadata& overlay, const std::string& container);

// Fields addressable in predicates, sorts, groupings and name patterns
struct FieldPath {
  enum class Kind {
    ID,
    FILENAME,
    CONTENT_TYPE,
    LENGTH,
    CHUNK_SIZE,
    UPLOAD_DATE,
    SHA256,
    METADATA
  };

  Kind kind = Kind::ID;
  std::string key;  // metadata key for Kind::METADATA

  static FieldPath id() { return {Kind::ID, ""}; }
  static FieldPath filename() { return {Kind::FILENAME, ""}; }
  static FieldPath upload_date() { return {Kind::UPLOAD_DATE, ""}; }
  static FieldPath metadata(const std::string& key) { return {Kind::METADATA, key}; }
  static FieldPath container() { return metadata("container"); }

  // Resolves public field names; strict rejects names that are not known fields
  static std::optional<FieldPath> parse(const std::string& name, bool strict);

  std::string name() const;

  bool operator==(const FieldPath& other) const { return kind == other.kind && key == other.key; }
};

// One metadata record of the files collection
struct FileDocument {
  ObjectId id;
  std::string filename;
  std::string content_type;
  uint64_t length = 0;
  uint32_t chunk_size = 0;
  Timestamp upload_date{};
  std::string sha256;
  Metadata metadata;

  std::string container() const;
  // Returns nullopt when a metadata key is absent
  std::optional<Value> get(const FieldPath& field) const;
};

} // namespace vstore::gridfs

#endif // VSTORE_GRIDFS_DOCUMENT_HPP
