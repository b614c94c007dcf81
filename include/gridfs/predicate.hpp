#ifndef VSTORE_GRIDFS_PREDICATE_HPP
#define VSTORE_GRIDFS_PREDICATE_HPP

#include <optional>
#include <string>
#include <vector>
#include "gridfs/document.hpp"

namespace vstore::gridfs {

enum class CompareOp {
  EQ,
  NE,
  GT,
  GTE,
  LT,
  LTE,
  IN,
  NIN
};

const char* compare_op_to_string(CompareOp op);

// Native match expression evaluated by the chunk store against file documents
class Predicate {
public:
  enum class Kind {
    MATCH_ALL,
    COMPARE,
    AND,
    OR
  };

  // ---- CONSTRUCTION ----
  Predicate() = default;
  static Predicate match_all();
  static Predicate compare(FieldPath field, CompareOp op, std::vector<Value> operands);
  static Predicate eq(FieldPath field, Value value);
  static Predicate all_of(std::vector<Predicate> children);
  static Predicate any_of(std::vector<Predicate> children);


  // ---- EVALUATION ----
  bool matches(const FileDocument& document) const;


  // ---- GETTERS ----
  Kind kind() const { return kind_; }
  const FieldPath& field() const { return field_; }
  CompareOp op() const { return op_; }
  const std::vector<Value>& operands() const { return operands_; }
  const std::vector<Predicate>& children() const { return children_; }

  // Debug rendering in a Mongo-like shape
  std::string to_string() const;

private:
  Kind kind_ = Kind::MATCH_ALL;
  FieldPath field_;
  CompareOp op_ = CompareOp::EQ;
  std::vector<Value> operands_;
  std::vector<Predicate> children_;

  bool matches_comparison(const FileDocument& document) const;
};

struct SortSpec {
  FieldPath field = FieldPath::upload_date();
  bool descending = true;
};

// Aggregation stages applied after the match stage, in order: sort, group-first
struct QueryOptions {
  std::optional<SortSpec> sort;
  // Keep only the first document (after sorting) of each distinct field value
  std::optional<FieldPath> group_first_by;
  // Restrict the result to ids, skipping the rest of the document
  bool ids_only = false;
};

} // namespace vstore::gridfs

#endif // VSTORE_GRIDFS_PREDICATE_HPP
