#include "gridfs/predicate.hpp"
#include <sstream>

namespace vstore::gridfs {

const char* compare_op_to_string(CompareOp op) {
  switch (op) {
    case CompareOp::EQ: return "$eq";
    case CompareOp::NE: return "$ne";
    case CompareOp::GT: return "$gt";
    case CompareOp::GTE: return "$gte";
    case CompareOp::LT: return "$lt";
    case CompareOp::LTE: return "$lte";
    case CompareOp::IN: return "$in";
    case CompareOp::NIN: return "$nin";
    default: return "$unknown";
  }
}

//==============================================
// CONSTRUCTION
//==============================================

Predicate Predicate::match_all() {
  return Predicate();
}

Predicate Predicate::compare(FieldPath field, CompareOp op, std::vector<Value> operands) {
  Predicate predicate;
  predicate.kind_ = Kind::COMPARE;
  predicate.field_ = std::move(field);
  predicate.op_ = op;
  predicate.operands_ = std::move(operands);
  return predicate;
}

Predicate Predicate::eq(FieldPath field, Value value) {
  return compare(std::move(field), CompareOp::EQ, {std::move(value)});
}

Predicate Predicate::all_of(std::vector<Predicate> children) {
  Predicate predicate;
  predicate.kind_ = Kind::AND;
  predicate.children_ = std::move(children);
  return predicate;
}

Predicate Predicate::any_of(std::vector<Predicate> children) {
  Predicate predicate;
  predicate.kind_ = Kind::OR;
  predicate.children_ = std::move(children);
  return predicate;
}

//==============================================
// EVALUATION
//==============================================

bool Predicate::matches(const FileDocument& document) const {
  switch (kind_) {
    case Kind::MATCH_ALL:
      return true;
    case Kind::COMPARE:
      return matches_comparison(document);
    case Kind::AND:
      for (const auto& child : children_) {
        if (!child.matches(document)) {
          return false;
        }
      }
      return true;
    case Kind::OR:
      for (const auto& child : children_) {
        if (child.matches(document)) {
          return true;
        }
      }
      return false;
    default:
      return false;
  }
}

bool Predicate::matches_comparison(const FileDocument& document) const {
  // Absent fields behave like null: they equal nothing but null and order against nothing
  Value actual = document.get(field_).value_or(Value{});

  auto contains = [&]() {
    for (const auto& operand : operands_) {
      if (values_equal(actual, operand)) {
        return true;
      }
    }
    return false;
  };

  if (op_ == CompareOp::IN) {
    return contains();
  }
  if (op_ == CompareOp::NIN) {
    return !contains();
  }
  if (operands_.empty()) {
    return false;
  }

  const Value& expected = operands_.front();
  if (op_ == CompareOp::EQ) {
    return values_equal(actual, expected);
  }
  if (op_ == CompareOp::NE) {
    return !values_equal(actual, expected);
  }

  auto order = compare_values(actual, expected);
  if (!order) {
    return false;
  }
  switch (op_) {
    case CompareOp::GT: return *order > 0;
    case CompareOp::GTE: return *order >= 0;
    case CompareOp::LT: return *order < 0;
    case CompareOp::LTE: return *order <= 0;
    default: return false;
  }
}

std::string Predicate::to_string() const {
  std::ostringstream out;
  switch (kind_) {
    case Kind::MATCH_ALL:
      out << "{}";
      break;
    case Kind::COMPARE:
      out << "{" << field_.name() << ": {" << compare_op_to_string(op_) << ": ";
      if (operands_.size() == 1 && op_ != CompareOp::IN && op_ != CompareOp::NIN) {
        out << value_to_string(operands_.front());
      } else {
        out << "[";
        for (std::size_t i = 0; i < operands_.size(); ++i) {
          out << (i ? ", " : "") << value_to_string(operands_[i]);
        }
        out << "]";
      }
      out << "}}";
      break;
    case Kind::AND:
    case Kind::OR:
      out << "{" << (kind_ == Kind::AND ? "$and" : "$or") << ": [";
      for (std::size_t i = 0; i < children_.size(); ++i) {
        out << (i ? ", " : "") << children_[i].to_string();
      }
      out << "]}";
      break;
  }
  return out.str();
}

} // namespace vstore::gridfs
