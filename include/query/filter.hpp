#ifndef VSTORE_QUERY_FILTER_HPP
#define VSTORE_QUERY_FILTER_HPP

#include <string>
#include <vector>
#include "gridfs/document.hpp"

namespace vstore::query {

// Comparison operators of the public filter language
enum class Op {
    EQ,
    NEQ,
    GT,
    GTE,
    LT,
    LTE,
    INQ,
    NIN
};

// Parses eq|neq|gt|gte|lt|lte|inq|nin
bool parse_op(const std::string& name, Op& op);

// Abstract filter over public field names, independent of the store's native form
class Filter {
public:
    enum class Kind {
        NONE,
        CONDITION,
        AND,
        OR
    };

    // An empty filter matches every record
    Filter() = default;

    static Filter none() { return Filter(); }
    static Filter condition(std::string field, Op op, std::vector<gridfs::Value> values);
    static Filter eq(std::string field, gridfs::Value value);
    static Filter neq(std::string field, gridfs::Value value);
    static Filter all_of(std::vector<Filter> children);
    static Filter any_of(std::vector<Filter> children);

    Kind kind() const { return kind_; }
    bool empty() const { return kind_ == Kind::NONE; }
    const std::string& field() const { return field_; }
    Op op() const { return op_; }
    const std::vector<gridfs::Value>& values() const { return values_; }
    const std::vector<Filter>& children() const { return children_; }

private:
    Kind kind_ = Kind::NONE;
    std::string field_;
    Op op_ = Op::EQ;
    std::vector<gridfs::Value> values_;
    std::vector<Filter> children_;
};

} // namespace vstore::query

#endif // VSTORE_QUERY_FILTER_HPP
