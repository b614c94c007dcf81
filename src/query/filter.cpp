#include "query/filter.hpp"

namespace vstore::query {

bool parse_op(const std::string& name, Op& op) {
    if (name == "eq") { op = Op::EQ; return true; }
    if (name == "neq") { op = Op::NEQ; return true; }
    if (name == "gt") { op = Op::GT; return true; }
    if (name == "gte") { op = Op::GTE; return true; }
    if (name == "lt") { op = Op::LT; return true; }
    if (name == "lte") { op = Op::LTE; return true; }
    if (name == "inq") { op = Op::INQ; return true; }
    if (name == "nin") { op = Op::NIN; return true; }
    return false;
}

Filter Filter::condition(std::string field, Op op, std::vector<gridfs::Value> values) {
    Filter filter;
    filter.kind_ = Kind::CONDITION;
    filter.field_ = std::move(field);
    filter.op_ = op;
    filter.values_ = std::move(values);
    return filter;
}

Filter Filter::eq(std::string field, gridfs::Value value) {
    return condition(std::move(field), Op::EQ, {std::move(value)});
}

Filter Filter::neq(std::string field, gridfs::Value value) {
    return condition(std::move(field), Op::NEQ, {std::move(value)});
}

Filter Filter::all_of(std::vector<Filter> children) {
    Filter filter;
    filter.kind_ = Kind::AND;
    filter.children_ = std::move(children);
    return filter;
}

Filter Filter::any_of(std::vector<Filter> children) {
    Filter filter;
    filter.kind_ = Kind::OR;
    filter.children_ = std::move(children);
    return filter;
}

} // namespace vstore::query
