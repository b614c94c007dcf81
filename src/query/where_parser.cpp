#include "query/where_parser.hpp"
#include "errors/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <limits>

namespace vstore::query {

using Json = nlohmann::ordered_json;

namespace {

gridfs::Value leaf_value(const Json& node) {
    switch (node.type()) {
        case Json::value_t::null: return gridfs::Value{};
        case Json::value_t::boolean: return node.get<bool>();
        case Json::value_t::number_integer: return node.get<int64_t>();
        case Json::value_t::number_unsigned:
            if (node.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                throw errors::InvalidFilter("integer operand out of range: " + node.dump());
            }
            return node.get<int64_t>();
        case Json::value_t::number_float: return node.get<double>();
        case Json::value_t::string: return node.get<std::string>();
        default: throw errors::InvalidFilter("expected a scalar operand");
    }
}

Filter combine(std::vector<Filter> parts) {
    if (parts.empty()) {
        return Filter::none();
    }
    if (parts.size() == 1) {
        return std::move(parts.front());
    }
    return Filter::all_of(std::move(parts));
}

Filter parse_object(const Json& node);

Filter parse_group(const std::string& name, const Json& node) {
    if (!node.is_array()) {
        throw errors::InvalidFilter("'" + name + "' expects an array of conditions");
    }
    std::vector<Filter> children;
    for (const auto& child : node) {
        children.push_back(parse_object(child));
    }
    return name == "and" ? Filter::all_of(std::move(children)) : Filter::any_of(std::move(children));
}

Filter parse_field(const std::string& field, const Json& node) {
    if (node.is_array()) {
        throw errors::InvalidFilter("field '" + field + "' cannot be compared to an array");
    }
    if (!node.is_object()) {
        return Filter::eq(field, leaf_value(node));
    }

    std::vector<Filter> conditions;
    for (const auto& [name, operand] : node.items()) {
        Op op;
        if (!parse_op(name, op)) {
            throw errors::InvalidFilter("unknown operator '" + name + "' on field '" + field + "'");
        }

        std::vector<gridfs::Value> values;
        if (op == Op::INQ || op == Op::NIN) {
            if (!operand.is_array()) {
                throw errors::InvalidFilter("'" + name + "' expects an array");
            }
            for (const auto& item : operand) {
                values.push_back(leaf_value(item));
            }
        } else {
            values.push_back(leaf_value(operand));
        }
        conditions.push_back(Filter::condition(field, op, std::move(values)));
    }
    return combine(std::move(conditions));
}

Filter parse_object(const Json& node) {
    if (!node.is_object()) {
        throw errors::InvalidFilter("expected an object");
    }
    std::vector<Filter> parts;
    for (const auto& [key, child] : node.items()) {
        if (key == "and" || key == "or") {
            parts.push_back(parse_group(key, child));
        } else {
            parts.push_back(parse_field(key, child));
        }
    }
    return combine(std::move(parts));
}

} // namespace

Filter parse_where(const std::string& json) {
    if (std::all_of(json.begin(), json.end(), [](unsigned char c) { return std::isspace(c); })) {
        return Filter::none();
    }

    Json root;
    try {
        root = Json::parse(json);
    } catch (const Json::parse_error& e) {
        BOOST_LOG_TRIVIAL(debug) << "Where parser: Rejecting malformed JSON: " << e.what();
        throw errors::InvalidFilter(e.what());
    }
    return parse_object(root);
}

} // namespace vstore::query
