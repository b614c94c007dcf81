#include "query/translator.hpp"
#include "errors/storage_error.hpp"
#include <boost/log/trivial.hpp>

namespace vstore::query {

namespace {

using gridfs::FieldPath;
using gridfs::Value;

gridfs::CompareOp to_native(Op op) {
    switch (op) {
        case Op::EQ: return gridfs::CompareOp::EQ;
        case Op::NEQ: return gridfs::CompareOp::NE;
        case Op::GT: return gridfs::CompareOp::GT;
        case Op::GTE: return gridfs::CompareOp::GTE;
        case Op::LT: return gridfs::CompareOp::LT;
        case Op::LTE: return gridfs::CompareOp::LTE;
        case Op::INQ: return gridfs::CompareOp::IN;
        case Op::NIN: return gridfs::CompareOp::NIN;
        default: return gridfs::CompareOp::EQ;
    }
}

Value convert_identifier(const Value& value) {
    if (std::holds_alternative<gridfs::ObjectId>(value)) {
        return value;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return gridfs::ObjectId::parse(*text);
    }
    throw errors::InvalidIdentifier(gridfs::value_to_string(value));
}

Value convert_timestamp(const std::string& field, const Value& value) {
    if (std::holds_alternative<gridfs::Timestamp>(value)) {
        return value;
    }
    if (const auto* millis = std::get_if<int64_t>(&value)) {
        return gridfs::timestamp_from_millis(*millis);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        if (auto ts = gridfs::parse_timestamp(*text)) {
            return *ts;
        }
    }
    throw errors::InvalidFilter(field + " expects a date, got '" + gridfs::value_to_string(value) + "'");
}

Value convert_integer(const std::string& field, const Value& value) {
    if (std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value)) {
        return value;
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        try {
            std::size_t used = 0;
            int64_t number = std::stoll(*text, &used);
            if (used == text->size()) {
                return number;
            }
        } catch (const std::logic_error&) {
            // falls through to the error below
        }
    }
    throw errors::InvalidFilter(field + " expects an integer, got '" + gridfs::value_to_string(value) + "'");
}

Value convert_operand(const Filter& filter, const FieldPath& path, const Value& value) {
    switch (path.kind) {
        case FieldPath::Kind::ID:
            return convert_identifier(value);
        case FieldPath::Kind::UPLOAD_DATE:
            return convert_timestamp(filter.field(), value);
        case FieldPath::Kind::LENGTH:
        case FieldPath::Kind::CHUNK_SIZE:
            return convert_integer(filter.field(), value);
        default:
            return value;
    }
}

} // namespace

gridfs::FieldPath translate_field(const std::string& name) {
    auto path = FieldPath::parse(name, false);
    if (!path) {
        throw errors::InvalidFilter("empty field name");
    }
    return *path;
}

gridfs::Predicate translate(const Filter& filter) {
    switch (filter.kind()) {
        case Filter::Kind::NONE:
            return gridfs::Predicate::match_all();

        case Filter::Kind::CONDITION: {
            FieldPath path = translate_field(filter.field());
            std::vector<Value> operands;
            operands.reserve(filter.values().size());
            for (const auto& value : filter.values()) {
                operands.push_back(convert_operand(filter, path, value));
            }
            return gridfs::Predicate::compare(path, to_native(filter.op()), std::move(operands));
        }

        case Filter::Kind::AND:
        case Filter::Kind::OR: {
            std::vector<gridfs::Predicate> children;
            for (const auto& child : filter.children()) {
                // Empty members of a conjunction add no constraint
                if (child.empty() && filter.kind() == Filter::Kind::AND) {
                    continue;
                }
                children.push_back(translate(child));
            }
            if (filter.kind() == Filter::Kind::AND) {
                if (children.empty()) {
                    return gridfs::Predicate::match_all();
                }
                if (children.size() == 1) {
                    return children.front();
                }
                return gridfs::Predicate::all_of(std::move(children));
            }
            return gridfs::Predicate::any_of(std::move(children));
        }
    }

    BOOST_LOG_TRIVIAL(error) << "Query translator: Unhandled filter kind";
    throw errors::InvalidFilter("unsupported filter");
}

} // namespace vstore::query
