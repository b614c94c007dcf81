#ifndef VSTORE_QUERY_WHERE_PARSER_HPP
#define VSTORE_QUERY_WHERE_PARSER_HPP

#include <string>
#include "query/filter.hpp"

namespace vstore::query {

// Parses a JSON "where" object:
//   {"filename": "a.txt"}                       equality
//   {"length": {"gt": 10, "lte": 100}}          operators, AND-ed
//   {"_id": {"inq": ["...", "..."]}}            membership
//   {"and": [{...}, {...}]}, {"or": [...]}      logical groups
// Sibling keys are AND-ed in source order. Operands keep their JSON type; the
// translator converts them for typed fields. Throws errors::InvalidFilter when malformed.
Filter parse_where(const std::string& json);

} // namespace vstore::query

#endif // VSTORE_QUERY_WHERE_PARSER_HPP
