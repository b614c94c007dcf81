#ifndef VSTORE_QUERY_TRANSLATOR_HPP
#define VSTORE_QUERY_TRANSLATOR_HPP

#include "gridfs/predicate.hpp"
#include "query/filter.hpp"

namespace vstore::query {

// Converts an abstract filter into the chunk store's native predicate.
// Operands of the id field are converted to ObjectId (errors::InvalidIdentifier
// when malformed); operands of date and size fields are converted from text
// (errors::InvalidFilter when malformed). An empty filter matches everything.
gridfs::Predicate translate(const Filter& filter);

// Resolves one public field name to its native path
gridfs::FieldPath translate_field(const std::string& name);

} // namespace vstore::query

#endif // VSTORE_QUERY_TRANSLATOR_HPP
