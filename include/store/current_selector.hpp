#pragma once

#include <string>
#include <vector>
#include "query/filter.hpp"
#include "store/connection.hpp"
#include "store/version_store.hpp"

namespace vstore {
namespace store {

// Picks the live version of every lineage: the version with the greatest
// (upload date, id) per filename. Derived from the store on every call.
class CurrentVersionSelector {
public:
  explicit CurrentVersionSelector(Connection& connection) : connection_(connection) {}

  // Current version per filename in the container among versions matching
  // filter, most recently uploaded lineage first
  std::vector<FileVersion> select(const std::string& container, const query::Filter& filter = {});

  // Current version of one lineage, throws errors::NotFound when it has none
  FileVersion select_one(const std::string& container, const std::string& filename);

  // Restricts filter to one container
  static query::Filter in_container(const std::string& container, const query::Filter& filter = {});

private:
  Connection& connection_;
};

} // namespace store
} // namespace vstore
