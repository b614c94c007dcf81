#include "store/current_selector.hpp"
#include "errors/storage_error.hpp"
#include "query/translator.hpp"
#include <boost/log/trivial.hpp>

namespace vstore {
namespace store {

query::Filter CurrentVersionSelector::in_container(const std::string& container, const query::Filter& filter) {
  return query::Filter::all_of({query::Filter::eq("container", container), filter});
}

std::vector<FileVersion> CurrentVersionSelector::select(const std::string& container, const query::Filter& filter) {
  gridfs::QueryOptions options;
  options.sort = gridfs::SortSpec{gridfs::FieldPath::upload_date(), true};
  options.group_first_by = gridfs::FieldPath::filename();

  auto current = connection_.store().query(query::translate(in_container(container, filter)), options);
  BOOST_LOG_TRIVIAL(debug) << "Current selector: " << current.size() << " current files in " << container;
  return current;
}

FileVersion CurrentVersionSelector::select_one(const std::string& container, const std::string& filename) {
  auto current = select(container, query::Filter::eq("filename", filename));
  if (current.empty()) {
    throw errors::NotFound("File not found.");
  }
  return current.front();
}

} // namespace store
} // namespace vstore
