#pragma once

#include <boost/asio/thread_pool.hpp>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "gridfs/document.hpp"
#include "query/filter.hpp"
#include "store/connection.hpp"

namespace vstore {
namespace store {

// One uploaded binary and its metadata record
using FileVersion = gridfs::FileDocument;

struct CountResult {
  std::size_t count = 0;
};

struct DeleteResult {
  std::size_t versions_deleted = 0;
  // Distinct filenames among the deleted rows, only when requested
  std::optional<std::size_t> files_deleted;
};

// CRUD and listing over individual file versions
class VersionStore {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit VersionStore(Connection& connection);
  ~VersionStore();


  // ---- QUERIES ----
  // All matches, most recent upload first (ties: higher id first)
  std::vector<FileVersion> find(const query::Filter& filter);
  // Most recent match, throws errors::NotFound when nothing matches
  FileVersion find_one(const query::Filter& filter);
  // Number of distinct filenames among the matches
  CountResult count_files(const query::Filter& filter);
  // Number of matching rows
  CountResult count_versions(const query::Filter& filter);


  // ---- DELETION ----
  // Resolves the filter to ids, then deletes them with delete_by_ids
  DeleteResult delete_by_filter(const query::Filter& filter, bool count_files = false);
  // Deletes metadata and chunks concurrently; the metadata count is reported
  CountResult delete_by_ids(const std::vector<gridfs::ObjectId>& ids);


  // ---- WRITES ----
  FileVersion upload(const std::string& container, std::istream& data, const std::string& filename,
                     const std::string& mime_type, const gridfs::Metadata& custom_metadata = {});
  // Merges overlay into the stored metadata and forces the container
  FileVersion update_metadata(const gridfs::ObjectId& id, const gridfs::Metadata& overlay,
                              const std::string& container);


  Connection& connection() { return connection_; }

private:
  // ---- PARAMETERS ----
  Connection& connection_;
  // Carries the paired metadata/chunk deletions
  boost::asio::thread_pool delete_pool_;
};

} // namespace store
} // namespace vstore
