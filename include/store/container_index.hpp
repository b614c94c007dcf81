#pragma once

#include <boost/asio/thread_pool.hpp>
#include <istream>
#include <memory>
#include <string>
#include <vector>
#include "store/current_selector.hpp"
#include "store/version_store.hpp"

namespace vstore {
namespace store {

// One file of a multi-file upload, already split out by the calling layer
struct UploadSource {
  std::string filename;
  std::string mime_type;
  std::shared_ptr<std::istream> data;
  gridfs::Metadata metadata;
};

// Container and lineage operations built on the version store. A container
// is only the set of versions carrying its name.
class ContainerIndex {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ContainerIndex(VersionStore& versions);
  ~ContainerIndex();


  // ---- CONTAINERS ----
  // Distinct container names in ascending order
  std::vector<std::string> list_containers();
  // Returns the distinct filename count under old_name before the rename
  CountResult rename_container(const std::string& old_name, const std::string& new_name);
  DeleteResult delete_container(const std::string& name);


  // ---- CURRENT FILES ----
  std::vector<FileVersion> list_current_files(const std::string& container, const query::Filter& filter = {});
  CountResult count_current_files(const std::string& container, const query::Filter& filter = {});
  // Current version of a filename, throws errors::NotFound
  FileVersion get_current_file(const std::string& container, const std::string& filename);
  // Deletes every version of the filename
  DeleteResult delete_file(const std::string& container, const std::string& filename);


  // ---- UPLOADS ----
  std::vector<FileVersion> upload_files(const std::string& container, const std::vector<UploadSource>& sources);
  // Uploads, then prunes every other version of the uploaded filenames. The two
  // phases are not atomic: a failure in between leaves old versions behind.
  std::vector<FileVersion> replace_files(const std::string& container, const std::vector<UploadSource>& sources);


  // ---- VERSIONS ----
  std::vector<FileVersion> list_versions(const std::string& container, const std::string& filename,
                                         const query::Filter& filter = {});
  CountResult count_versions(const std::string& container, const std::string& filename,
                             const query::Filter& filter = {});
  // Throws errors::InvalidIdentifier for a malformed id, errors::NotFound when absent
  FileVersion get_version(const std::string& container, const std::string& filename, const std::string& version_id);
  FileVersion update_version(const std::string& container, const std::string& filename,
                             const std::string& version_id, const gridfs::Metadata& metadata);
  DeleteResult delete_version(const std::string& container, const std::string& filename,
                              const std::string& version_id);


  CurrentVersionSelector& selector() { return selector_; }

private:
  // ---- PARAMETERS ----
  VersionStore& versions_;
  CurrentVersionSelector selector_;
  boost::asio::thread_pool prune_pool_;

  static query::Filter lineage(const std::string& container, const std::string& filename,
                               const query::Filter& filter = {});
};

} // namespace store
} // namespace vstore
