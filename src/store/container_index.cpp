#include "store/container_index.hpp"
#include "errors/storage_error.hpp"
#include "query/translator.hpp"
#include "utils/async.hpp"
#include <boost/log/trivial.hpp>
#include <future>
#include <map>

namespace vstore {
namespace store {

using query::Filter;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ContainerIndex::ContainerIndex(VersionStore& versions)
  : versions_(versions)
  , selector_(versions.connection())
  , prune_pool_(2) {}

ContainerIndex::~ContainerIndex() {
  prune_pool_.join();
}


//==============================================
// CONTAINERS
//==============================================

std::vector<std::string> ContainerIndex::list_containers() {
  auto values = versions_.connection().store().distinct(gridfs::FieldPath::container(),
                                                        gridfs::Predicate::match_all());
  std::vector<std::string> containers;
  containers.reserve(values.size());
  for (const auto& value : values) {
    containers.push_back(gridfs::value_to_string(value));
  }
  return containers;
}

CountResult ContainerIndex::rename_container(const std::string& old_name, const std::string& new_name) {
  BOOST_LOG_TRIVIAL(info) << "Container index: Renaming container " << old_name << " to " << new_name;

  Filter where = Filter::eq("container", old_name);
  CountResult files = versions_.count_files(where);
  std::size_t modified = versions_.connection().store().set_field(
    query::translate(where), gridfs::FieldPath::container(), new_name);

  BOOST_LOG_TRIVIAL(info) << "Container index: Moved " << modified << " versions of "
                          << files.count << " files to " << new_name;
  return files;
}

DeleteResult ContainerIndex::delete_container(const std::string& name) {
  BOOST_LOG_TRIVIAL(info) << "Container index: Deleting container " << name;
  return versions_.delete_by_filter(Filter::eq("container", name), true);
}


//==============================================
// CURRENT FILES
//==============================================

std::vector<FileVersion> ContainerIndex::list_current_files(const std::string& container, const Filter& filter) {
  return selector_.select(container, filter);
}

CountResult ContainerIndex::count_current_files(const std::string& container, const Filter& filter) {
  return versions_.count_files(CurrentVersionSelector::in_container(container, filter));
}

FileVersion ContainerIndex::get_current_file(const std::string& container, const std::string& filename) {
  return selector_.select_one(container, filename);
}

DeleteResult ContainerIndex::delete_file(const std::string& container, const std::string& filename) {
  return versions_.delete_by_filter(lineage(container, filename), true);
}


//==============================================
// UPLOADS
//==============================================

std::vector<FileVersion> ContainerIndex::upload_files(const std::string& container,
                                                      const std::vector<UploadSource>& sources) {
  std::vector<FileVersion> uploaded;
  uploaded.reserve(sources.size());
  for (const auto& source : sources) {
    if (!source.data) {
      throw std::invalid_argument("Container index: Upload source without data: " + source.filename);
    }
    uploaded.push_back(versions_.upload(container, *source.data, source.filename,
                                        source.mime_type, source.metadata));
  }
  return uploaded;
}

std::vector<FileVersion> ContainerIndex::replace_files(const std::string& container,
                                                       const std::vector<UploadSource>& sources) {
  std::vector<FileVersion> uploaded = upload_files(container, sources);

  // New ids per filename, so uploads sharing a name in one batch survive each other
  std::map<std::string, std::vector<gridfs::Value>> keep;
  for (const auto& version : uploaded) {
    keep[version.filename].push_back(version.id);
  }

  std::vector<std::future<DeleteResult>> prunes;
  prunes.reserve(keep.size());
  for (const auto& [filename, ids] : keep) {
    Filter stale = lineage(container, filename, Filter::condition("_id", query::Op::NIN, ids));
    prunes.push_back(utils::post_task(prune_pool_, [this, stale] {
      return versions_.delete_by_filter(stale);
    }));
  }

  std::size_t pruned = 0;
  for (auto& prune : prunes) {
    pruned += prune.get().versions_deleted;
  }
  BOOST_LOG_TRIVIAL(info) << "Container index: Replaced " << keep.size() << " files in " << container
                          << ", pruned " << pruned << " old versions";
  return uploaded;
}


//==============================================
// VERSIONS
//==============================================

std::vector<FileVersion> ContainerIndex::list_versions(const std::string& container, const std::string& filename,
                                                       const Filter& filter) {
  return versions_.find(lineage(container, filename, filter));
}

CountResult ContainerIndex::count_versions(const std::string& container, const std::string& filename,
                                           const Filter& filter) {
  return versions_.count_versions(lineage(container, filename, filter));
}

FileVersion ContainerIndex::get_version(const std::string& container, const std::string& filename,
                                        const std::string& version_id) {
  return versions_.find_one(lineage(container, filename, Filter::eq("_id", version_id)));
}

FileVersion ContainerIndex::update_version(const std::string& container, const std::string& filename,
                                           const std::string& version_id, const gridfs::Metadata& metadata) {
  FileVersion version = get_version(container, filename, version_id);
  return versions_.update_metadata(version.id, metadata, container);
}

DeleteResult ContainerIndex::delete_version(const std::string& container, const std::string& filename,
                                            const std::string& version_id) {
  return versions_.delete_by_filter(lineage(container, filename, Filter::eq("_id", version_id)));
}

Filter ContainerIndex::lineage(const std::string& container, const std::string& filename, const Filter& filter) {
  return Filter::all_of({Filter::eq("container", container), Filter::eq("filename", filename), filter});
}

} // namespace store
} // namespace vstore
